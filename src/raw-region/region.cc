#include "region.hh"

#include <raw-region/assert.hh>
#include <raw-region/bounds.hh>
#include <raw-region/sub_region.hh>

#include <cstring>

rr::byte* rr::region::direct_address(isize offset, isize length) const
{
    RR_UNUSED(offset);
    RR_UNUSED(length);
    return nullptr;
}

rr::u64 rr::region::release_epoch() const
{
    return 0;
}

rr::sub_region rr::region::get_region(isize offset) &
{
    check_bounds(offset, 1);
    return rr::sub_region(*this, offset, size() - offset);
}

rr::sub_region rr::region::get_region(isize offset, isize length) &
{
    return rr::sub_region(*this, offset, length);
}

void rr::region::get_bytes(isize src_offset, span<byte> target, isize target_offset, isize length) const
{
    check_bounds(src_offset, length);
    if (is_checking_bounds())
        rr::check_bounds(target.size(), target_offset, length);

    impl_get_bytes(src_offset, span<byte>(target.data() + target_offset, length));
}

void rr::region::get_bytes(isize src_offset, span<byte> target) const
{
    get_bytes(src_offset, target, 0, target.size());
}

std::vector<rr::byte> rr::region::get_bytes(isize src_offset, isize length) const
{
    check_bounds(src_offset, length);
    RR_ASSERT(length >= 0, "get_bytes length must be non-negative");

    std::vector<byte> bytes(static_cast<std::size_t>(length));
    impl_get_bytes(src_offset, span<byte>(bytes));
    return bytes;
}

void rr::region::put_bytes(isize target_offset, span<byte const> source, isize source_offset, isize length)
{
    check_bounds(target_offset, length);
    if (is_checking_bounds())
        rr::check_bounds(source.size(), source_offset, length);

    impl_put_bytes(target_offset, span<byte const>(source.data() + source_offset, length));
}

void rr::region::put_bytes(isize target_offset, span<byte const> source)
{
    put_bytes(target_offset, source, 0, source.size());
}

void rr::region::set_memory(byte value)
{
    set_memory(0, size(), value);
}

void rr::region::set_memory(isize offset, isize length, byte value)
{
    if (auto* const p = direct_address(offset, length))
    {
        if (length > 0)
            std::memset(p, int(value), std::size_t(length));
        return;
    }

    check_bounds(offset, length);
    for (isize i = 0; i < length; ++i)
        impl_store(offset + i, &value, 1);
}

void rr::region::copy_memory(isize offset, byte* raw_target, isize length) const
{
    if (auto* const src = direct_address(offset, length))
    {
        if (length > 0)
            std::memmove(raw_target, src, std::size_t(length));
        return;
    }

    check_bounds(offset, length);
    for (isize i = 0; i < length; ++i)
        impl_load(offset + i, raw_target + i, 1);
}

void rr::region::copy_memory(isize src_offset, region& target) const
{
    copy_memory(src_offset, target, 0, target.size());
}

void rr::region::copy_memory(isize src_offset, region& target, isize target_offset, isize length) const
{
    auto* const src = direct_address(src_offset, length);
    auto* const dst = src != nullptr ? target.direct_address(target_offset, length) : nullptr;

    if (src != nullptr && dst != nullptr)
    {
        // both sides validated by direct_address
        if (length > 0)
            std::memmove(dst, src, std::size_t(length));
        return;
    }

    rr::copy_memory_byte_by_byte(*this, src_offset, target, target_offset, length);
}

int rr::region::compare_memory(isize src_offset, region const& target, isize target_offset, isize length) const
{
    return rr::compare_memory(*this, src_offset, target, target_offset, length);
}
