#include "raw_allocation.hh"

#include <raw-region/assertf.hh>
#include <raw-region/bounds.hh>
#include <raw-region/utility.hh>

#include <cstring>
#include <format>

namespace
{
[[nodiscard]] rr::u64 address_value(rr::byte const* p)
{
    return reinterpret_cast<rr::u64>(p); // NOLINT
}
} // namespace

rr::raw_allocation rr::raw_allocation::create(isize size, bool checked, memory_primitive const* primitive, bulk_transfer const* transfer)
{
    RR_CHECKF(rr::fault::invalid_argument, size > 0, "invalid size: {}", size);

    auto const& res = primitive ? *primitive : *default_memory_primitive;
    auto* const address = res.allocate_bytes(size, res.userdata);
    RR_CHECKF(rr::fault::out_of_memory, address != nullptr, "allocation failed: requested {} bytes", size);
    return raw_allocation(address, size, checked, primitive, transfer);
}

rr::raw_allocation::raw_allocation(byte* address, isize size, bool checked, memory_primitive const* primitive, bulk_transfer const* transfer)
  : _address(address),
    _size(size),
    _checked(checked),
    _released(false),
    _custom_primitive(primitive),
    _custom_transfer(transfer)
{
    RR_CHECKF(rr::fault::invalid_argument, address != nullptr, "invalid address: {}", static_cast<void const*>(address));
    RR_CHECKF(rr::fault::invalid_argument, size > 0, "invalid size: {}", size);
    RR_CHECKF(rr::fault::address_overflow, rr::is_address_range_valid(address_value(address), 0, size),
              "address + size is greater than 64 bits: address={}, size={}", static_cast<void const*>(address), size);
}

rr::raw_allocation::raw_allocation(raw_allocation&& rhs) noexcept
  : allocation(rr::move(rhs)),
    _address(rr::exchange(rhs._address, nullptr)),
    _size(rr::exchange(rhs._size, 0)),
    _checked(rhs._checked), // rhs check mode stays
    _released(rr::exchange(rhs._released, true)),
    _custom_primitive(rhs._custom_primitive),
    _custom_transfer(rhs._custom_transfer)
{
    // views of rhs must not follow the block to its new owner
    ++rhs._release_epoch;
}

rr::raw_allocation& rr::raw_allocation::operator=(raw_allocation&& rhs) noexcept
{
    if (this != &rhs)
    {
        // Move rhs into temporary - this releases rhs via the move constructor
        auto rhs_tmp = rr::move(rhs);

        // Return the currently owned block
        if (!_released && _address != nullptr)
        {
            auto const& res = primitive();
            res.free_bytes(_address, res.userdata);
        }

        // Transfer ownership from tmp
        _address = rr::exchange(rhs_tmp._address, nullptr);
        _size = rr::exchange(rhs_tmp._size, 0);
        _checked = rhs_tmp._checked;
        _released = rr::exchange(rhs_tmp._released, true);
        _custom_primitive = rhs_tmp._custom_primitive;
        _custom_transfer = rhs_tmp._custom_transfer;

        // views of the previous block must not see the new one
        ++_release_epoch;
    }

    return *this;
}

rr::raw_allocation::~raw_allocation()
{
    // blocks released by free(), reallocate() or a move are not ours anymore
    if (!_released && _address != nullptr)
    {
        auto const& res = primitive();
        res.free_bytes(_address, res.userdata);
    }
}

void rr::raw_allocation::free()
{
    check_released();

    // unchecked: a second free goes straight to the primitive
    _released = true;
    ++_release_epoch;
    auto const& res = primitive();
    res.free_bytes(_address, res.userdata);
}

rr::raw_allocation rr::raw_allocation::reallocate(isize new_size) &&
{
    check_released();
    RR_CHECKF(rr::fault::invalid_argument, new_size >= 0, "size is negative: {}", new_size);

    // unchanged size: hand back the same live block
    if (new_size == _size)
        return rr::move(*this);

    // zero bytes: the result is the null allocation
    if (new_size == 0)
    {
        free();
        return raw_allocation();
    }

    auto const& res = primitive();
    auto* const new_address = res.reallocate_bytes(_address, new_size, res.userdata);
    RR_CHECKF(rr::fault::out_of_memory, new_address != nullptr, "reallocation failed: requested {} bytes", new_size);

    // this handle is released even if the address did not change: its size is stale
    _released = true;
    ++_release_epoch;

    return raw_allocation(new_address, new_size, _checked, _custom_primitive, _custom_transfer);
}

bool rr::raw_allocation::is_in_bounds(isize offset, isize length) const
{
    return rr::is_in_bounds(_size, offset, length) && rr::is_address_range_valid(address_value(_address), offset, length);
}

void rr::raw_allocation::check_bounds(isize offset, isize length) const
{
    if (!_checked)
        return;

    check_released();
    rr::check_bounds(_size, offset, length);
    rr::check_address_range(address_value(_address), offset, length);
}

rr::byte* rr::raw_allocation::direct_address(isize offset, isize length) const
{
    check_bounds(offset, length);
    return _address + offset;
}

std::string rr::raw_allocation::to_string() const
{
    return std::format("raw_allocation{{address={}, size={}{}}}", static_cast<void const*>(_address), _size,
                       _checked ? "" : ", CHECKS DISABLED");
}

void rr::raw_allocation::impl_load(isize offset, byte* out, isize width) const
{
    std::memcpy(out, _address + offset, std::size_t(width));
}

void rr::raw_allocation::impl_store(isize offset, byte const* in, isize width)
{
    std::memcpy(_address + offset, in, std::size_t(width));
}

void rr::raw_allocation::impl_get_bytes(isize src_offset, span<byte> target) const
{
    auto const& t = transfer();
    t.copy_to_buffer(_address + src_offset, target, t.userdata);
}

void rr::raw_allocation::impl_put_bytes(isize target_offset, span<byte const> source)
{
    auto const& t = transfer();
    t.copy_from_buffer(_address + target_offset, source, t.userdata);
}

void rr::raw_allocation::check_released() const
{
    if (_checked)
        RR_CHECKF(rr::fault::already_released, !_released, "raw allocation has already been released: {}", to_string());
}

rr::raw_allocation const& rr::null_allocation()
{
    static raw_allocation const null;
    return null;
}

std::size_t std::hash<rr::raw_allocation>::operator()(rr::raw_allocation const& alloc) const noexcept
{
    auto const address = reinterpret_cast<rr::u64>(alloc.address()); // NOLINT
    auto const size = rr::u64(alloc.size());

    auto result = address ^ (address >> 32);
    result = 31 * result + (size ^ (size >> 32));
    return std::size_t(result);
}
