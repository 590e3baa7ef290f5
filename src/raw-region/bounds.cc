#include "bounds.hh"

#include <raw-region/assertf.hh>
#include <raw-region/region.hh>

void rr::check_bounds(isize size, isize offset, isize length)
{
    RR_CHECKF(rr::fault::out_of_bounds, rr::is_in_bounds(size, offset, length),
              "offset={}, length={}, size={}", offset, length, size);
}

void rr::check_address_range(u64 address, isize offset, isize length)
{
    RR_CHECKF(rr::fault::address_overflow, rr::is_address_range_valid(address, offset, length),
              "address + offset + length is greater than 64 bits: address={:#x}, offset={}, length={}", address,
              offset, length);
}

void rr::copy_memory_byte_by_byte(region const& src, isize src_offset, region& target, isize target_offset, isize length)
{
    src.check_bounds(src_offset, length);
    target.check_bounds(target_offset, length);

    for (isize i = 0; i < length; ++i)
        target.put<i8>(target_offset + i, src.get<i8>(src_offset + i));
}

int rr::compare_memory(region const& src, isize src_offset, region const& target, isize target_offset, isize length)
{
    src.check_bounds(src_offset, length);
    target.check_bounds(target_offset, length);

    for (isize i = 0; i < length; ++i)
    {
        auto const a = u8(src.get<i8>(src_offset + i));
        auto const b = u8(target.get<i8>(target_offset + i));
        if (a != b)
            return a < b ? -1 : 1;
    }

    return 0;
}
