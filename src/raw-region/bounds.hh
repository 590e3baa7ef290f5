#pragma once

#include <raw-region/fwd.hh>

// =========================================================================================================
// Bounds and address-overflow policy shared by all regions
// =========================================================================================================
//
// Range predicates (pure, never fault):
//   is_in_bounds(size, offset, length)                - [offset, offset + length) lies within [0, size)
//   is_address_range_valid(address, offset, length)   - address + offset + length does not wrap 64 bits
//
// Range checks (report a fault on violation):
//   check_bounds(size, offset, length)                - rr::fault::out_of_bounds
//   check_address_range(address, offset, length)      - rr::fault::address_overflow
//
// Generic fallbacks for regions without direct addressing:
//   copy_memory_byte_by_byte(src, src_offset, target, target_offset, length)
//   compare_memory(src, src_offset, target, target_offset, length)
//
// Order of validation for every access of a checked region:
//   released? -> out of bounds? -> address overflow? -> touch memory
// Unchecked regions skip all of it.
//

namespace rr
{
/// True iff 0 <= offset, 0 <= length and offset + length <= size.
/// Evaluated without computing offset + length, so huge values cannot wrap into range.
[[nodiscard]] constexpr bool is_in_bounds(isize size, isize offset, isize length)
{
    return offset >= 0 && length >= 0 && offset <= size && length <= size - offset;
}

/// True iff address + offset + length does not wrap past the 64-bit address space.
/// Raw addresses are unsigned 64-bit quantities; a naive signed sum can wrap and still pass a size check.
/// Negative offset or length is never a valid address range.
[[nodiscard]] constexpr bool is_address_range_valid(u64 address, isize offset, isize length)
{
    if (offset < 0 || length < 0)
        return false;

    auto const start = address + u64(offset);
    if (start < address)
        return false;

    return start + u64(length) >= start;
}

/// Reports rr::fault::out_of_bounds with offset, length and size unless is_in_bounds(size, offset, length).
void check_bounds(isize size, isize offset, isize length);

/// Reports rr::fault::address_overflow unless is_address_range_valid(address, offset, length).
void check_address_range(u64 address, isize offset, isize length);

/// Copies `length` bytes one at a time through the generic region interface.
/// Both ranges are validated up front by their own regions.
/// NOTE: copies front to back; overlapping ranges of the same memory must go through direct addressing.
void copy_memory_byte_by_byte(region const& src, isize src_offset, region& target, isize target_offset, isize length);

/// Lexicographic comparison of two byte ranges, bytes compared as unsigned.
/// Returns a negative value, zero, or a positive value.
/// Both ranges are validated up front by their own regions.
[[nodiscard]] int compare_memory(region const& src, isize src_offset, region const& target, isize target_offset, isize length);
} // namespace rr
