#pragma once

#include <raw-region/fwd.hh>

/// Kind of a reported contract violation.
/// Every failed check names one of these so a handler can tell "you read past the end" apart from
/// "you used a freed block" without parsing the message.
enum class rr::fault : rr::u8
{
    /// internal invariant or precondition (RR_ASSERT family)
    assertion,

    /// null address, non-positive size, negative reallocation size
    invalid_argument,

    /// address + offset + length wraps past the 64-bit address space
    address_overflow,

    /// offset/length outside of a region's [0, size)
    out_of_bounds,

    /// access, free or reallocate on an allocation that was already released
    already_released,

    /// the raw memory primitive could not satisfy a request
    out_of_memory,
};

namespace rr
{
/// Human-readable name of a fault kind, e.g. "out of bounds"
[[nodiscard]] constexpr char const* to_string(fault kind)
{
    switch (kind)
    {
    case fault::assertion: return "assertion";
    case fault::invalid_argument: return "invalid argument";
    case fault::address_overflow: return "address overflow";
    case fault::out_of_bounds: return "out of bounds";
    case fault::already_released: return "already released";
    case fault::out_of_memory: return "out of memory";
    }
    return "unknown fault";
}
} // namespace rr
