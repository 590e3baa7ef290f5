#pragma once

#include <raw-region/region.hh>

/// A region that owns a raw memory block and controls its lifecycle.
///
/// Ownership is explicit: the block is released exactly once, either by free() or when the owner
/// is destroyed without having been released. After release the owner keeps answering queries
/// (address(), size(), is_released()) but every access is a fault when bounds checking is enabled.
///
/// Views created through get_region() do not keep the block alive and must not be used past release.
struct rr::allocation : rr::region
{
    /// Base address of the owned block. nullptr for the null allocation.
    [[nodiscard]] virtual byte* address() const = 0;

    /// True once the block was freed, handed off by reallocate, or moved away.
    [[nodiscard]] virtual bool is_released() const = 0;

    /// Returns the block to the memory primitive.
    /// Reports rr::fault::already_released on a released checked allocation.
    virtual void free() = 0;
};
