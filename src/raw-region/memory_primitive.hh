#pragma once

#include <raw-region/fwd.hh>
#include <raw-region/span.hh>
#include <raw-region/utility.hh>

// rr::memory_primitive and rr::bulk_transfer are the two external collaborators of every raw allocation.
//
// memory_primitive owns the allocate / free / reallocate step: where blocks come from and where they go.
// bulk_transfer owns the copy between a raw block and a caller-owned buffer (get_bytes / put_bytes).
//
// Both are POD structs of function pointers plus userdata: no virtual dispatch, no non-trivial constructors,
// static-init safe. A raw allocation stores pointers to the ones it was created with; nullptr means the
// system defaults below. This keeps raw_allocation a single concrete type while still letting callers plug in
// arenas, tracking allocators, or transfers that go through pinned / staging buffers.
//
// Scalar access, fills and raw-to-raw copies use the host primitives std::memcpy / std::memset / std::memmove
// directly; they are not part of the pluggable surface.

namespace rr
{
/// Default memory primitive used when raw_allocation was created without a custom one.
/// Backed by std::malloc / std::free / std::realloc and stored in the data segment,
/// so the pointer is valid even during static initialization in other translation units.
extern rr::memory_primitive const* const default_memory_primitive;

/// Default bulk transfer used when raw_allocation was created without a custom one.
/// A plain std::memcpy between the raw block and the buffer.
extern rr::bulk_transfer const* const default_bulk_transfer;
} // namespace rr

/// Allocate / free / reallocate primitive for raw blocks.
struct rr::memory_primitive
{
    /// Allocate `bytes` bytes, bytes > 0.
    /// Never returns nullptr: exhaustion is reported as rr::fault::out_of_memory.
    rr::function_ptr<rr::byte*(isize bytes, void* userdata)> allocate_bytes = nullptr;

    /// Free a block previously returned by allocate_bytes or reallocate_bytes.
    /// Freeing the same block twice is whatever the underlying allocator does with it.
    rr::function_ptr<void(rr::byte* p, void* userdata)> free_bytes = nullptr;

    /// Resize a block to `new_bytes` bytes, new_bytes > 0, possibly moving it.
    /// The first min(old, new) bytes are preserved. After a successful call `p` must no longer be used.
    /// Never returns nullptr: exhaustion is reported as rr::fault::out_of_memory.
    rr::function_ptr<rr::byte*(rr::byte* p, isize new_bytes, void* userdata)> reallocate_bytes = nullptr;

    /// User-defined data for custom primitives. Can be nullptr for stateless ones.
    void* userdata = nullptr;
};

/// Bulk copy between a raw block and a caller-owned buffer.
/// Ranges have been validated by the region before either function is called.
struct rr::bulk_transfer
{
    /// Copy target.size() bytes starting at `raw_src` into `target`.
    rr::function_ptr<void(rr::byte const* raw_src, rr::span<rr::byte> target, void* userdata)> copy_to_buffer = nullptr;

    /// Copy all of `source` to the raw block starting at `raw_target`.
    rr::function_ptr<void(rr::byte* raw_target, rr::span<rr::byte const> source, void* userdata)> copy_from_buffer
        = nullptr;

    /// User-defined data for custom transfers. Can be nullptr for stateless ones.
    void* userdata = nullptr;
};
