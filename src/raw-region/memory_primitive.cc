#include "memory_primitive.hh"

#include <raw-region/assertf.hh>
#include <raw-region/macros.hh>

#include <cstdlib>
#include <cstring>

namespace
{
/// Static function implementations for the system primitive.
/// These ignore the userdata parameter as malloc/free/realloc are stateless.

rr::byte* system_allocate_bytes(rr::isize bytes, void* userdata)
{
    RR_UNUSED(userdata);
    RR_ASSERT(bytes > 0, "allocate_bytes requires a positive size");

    auto* const p = static_cast<rr::byte*>(std::malloc(std::size_t(bytes)));
    RR_CHECKF(rr::fault::out_of_memory, p != nullptr, "allocation failed: requested {} bytes", bytes);
    return p;
}

void system_free_bytes(rr::byte* p, void* userdata)
{
    RR_UNUSED(userdata);
    std::free(p);
}

rr::byte* system_reallocate_bytes(rr::byte* p, rr::isize new_bytes, void* userdata)
{
    RR_UNUSED(userdata);
    RR_ASSERT(new_bytes > 0, "reallocate_bytes requires a positive size");

    // on failure realloc leaves p untouched and owned by the caller
    auto* const new_p = static_cast<rr::byte*>(std::realloc(p, std::size_t(new_bytes)));
    RR_CHECKF(rr::fault::out_of_memory, new_p != nullptr, "reallocation failed: requested {} bytes", new_bytes);
    return new_p;
}

void system_copy_to_buffer(rr::byte const* raw_src, rr::span<rr::byte> target, void* userdata)
{
    RR_UNUSED(userdata);

    // memcpy with a null pointer is UB even for zero sizes
    if (target.empty())
        return;

    std::memcpy(target.data(), raw_src, std::size_t(target.size()));
}

void system_copy_from_buffer(rr::byte* raw_target, rr::span<rr::byte const> source, void* userdata)
{
    RR_UNUSED(userdata);

    if (source.empty())
        return;

    std::memcpy(raw_target, source.data(), std::size_t(source.size()));
}

/// System primitive instance stored in the data segment.
constinit rr::memory_primitive const system_memory_primitive = {
    .allocate_bytes = system_allocate_bytes,
    .free_bytes = system_free_bytes,
    .reallocate_bytes = system_reallocate_bytes,
    .userdata = nullptr,
};

/// System bulk transfer instance stored in the data segment.
constinit rr::bulk_transfer const system_bulk_transfer = {
    .copy_to_buffer = system_copy_to_buffer,
    .copy_from_buffer = system_copy_from_buffer,
    .userdata = nullptr,
};

} // namespace

constinit rr::memory_primitive const* const rr::default_memory_primitive = &system_memory_primitive;
constinit rr::bulk_transfer const* const rr::default_bulk_transfer = &system_bulk_transfer;
