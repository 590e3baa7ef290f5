#pragma once

#include <raw-region/allocation.hh>
#include <raw-region/memory_primitive.hh>
#include <raw-region/sub_region.hh>

#include <cstddef>
#include <functional>
#include <string>

// rr::raw_allocation is the concrete owner of a raw memory block.
//
// It wraps an (address, size) pair obtained from a rr::memory_primitive and adds:
// - bounds checking of every access against size, release state and 64-bit address overflow,
// - release tracking, so that stale handles fault instead of touching freed memory.
//
// Bounds checking is a per-instance constructor flag. Unchecked instances skip every check and turn misuse
// (out-of-range access, use after free, double free) into undefined behavior in exchange for speed.
// Checked and unchecked instances coexist freely.
//
// Lifecycle:
// - create(size) allocates through the primitive; the (address, size) constructor adopts an existing block.
// - free() releases explicitly; otherwise the destructor frees a block that was never released.
// - reallocate(new_size) consumes the handle:
//     new_size == size()  -> the same live block is handed back unchanged
//     new_size == 0       -> the block is freed and the null allocation is returned
//     otherwise           -> the primitive resizes (possibly moves) the block and a new owner is returned;
//                            the consumed handle is released even if the address did not change
// - move-only: a moved-from handle is a released null allocation that keeps its check mode,
//   so stale use still faults with rr::fault::already_released.
//
// Views belong to the handle and the block it held when they were created. Every release, reallocate
// and move (including the same-size reallocate, which moves the block to a new handle) retires them:
// they fault with rr::fault::already_released even after the handle is assigned a live block again.
//
// Identity is location: two raw allocations are equal (and hash equal) iff address and size are equal,
// regardless of check mode or release state.
//
// Usage:
//   auto alloc = rr::raw_allocation::create(64);
//   alloc.put<rr::i32>(0, 42);
//   auto header = alloc.get_region(0, 16);
//   alloc = rr::move(alloc).reallocate(128);   // header is retired, take a new view
//
// Not thread-safe: callers serialize access to an allocation and all of its views.
struct rr::raw_allocation final : rr::allocation
{
    // factories
public:
    /// Allocates `size` bytes through `primitive` (nullptr: rr::default_memory_primitive) and owns them.
    /// Reports rr::fault::invalid_argument for size <= 0.
    [[nodiscard]] static raw_allocation create(isize size,
                                               bool checked = true,
                                               memory_primitive const* primitive = nullptr,
                                               bulk_transfer const* transfer = nullptr);

    // lifecycle
public:
    /// The null allocation: no block, size 0, released.
    raw_allocation() = default;

    /// Adopts the block [address, address + size) obtained from `primitive`.
    /// Reports rr::fault::invalid_argument for a null address or size <= 0
    /// and rr::fault::address_overflow if address + size wraps past 64 bits.
    raw_allocation(byte* address,
                   isize size,
                   bool checked = true,
                   memory_primitive const* primitive = nullptr,
                   bulk_transfer const* transfer = nullptr);

    raw_allocation(raw_allocation const&) = delete;
    raw_allocation& operator=(raw_allocation const&) = delete;

    raw_allocation(raw_allocation&& rhs) noexcept;
    raw_allocation& operator=(raw_allocation&& rhs) noexcept;

    ~raw_allocation() override;

    void free() override;

    /// Resizes the block, consuming this handle. See the lifecycle notes above.
    /// Reports rr::fault::already_released on a released checked handle
    /// and rr::fault::invalid_argument for new_size < 0.
    [[nodiscard]] raw_allocation reallocate(isize new_size) &&;

    // queries
public:
    [[nodiscard]] byte* address() const override { return _address; }
    [[nodiscard]] isize size() const override { return _size; }
    [[nodiscard]] bool is_released() const override { return _released; }
    [[nodiscard]] bool is_checking_bounds() const override { return _checked; }

    [[nodiscard]] bool is_in_bounds(isize offset, isize length) const override;
    void check_bounds(isize offset, isize length) const override;
    [[nodiscard]] byte* direct_address(isize offset, isize length) const override;
    /// Bumped on free(), when reallocate() or a move takes the block away, and when move assignment
    /// replaces it.
    [[nodiscard]] u64 release_epoch() const override { return _release_epoch; }

    /// e.g. "raw_allocation{address=0x5581e0a0, size=64}", with ", CHECKS DISABLED" for unchecked instances
    [[nodiscard]] std::string to_string() const;

    /// Identity by location: address and size only.
    [[nodiscard]] bool operator==(raw_allocation const& rhs) const
    {
        return _address == rhs._address && _size == rhs._size;
    }

    // implementation hooks
protected:
    void impl_load(isize offset, byte* out, isize width) const override;
    void impl_store(isize offset, byte const* in, isize width) override;
    void impl_get_bytes(isize src_offset, span<byte> target) const override;
    void impl_put_bytes(isize target_offset, span<byte const> source) override;

    // helper
private:
    void check_released() const;

    [[nodiscard]] memory_primitive const& primitive() const
    {
        return _custom_primitive ? *_custom_primitive : *default_memory_primitive;
    }
    [[nodiscard]] bulk_transfer const& transfer() const
    {
        return _custom_transfer ? *_custom_transfer : *default_bulk_transfer;
    }

    // members
private:
    byte* _address = nullptr;
    isize _size = 0;
    bool _checked = true;
    bool _released = true;
    u64 _release_epoch = 0;
    memory_primitive const* _custom_primitive = nullptr;
    bulk_transfer const* _custom_transfer = nullptr;
};

namespace rr
{
/// The shared null allocation returned conceptually by reallocate(0): no block, size 0, released.
/// Every access on it faults with rr::fault::already_released.
[[nodiscard]] raw_allocation const& null_allocation();
} // namespace rr

/// Hash consistent with raw_allocation::operator==: address and size only.
template <>
struct std::hash<rr::raw_allocation>
{
    [[nodiscard]] std::size_t operator()(rr::raw_allocation const& alloc) const noexcept;
};
