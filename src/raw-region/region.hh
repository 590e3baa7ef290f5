#pragma once

#include <raw-region/fwd.hh>
#include <raw-region/span.hh>

#include <concepts>
#include <vector>

// rr::region is the capability shared by every view of raw memory: typed get/put at a byte offset,
// sub-regioning, bulk transfer to and from caller-owned buffers, fill, copy and compare.
//
// It is implemented by the owning rr::raw_allocation and by the non-owning rr::sub_region, and can be
// implemented by callers for memory that is not directly addressable (device memory, paged storage, ...).
//
// The public API is non-virtual. Every public operation first runs the region's own check_bounds, which
// implements the shared policy from <raw-region/bounds.hh> (released -> out of bounds -> address overflow),
// and only then calls one of the protected impl_ hooks. The hooks therefore only ever see validated ranges.
//
// Copy and fill take a fast path through direct_address() when both sides are directly addressable and fall
// back to byte-by-byte access through get/put otherwise. No type introspection is involved: direct_address()
// is the capability query.
//
// Offsets and lengths are isize (signed) and measured in bytes.
// Scalars are read and written in host byte order without alignment requirements.

namespace rr
{
/// Scalar types a region can read and write directly.
/// i8 (byte), i16 (short), char16_t (16-bit code unit), i32 (int), i64 (long), f32 (float), f64 (double).
template <class T>
concept region_scalar = std::same_as<T, i8> || std::same_as<T, i16> || std::same_as<T, char16_t>
                     || std::same_as<T, i32> || std::same_as<T, i64> || std::same_as<T, f32> || std::same_as<T, f64>;
} // namespace rr

struct rr::region
{
    // queries
public:
    /// Size of the region in bytes.
    [[nodiscard]] virtual isize size() const = 0;

    /// False if this region (or the allocation it views) was created with bounds checking disabled.
    /// Unchecked regions skip all validation; misuse is undefined behavior.
    [[nodiscard]] virtual bool is_checking_bounds() const = 0;

    /// Non-faulting predicate: true iff [offset, offset + length) is a valid, non-overflowing range.
    /// Does not look at the check flag or at release state.
    [[nodiscard]] virtual bool is_in_bounds(isize offset, isize length) const = 0;

    /// Enforces the bounds policy for [offset, offset + length).
    /// Reports rr::fault::already_released, rr::fault::out_of_bounds or rr::fault::address_overflow.
    /// No-op if is_checking_bounds() is false.
    virtual void check_bounds(isize offset, isize length) const = 0;

    /// Capability query for the fast path.
    /// Directly addressable regions run check_bounds(offset, length) and return a pointer to the first byte
    /// of the range. The default returns nullptr: not addressable, use get/put.
    /// NOTE: returns a mutable pointer from a const region, mutability is the caller's responsibility.
    [[nodiscard]] virtual byte* direct_address(isize offset, isize length) const;

    /// Changes whenever the block behind this region is released or replaced by another one.
    /// Views capture it on creation and report rr::fault::already_released once it moved on.
    /// Regions without a lifecycle keep the default 0.
    [[nodiscard]] virtual u64 release_epoch() const;

    // typed access
public:
    template <region_scalar T>
    [[nodiscard]] T get(isize offset) const
    {
        check_bounds(offset, isize(sizeof(T)));
        T value{};
        impl_load(offset, reinterpret_cast<byte*>(&value), isize(sizeof(T))); // NOLINT
        return value;
    }

    template <region_scalar T>
    void put(isize offset, T value)
    {
        check_bounds(offset, isize(sizeof(T)));
        impl_store(offset, reinterpret_cast<byte const*>(&value), isize(sizeof(T))); // NOLINT
    }

    // sub-regions
public:
    /// View of [offset, size()). Requires at least one byte in view, i.e. offset < size().
    [[nodiscard]] sub_region get_region(isize offset) &;

    /// View of [offset, offset + length). Invalid ranges fault on creation.
    [[nodiscard]] sub_region get_region(isize offset, isize length) &;

    // a view of a temporary would dangle at the end of the full-expression
    sub_region get_region(isize offset) && = delete;
    sub_region get_region(isize offset, isize length) && = delete;

    // bulk transfer
public:
    /// Copies `length` bytes starting at src_offset into target[target_offset, target_offset + length).
    /// Validates this region's range, and the buffer range when checking is enabled.
    void get_bytes(isize src_offset, span<byte> target, isize target_offset, isize length) const;

    /// Fills all of target from src_offset on.
    void get_bytes(isize src_offset, span<byte> target) const;

    /// Returns a fresh copy of [src_offset, src_offset + length).
    [[nodiscard]] std::vector<byte> get_bytes(isize src_offset, isize length) const;

    /// Copies source[source_offset, source_offset + length) to this region starting at target_offset.
    /// Validates this region's range, and the buffer range when checking is enabled.
    void put_bytes(isize target_offset, span<byte const> source, isize source_offset, isize length);

    /// Copies all of source to this region starting at target_offset.
    void put_bytes(isize target_offset, span<byte const> source);

    // fill
public:
    /// Sets every byte of the region to value.
    void set_memory(byte value);

    /// Sets [offset, offset + length) to value.
    void set_memory(isize offset, isize length, byte value);

    // copy and compare
public:
    /// Raw copy of [offset, offset + length) to an address obtained by other means.
    /// Only the source side is validated.
    void copy_memory(isize offset, byte* raw_target, isize length) const;

    /// Copies target.size() bytes from src_offset into the start of target.
    void copy_memory(isize src_offset, region& target) const;

    /// Copies [src_offset, src_offset + length) to target[target_offset, target_offset + length).
    /// One memmove if both regions are directly addressable (overlap-safe), byte-by-byte otherwise.
    void copy_memory(isize src_offset, region& target, isize target_offset, isize length) const;

    /// Lexicographic unsigned-byte comparison: negative, zero, or positive.
    [[nodiscard]] int compare_memory(isize src_offset, region const& target, isize target_offset, isize length) const;

    // implementation hooks
    // all ranges are validated by the public API before a hook is called
protected:
    virtual void impl_load(isize offset, byte* out, isize width) const = 0;
    virtual void impl_store(isize offset, byte const* in, isize width) = 0;
    virtual void impl_get_bytes(isize src_offset, span<byte> target) const = 0;
    virtual void impl_put_bytes(isize target_offset, span<byte const> source) = 0;

    // sub_region forwards hooks to its parent
    friend struct rr::sub_region;

    // lifecycle
public:
    region() = default;
    virtual ~region() = default;

protected:
    // polymorphic base: copy/move only through concrete types
    region(region const&) = default;
    region(region&&) = default;
    region& operator=(region const&) = default;
    region& operator=(region&&) = default;
};
