#pragma once

#include <raw-region/region.hh>

/// Non-owning view of [offset, offset + size) of a parent region.
///
/// Every operation is translated to parent offset + offset and forwarded to the parent, so a sub_region of a
/// raw allocation is directly addressable and a sub_region of a generic region is not.
/// Sub-regions of sub-regions nest.
///
/// The range is validated eagerly against the parent on construction (rr::fault::out_of_bounds).
/// Liveness follows the parent's release_epoch(), captured on construction. Once the owning allocation
/// is released, or its handle takes over another block (reallocate, move assignment), every access through
/// the view faults with rr::fault::already_released, even if the handle is live again.
///
/// The parent must outlive the view. This is not detected: a view must not be retained past its parent's
/// destruction (release is fine, it faults).
///
/// Cheap to copy, it's a view.
struct rr::sub_region final : rr::region
{
    // lifecycle
public:
    /// View of parent[offset, offset + length).
    /// Validated through parent.check_bounds, i.e. not at all for unchecked parents.
    sub_region(region& parent, isize offset, isize length);

    sub_region(sub_region const&) = default;
    sub_region(sub_region&&) = default;
    sub_region& operator=(sub_region const&) = default;
    sub_region& operator=(sub_region&&) = default;

    // queries
public:
    [[nodiscard]] region& parent() const { return *_parent; }

    /// Offset of this view inside its parent.
    [[nodiscard]] isize offset() const { return _offset; }

    [[nodiscard]] isize size() const override { return _size; }
    [[nodiscard]] bool is_checking_bounds() const override { return _parent->is_checking_bounds(); }

    [[nodiscard]] bool is_in_bounds(isize offset, isize length) const override;
    void check_bounds(isize offset, isize length) const override;
    [[nodiscard]] byte* direct_address(isize offset, isize length) const override;
    /// The parent's current epoch, so nested views notice a release of the root allocation.
    [[nodiscard]] u64 release_epoch() const override { return _parent->release_epoch(); }

    // implementation hooks
protected:
    void impl_load(isize offset, byte* out, isize width) const override;
    void impl_store(isize offset, byte const* in, isize width) override;
    void impl_get_bytes(isize src_offset, span<byte> target) const override;
    void impl_put_bytes(isize target_offset, span<byte const> source) override;

    // members
private:
    region* _parent = nullptr;
    isize _offset = 0;
    isize _size = 0;
    u64 _parent_epoch = 0;
};
