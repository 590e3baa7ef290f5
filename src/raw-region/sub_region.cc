#include "sub_region.hh"

#include <raw-region/assertf.hh>
#include <raw-region/bounds.hh>

rr::sub_region::sub_region(region& parent, isize offset, isize length)
  : _parent(&parent), _offset(offset), _size(length), _parent_epoch(parent.release_epoch())
{
    parent.check_bounds(offset, length);
}

bool rr::sub_region::is_in_bounds(isize offset, isize length) const
{
    // short-circuit keeps _offset + offset from overflowing
    return rr::is_in_bounds(_size, offset, length) && _parent->is_in_bounds(_offset + offset, length);
}

void rr::sub_region::check_bounds(isize offset, isize length) const
{
    if (!is_checking_bounds())
        return;

    RR_CHECKF(rr::fault::already_released, _parent->release_epoch() == _parent_epoch,
              "parent region was released or replaced since the view was created: epoch {} -> {}", _parent_epoch,
              _parent->release_epoch());

    // parent first: a released parent reports already_released, like a direct access
    // the view range covers the address-overflow check of every sub-range
    _parent->check_bounds(_offset, _size);
    rr::check_bounds(_size, offset, length);
}

rr::byte* rr::sub_region::direct_address(isize offset, isize length) const
{
    check_bounds(offset, length);
    return _parent->direct_address(_offset + offset, length);
}

void rr::sub_region::impl_load(isize offset, byte* out, isize width) const
{
    _parent->impl_load(_offset + offset, out, width);
}

void rr::sub_region::impl_store(isize offset, byte const* in, isize width)
{
    _parent->impl_store(_offset + offset, in, width);
}

void rr::sub_region::impl_get_bytes(isize src_offset, span<byte> target) const
{
    _parent->impl_get_bytes(_offset + src_offset, target);
}

void rr::sub_region::impl_put_bytes(isize target_offset, span<byte const> source)
{
    _parent->impl_put_bytes(_offset + target_offset, source);
}
