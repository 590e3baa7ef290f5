#pragma once

#include <cstddef>
#include <cstdint>


namespace rr
{

//
// Primitives
//

// Explicitly-sized primitive types
// Region accessors are defined in terms of these so the width of every read/write is visible at the call site.

// signed integers
using i8 = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

// unsigned integers
using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

// floating point
using f32 = float;
using f64 = double;

// generic bytes
using byte = std::byte;

// signed size type
// Offsets, lengths and sizes are signed i64 throughout.
// A negative offset or length is a detectable contract violation instead of a silent wrap to a huge value,
// which is exactly what the bounds checks need to see.
// Raw addresses are the only unsigned 64-bit quantities and are handled as u64 when doing overflow math.
using isize = i64;

// pointer
using nullptr_t = std::nullptr_t;

//
// Faults
//

enum class fault : u8;

//
// Memory primitives
//

struct memory_primitive;
struct bulk_transfer;

//
// Views
//

template <class T>
struct span;

//
// Regions
//

struct region;
struct allocation;
struct raw_allocation;
struct sub_region;

} // namespace rr
