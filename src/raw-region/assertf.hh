#pragma once

#include <raw-region/assert.hh>

#include <format>
#include <string>

// =========================================================================================================
// RR_ASSERTF - Runtime assertion with formatted message
//
// The formatted version of RR_ASSERT, supporting std::format-style arguments.
// Reported with rr::fault::assertion and stripped together with RR_ASSERT.
//
// Usage:
//   RR_ASSERTF(size >= 0, "size must be non-negative, got {}", size);
//
#define RR_ASSERTF(cond, msg, ...) RR_IMPL_ASSERTF(cond, msg, ##__VA_ARGS__)

// =========================================================================================================
// RR_ASSERTF_ALWAYS - Always-active assertion with formatted message
//
#define RR_ASSERTF_ALWAYS(cond, msg, ...) RR_IMPL_ASSERTF_ALWAYS(cond, msg, ##__VA_ARGS__)

// =========================================================================================================
// RR_CHECKF - Region contract check with fault kind and formatted message
//
// Validates a caller-facing contract (bounds, liveness, address range, arguments) and reports a failure
// as the given rr::fault kind. Always active: whether a region checks at all is decided per instance
// by its check flag, never by the build configuration.
//
// Message arguments are only evaluated on failure.
//
// Usage:
//   RR_CHECKF(rr::fault::out_of_bounds, rr::is_in_bounds(size, offset, length),
//             "offset={}, length={}, size={}", offset, length, size);
//   RR_CHECKF(rr::fault::already_released, !released, "allocation has already been released");
//
#define RR_CHECKF(kind, cond, msg, ...) RR_IMPL_CHECKF(kind, cond, msg, ##__VA_ARGS__)


// =========================================================================================================
// Implementation details
// =========================================================================================================

#define RR_IMPL_CHECKF(kind, cond, msg, ...)                                                                     \
    do                                                                                                           \
    {                                                                                                            \
        if (!(cond)) [[unlikely]]                                                                                \
        {                                                                                                        \
            ::rr::impl::handle_assert_failure(kind, #cond, std::format(msg __VA_OPT__(, ) __VA_ARGS__).c_str(), \
                                              ::rr::source_location::current());                                 \
            RR_BREAK_AND_ABORT();                                                                                \
        }                                                                                                        \
    } while (false)

#define RR_IMPL_ASSERTF_ALWAYS(cond, msg, ...) RR_IMPL_CHECKF(::rr::fault::assertion, cond, msg, ##__VA_ARGS__)

#if RR_ASSERT_ENABLED

#define RR_IMPL_ASSERTF(cond, msg, ...) RR_IMPL_ASSERTF_ALWAYS(cond, msg, ##__VA_ARGS__)

#else

// stripped, but the format string is still checked to compile
#define RR_IMPL_ASSERTF(cond, msg, ...)                         \
    do                                                          \
    {                                                           \
        RR_UNUSED(cond);                                        \
        RR_UNUSED(std::format(msg __VA_OPT__(, ) __VA_ARGS__)); \
    } while (false)

#endif
