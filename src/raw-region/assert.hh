#pragma once

// This is a very lean header with minimal dependencies - easy to include everywhere and low cost.
// For formatted assertions and region contract checks, use <raw-region/assertf.hh> instead.
#include <raw-region/fault.hh>
#include <raw-region/macros.hh>
#include <raw-region/source_location.hh>

// =========================================================================================================
// RR_ASSERT - Runtime assertion with string literal message
//
// Validates an internal invariant at runtime and triggers a debugger break + abort on failure.
// The failure is reported with rr::fault::assertion.
//
// When assertions are active:
//   Enabled unless RR_RELEASE is defined (and RR_ENABLE_ASSERT_IN_RELEASE is not).
//
// What assertions are for:
//   Invariants, preconditions and postconditions of the library's own code.
//
// What assertions are NOT for:
//   Region contract violations by callers (bounds, liveness, address overflow).
//   Those go through RR_CHECKF in <raw-region/assertf.hh> so they carry their fault kind and are never stripped.
//
// Important:
//   Assertions can be semantically equivalent to std::terminate().
//   A custom handler (see <raw-region/assert-handler.hh>) may throw to unwind instead.
//
// Usage:
//   RR_ASSERT(ptr != nullptr, "pointer must not be null");
//   RR_ASSERT(size >= 0, "size must be non-negative");
//
#define RR_ASSERT(cond, msg) RR_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// RR_ASSERT_ALWAYS - Always-active assertion
//
// Like RR_ASSERT but remains active in all build configurations, including release builds.
//
#define RR_ASSERT_ALWAYS(cond, msg) RR_IMPL_ASSERT_ALWAYS(cond, msg)

// =========================================================================================================
// RR_DEBUG_BREAK - Conditional debugger breakpoint
//
// Triggers a debugger break if a debugger is attached, otherwise does nothing.
//
#define RR_DEBUG_BREAK() RR_IMPL_DEBUG_BREAK()

// =========================================================================================================
// RR_BREAK_AND_ABORT - Debug break followed by program termination
//
// Used by all assertion and check macros after the handler returned.
// A handler that throws never reaches this point.
//
#define RR_BREAK_AND_ABORT() (RR_DEBUG_BREAK(), ::rr::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace rr::impl
{
// Called when an assertion or check fails
// Dispatches to the topmost handler, or prints diagnostic information to stderr
// Note: does not abort, caller must follow with RR_BREAK_AND_ABORT()
RR_COLD_FUNC void handle_assert_failure(rr::fault kind,
                                        char const* expression,
                                        char const* message,
                                        rr::source_location location);

// Checks if a debugger is currently attached to the process
// Platform-specific implementation (Windows: IsDebuggerPresent, Linux: /proc)
bool is_debugger_connected() noexcept;

// Terminates the program
// Wrapper around std::abort() to allow future customization
[[noreturn]] void perform_abort() noexcept;
} // namespace rr::impl

// Platform-specific debugger break implementation
// The debugger should break right in the assert macro, so this cannot hide in a function call

#ifdef RR_COMPILER_MSVC

// __debugbreak() terminates immediately without an attached debugger
#define RR_IMPL_DEBUG_BREAK() (::rr::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(RR_COMPILER_POSIX)

// we use a SIGTRAP to signal a trace/breakpoint
// NOTE: we don't want to pull in any posix header here, so we simply declare raise
//       SIGTRAP is 5 according to https://man7.org/linux/man-pages/man7/signal.7.html
extern "C" int raise(int) noexcept;
#define RR_IMPL_DEBUG_BREAK() (::rr::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define RR_IMPL_DEBUG_BREAK() void(0)

#endif

// RR_ASSERT_ALWAYS implementation - always enabled regardless of build configuration
#define RR_IMPL_ASSERT_ALWAYS(cond, msg)                                                                        \
    do                                                                                                          \
    {                                                                                                           \
        if (!(cond)) [[unlikely]]                                                                               \
        {                                                                                                       \
            ::rr::impl::handle_assert_failure(::rr::fault::assertion, #cond, msg, ::rr::source_location::current()); \
            RR_BREAK_AND_ABORT();                                                                               \
        }                                                                                                       \
    } while (false)

#if RR_ASSERT_ENABLED

#define RR_IMPL_ASSERT(cond, msg) RR_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// stripped, but the message is still checked to compile
#define RR_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        RR_UNUSED(cond);          \
        RR_UNUSED(msg);           \
    } while (false)

#endif
