#pragma once

// =========================================================================================================
// Compiler detection
// =========================================================================================================
// Conditionally defined: RR_COMPILER_MSVC, RR_COMPILER_CLANG, RR_COMPILER_GCC, RR_COMPILER_MINGW, RR_COMPILER_POSIX

#if defined(_MSC_VER)
#define RR_COMPILER_MSVC
#elif defined(__clang__)
#define RR_COMPILER_CLANG
#elif defined(__GNUC__)
#define RR_COMPILER_GCC
#elif defined(__MINGW32__) || defined(__MINGW64__)
#define RR_COMPILER_MINGW
#else
#error "Unknown compiler"
#endif

#if defined(RR_COMPILER_CLANG) || defined(RR_COMPILER_GCC) || defined(RR_COMPILER_MINGW)
#define RR_COMPILER_POSIX
#endif

// =========================================================================================================
// Operating system detection
// =========================================================================================================
// Conditionally defined: RR_OS_WINDOWS, RR_OS_LINUX, RR_OS_APPLE, RR_OS_BSD

#if defined(WIN32) || defined(_WIN32) || defined(__WIN32)
#define RR_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__) || defined(macintosh)
#define RR_OS_APPLE
#elif defined(__linux__) || defined(linux)
#define RR_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define RR_OS_BSD
#else
#error "Unknown platform"
#endif

// =========================================================================================================
// Compilation modes
// =========================================================================================================
// From CMake: RR_DEBUG, RR_RELEASE, RR_RELWITHDEBINFO, RR_ENABLE_ASSERT_IN_RELEASE
// Always defined: RR_ASSERT_ENABLED (0 or 1)
//
// Internal assertions (RR_ASSERT*) are stripped in release builds unless RR_ENABLE_ASSERT_IN_RELEASE is set.
// Region contract checks (RR_CHECKF) are never stripped: the per-instance check flag is their only switch.

#if defined(RR_RELEASE) && !defined(RR_ENABLE_ASSERT_IN_RELEASE)
#define RR_ASSERT_ENABLED 0
#else
#define RR_ASSERT_ENABLED 1
#endif

// =========================================================================================================
// Public macros
// =========================================================================================================

// RR_FORCE_INLINE - Force function to be inlined
#define RR_FORCE_INLINE RR_IMPL_FORCE_INLINE

// RR_COLD_FUNC - Mark function as rarely executed (error paths, assertions)
// Usage: RR_COLD_FUNC void handle_error() { ... }
#define RR_COLD_FUNC RR_IMPL_COLD_FUNC

// RR_UNUSED(expr) - Suppress unused variable/expression warnings (forces semicolon)
// Usage: RR_UNUSED(result);
// Note: Expression is NOT evaluated, only its type is checked (sizeof is unevaluated context)
#define RR_UNUSED(expr) (void)(sizeof((expr)))


// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(RR_COMPILER_MSVC)

#define RR_IMPL_FORCE_INLINE __forceinline
#define RR_IMPL_COLD_FUNC

#elif defined(RR_COMPILER_POSIX)

// additional 'inline' is required on gcc and makes no difference on clang
#define RR_IMPL_FORCE_INLINE __attribute__((always_inline)) inline
#define RR_IMPL_COLD_FUNC __attribute__((cold))

#else
#error "Unknown compiler"
#endif
