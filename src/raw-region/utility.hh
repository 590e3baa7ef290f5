#pragma once

#include <raw-region/fwd.hh>
#include <raw-region/macros.hh>

// =========================================================================================================
// Utility functions for common operations
// =========================================================================================================
//
// Move semantics:
//   move(value)                 - cast value to rvalue reference for moving
//   forward<T>(value)           - perfect forwarding for template arguments
//   exchange(obj, new_val)      - replace obj with new_val and return old value
//
// Template metaprogramming:
//   always_false_t<T...>        - always false for static_assert with type parameters
//   function_ptr<Signature>     - convert function signature to function pointer type
//

namespace rr
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

/// Cast value to rvalue reference to enable move semantics
/// Usage:
///   auto grown = rr::move(alloc).reallocate(128);  // consume alloc
template <class T>
[[nodiscard]] RR_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

/// Perfect forwarding for template arguments
/// Preserves value category (lvalue/rvalue) when forwarding arguments
template <class T>
[[nodiscard]] RR_FORCE_INLINE constexpr T&& forward(T& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] RR_FORCE_INLINE constexpr T&& forward(T&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

/// Replace object with new value and return the old value
/// Usage:
///   auto* p = rr::exchange(rhs._address, nullptr);  // take the block, leave rhs empty
template <class T, class U = T>
[[nodiscard]] RR_FORCE_INLINE constexpr T exchange(T& obj, U&& new_val) // NOLINT
{
    T old_val = static_cast<T&&>(obj);
    obj = forward<U>(new_val);
    return old_val;
}

// =========================================================================================================
// Template metaprogramming
// =========================================================================================================

/// Always false, for static_assert in templates that must not be instantiated
template <class... T>
constexpr bool always_false_t = false;

namespace impl
{
template <class T>
struct function_ptr_t
{
    static_assert(always_false_t<T>, "function_ptr should only be used with function signatures");
};
template <class R, class... Args>
struct function_ptr_t<R(Args...)>
{
    using type = R (*)(Args...);
};
template <class R, class... Args>
struct function_ptr_t<R(Args...) noexcept>
{
    using type = R (*)(Args...) noexcept;
};
} // namespace impl

/// Type alias for readable function pointer types
/// Usage:
///   rr::function_ptr<rr::byte*(rr::isize, void*)>   -> rr::byte* (*)(rr::isize, void*)
///   rr::function_ptr<void() noexcept>             -> void (*)() noexcept
template <class T>
using function_ptr = typename impl::function_ptr_t<T>::type;

} // namespace rr
