#pragma once

#include <alloc-core/assert.hh>
#include <alloc-core/fwd.hh>

#include <type_traits>

// =========================================================================================================
// Utility functions for common operations
// =========================================================================================================
//
// Move semantics:
//   move(value)                 - cast value to rvalue reference for moving
//   forward<T>(value)           - perfect forwarding for template arguments
//   exchange(obj, new_val)      - replace obj with new_val and return old value
//
// Comparison:
//   max(a, b)                   - returns the larger of two values (requires operator<)
//   min(a, b)                   - returns the smaller of two values (requires operator<)
//
// Alignment (value or pointer):
//   is_power_of_two(value)           - check if value is a power of 2
//   align_up(value, alignment)       - increment to next aligned boundary (power of 2)
//   is_aligned(value, alignment)     - check if aligned at boundary (power of 2)
//
// Object storage:
//   placement_new                    - tag for placement new without including <new>
//   storage_for<T>                   - uninitialized, properly aligned storage for a single T
//
// Template metaprogramming:
//   always_false_t<T...>             - always false for static_assert with type parameters
//   function_ptr<Signature>          - convert function signature to function pointer type
//
// Scope utilities:
//   AC_DEFER { code }                - execute code at scope-exit (RAII cleanup)
//


namespace ac
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

/// Cast value to rvalue reference to enable move semantics
template <class T>
[[nodiscard]] AC_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

/// Perfect forwarding for template arguments
template <class T>
[[nodiscard]] AC_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] AC_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

/// Replace object with new value and return the old value
/// Usage:
///   auto* block = ac::exchange(_block, nullptr);     // take ownership, leave the handle empty
template <class T, class U = T>
[[nodiscard]] AC_FORCE_INLINE constexpr T exchange(T& obj, U&& new_val) // NOLINT
{
    T old_val = static_cast<T&&>(obj);
    obj = ac::forward<U>(new_val);
    return old_val;
}

// =========================================================================================================
// Comparison
// =========================================================================================================

/// Returns the larger of two values using operator<
/// When a == b, max returns b (consistent with min returning a)
template <class T>
[[nodiscard]] constexpr T const& max(T const& a, T const& b)
{
    static_assert(requires { a < b; }, "T must support operator<");
    return (b < a) ? a : b; // NOLINT(bugprone-return-const-ref-from-parameter)
}

/// Returns the smaller of two values using operator<
template <class T>
[[nodiscard]] constexpr T const& min(T const& a, T const& b)
{
    static_assert(requires { a < b; }, "T must support operator<");
    return (b < a) ? b : a; // NOLINT(bugprone-return-const-ref-from-parameter)
}

// =========================================================================================================
// Alignment (for values or pointers)
// =========================================================================================================

/// Check if a positive value is a power of two
/// Preconditions:
///   value > 0
template <class T>
[[nodiscard]] constexpr bool is_power_of_two(T value)
{
    AC_ASSERT(value > 0, "is_power_of_two: value must be positive");
    return (value & (value - 1)) == 0;
}

/// Increment value to align at the given boundary
/// Usage:
///   isize offset = ac::align_up(header_size, alignof(T));   // first T slot after a header
/// Corner cases:
///   value already aligned: returns value unchanged
/// Preconditions:
///   alignment > 0 and alignment must be a power of 2
///   value + alignment - 1 must not overflow (layout::extend checks this before calling)
template <class T>
[[nodiscard]] constexpr T align_up(T value, isize alignment)
{
    AC_ASSERT(alignment > 0 && is_power_of_two(alignment), "align_up: alignment must be a power of 2");
    auto const mask = alignment - 1;
    return (T)(((isize)value + mask) & ~mask);
}

/// Check if value is aligned at the given boundary
/// Preconditions:
///   alignment > 0 and alignment must be a power of 2
template <class T>
[[nodiscard]] constexpr bool is_aligned(T value, isize alignment)
{
    AC_ASSERT(alignment > 0 && is_power_of_two(alignment), "is_aligned: alignment must be a power of 2");
    return 0 == ((isize)value & (alignment - 1));
}

// =========================================================================================================
// Object storage
// =========================================================================================================

/// Tag selecting the non-allocating placement operator new declared below
/// Usage:
///   new (ac::placement_new, ptr) T(args...);
struct placement_new_t
{
};
constexpr placement_new_t placement_new = {};

namespace impl
{
template <class T, bool TrivialDtor = std::is_trivially_destructible_v<T>>
union storage_for_impl
{
    T value;

    constexpr storage_for_impl() {}
};

template <class T>
union storage_for_impl<T, false>
{
    T value;

    constexpr storage_for_impl() {}
    ~storage_for_impl() {}
};
} // namespace impl

/// Uninitialized storage for exactly one T, accessed through .value
/// Lifetime of .value is managed by the owner (placement new + explicit destructor call).
/// Trivially destructible when T is, so owners of trivial T stay trivial.
template <class T>
using storage_for = impl::storage_for_impl<T>;

// =========================================================================================================
// Template metaprogramming
// =========================================================================================================

/// Helper for indicating errors in static_asserts with dependent types
template <class... E>
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
///   ac::function_ptr<byte*(isize bytes, isize alignment, void* userdata)>
template <class T>
using function_ptr = typename impl::function_ptr_t<T>::type;

// =========================================================================================================
// Scope utilities
// =========================================================================================================

namespace impl
{
template <class F>
struct deferred
{
    F f;
    explicit deferred(F func) : f(static_cast<F&&>(func)) {}
    ~deferred() noexcept(false) { f(); }

    deferred(deferred const&) = delete;
    deferred& operator=(deferred const&) = delete;
    deferred(deferred&&) = delete;
    deferred& operator=(deferred&&) = delete;
};

struct deferred_tag
{
};

template <class F>
deferred<F> operator+(deferred_tag, F&& f)
{
    return deferred<F>(ac::forward<F>(f));
}
} // namespace impl

/// Execute code at scope-exit (RAII-style cleanup)
/// Captures by reference - be careful with lifetime
/// Usage:
///   bool committed = false;
///   AC_DEFER {
///       if (!committed)
///           release_block();
///   };
///   construct_payload(); // may throw
///   committed = true;
#define AC_DEFER auto const AC_MACRO_JOIN(_ac_deferred_, __COUNTER__) = ::ac::impl::deferred_tag{} + [&]

} // namespace ac

/// Non-allocating placement new selected by ac::placement_new
[[nodiscard]] inline void* operator new(std::size_t, ac::placement_new_t, void* ptr) noexcept
{
    return ptr;
}

/// Matching placement delete, only called if a constructor throws during placement new
inline void operator delete(void*, ac::placement_new_t, void*) noexcept {}
