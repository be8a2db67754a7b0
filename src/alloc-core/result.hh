#pragma once

#include <alloc-core/assert.hh>
#include <alloc-core/fwd.hh>
#include <alloc-core/optional.hh>
#include <alloc-core/utility.hh>

#include <type_traits>

// ac::result<T, E> is the return type of every fallible operation in alloc-core.
//
// Construction:
//   return value;                          // implicit success
//   return ac::error(alloc_error{...});     // explicit failure via the error_value wrapper
//   return ac::success;                    // success for result<void, E>
//
// The explicit error wrapper keeps result<T, E> unambiguous even when T and E are related types
// (e.g. shared<T>::try_unwrap returns result<T, shared<T>> and hands the handle back on failure).
//
// Access:
//   if (r.has_error())
//       return ac::error(r.error());
//   use(r.value());
//
// Accessing the wrong alternative is a programmer error and asserts.
// The type is [[nodiscard]]: dropping a result on the floor is a compile warning.

/// Wrapper marking a value as the error alternative of a result
template <class E>
struct ac::error_value
{
    E value;
};

namespace ac
{
/// Wraps an error for returning from a function that returns result<T, E>
template <class E>
[[nodiscard]] constexpr error_value<std::remove_cvref_t<E>> error(E&& e)
{
    return error_value<std::remove_cvref_t<E>>{ac::forward<E>(e)};
}

/// Success marker for result<void, E>
struct success_t
{
};
constexpr success_t success = {};

namespace impl
{
template <class T>
constexpr bool is_error_value = false;
template <class E>
constexpr bool is_error_value<ac::error_value<E>> = true;
} // namespace impl
} // namespace ac

/// Sum type representing either a success value T or an error value E
template <class T, class E>
struct [[nodiscard]] ac::result
{
    static_assert(!std::is_reference_v<T> && !std::is_reference_v<E>, "result does not support reference types");

    // construction
public:
    template <class U = T>
        requires(!std::is_same_v<std::remove_cvref_t<U>, result> && !impl::is_error_value<std::remove_cvref_t<U>>
                 && std::is_constructible_v<T, U &&>)
    constexpr result(U&& value) : _has_value(true) // NOLINT
    {
        new (ac::placement_new, &_value) T(ac::forward<U>(value));
    }

    template <class G>
        requires std::is_constructible_v<E, G&&>
    constexpr result(error_value<G>&& err) : _has_value(false) // NOLINT
    {
        new (ac::placement_new, &_error) E(ac::move(err.value));
    }

    result(result&& rhs) noexcept(std::is_nothrow_move_constructible_v<T> && std::is_nothrow_move_constructible_v<E>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (ac::placement_new, &_value) T(ac::move(rhs._value));
        else
            new (ac::placement_new, &_error) E(ac::move(rhs._error));
    }

    result(result const& rhs)
        requires(std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (ac::placement_new, &_value) T(rhs._value);
        else
            new (ac::placement_new, &_error) E(rhs._error);
    }

    /// Destroys the current alternative and move-constructs rhs's alternative in its place.
    result& operator=(result&& rhs) noexcept(std::is_nothrow_move_constructible_v<T> && std::is_nothrow_move_constructible_v<E>)
    {
        if (this != &rhs)
        {
            impl_destroy();
            _has_value = rhs._has_value;
            if (_has_value)
                new (ac::placement_new, &_value) T(ac::move(rhs._value));
            else
                new (ac::placement_new, &_error) E(ac::move(rhs._error));
        }
        return *this;
    }

    result& operator=(result const& rhs)
        requires(std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>)
    {
        if (this != &rhs)
        {
            impl_destroy();
            _has_value = rhs._has_value;
            if (_has_value)
                new (ac::placement_new, &_value) T(rhs._value);
            else
                new (ac::placement_new, &_error) E(rhs._error);
        }
        return *this;
    }

    ~result() { impl_destroy(); }

    // queries and access
public:
    [[nodiscard]] bool has_value() const { return _has_value; }
    [[nodiscard]] bool has_error() const { return !_has_value; }

    [[nodiscard]] T& value() &
    {
        AC_ASSERT(_has_value, "attempted to access value of a result holding an error");
        return _value;
    }
    [[nodiscard]] T const& value() const&
    {
        AC_ASSERT(_has_value, "attempted to access value of a result holding an error");
        return _value;
    }
    [[nodiscard]] T&& value() &&
    {
        AC_ASSERT(_has_value, "attempted to access value of a result holding an error");
        return ac::move(_value);
    }

    [[nodiscard]] E& error() &
    {
        AC_ASSERT(!_has_value, "attempted to access error of a result holding a value");
        return _error;
    }
    [[nodiscard]] E const& error() const&
    {
        AC_ASSERT(!_has_value, "attempted to access error of a result holding a value");
        return _error;
    }
    [[nodiscard]] E&& error() &&
    {
        AC_ASSERT(!_has_value, "attempted to access error of a result holding a value");
        return ac::move(_error);
    }

private:
    void impl_destroy()
    {
        if (_has_value)
            _value.~T();
        else
            _error.~E();
    }

    // members
private:
    union
    {
        T _value;
        E _error;
    };
    bool _has_value;
};

namespace ac
{
/// result without a success payload, for operations that either complete or fail
template <class E>
struct [[nodiscard]] result<void, E>
{
    // construction
public:
    constexpr result(success_t) {} // NOLINT

    template <class G>
        requires std::is_constructible_v<E, G&&>
    constexpr result(error_value<G>&& err) : _error(E(ac::move(err.value))) // NOLINT
    {
    }

    // queries and access
public:
    [[nodiscard]] bool has_value() const { return !_error.has_value(); }
    [[nodiscard]] bool has_error() const { return _error.has_value(); }

    [[nodiscard]] E const& error() const
    {
        AC_ASSERT(_error.has_value(), "attempted to access error of a successful result");
        return _error.value();
    }

    // members
private:
    ac::optional<E> _error;
};
} // namespace ac
