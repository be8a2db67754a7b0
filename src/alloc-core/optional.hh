#pragma once

#include <alloc-core/assert.hh>
#include <alloc-core/fwd.hh>
#include <alloc-core/utility.hh>

#include <type_traits>

/// Marker for "nothing here", returned by ac::weak<T>::upgrade() once the payload is gone.
/// Not default-constructible, so that `opt = {}` keeps meaning "reset to empty optional".
struct ac::nullopt_t
{
    enum class _ctor_tag // NOLINT(readability-identifier-naming)
    {
        tag
    };
    explicit constexpr nullopt_t(_ctor_tag) {}
};

namespace ac
{
/// The single nullopt_t value.
constexpr nullopt_t nullopt = nullopt_t{nullopt_t::_ctor_tag::tag};
} // namespace ac

/// Holds either a T or nothing.
///
/// Used in two places in alloc-core:
///   - weak<T>::upgrade() yields optional<shared<T>>, empty when no strong handle survives
///   - result<void, E> stores its error as optional<E>
///
/// Access is explicit: has_value() + value(), or take() to move the value out and disengage.
/// There is no operator* or operator->.
/// Trivially copyable and trivially destructible whenever T is.
template <class T>
struct ac::optional
{
    // construction
public:
    optional() = default;
    optional(nullopt_t) {}

    /// Engages with a T built from value; explicit when U does not implicitly convert to T.
    template <class U = std::remove_cv_t<T>>
        requires(!std::is_same_v<std::remove_cvref_t<U>, optional> && !std::is_same_v<std::remove_cvref_t<U>, nullopt_t>
                 && std::is_constructible_v<T, U &&>)
    explicit(!std::is_convertible_v<U, T>) optional(U&& value) // NOLINT
    {
        impl_engage(ac::forward<U>(value));
    }

    // trivial special members
public:
    optional(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    ~optional()
        requires std::is_trivially_destructible_v<T>
    = default;

    // non-trivial special members
public:
    /// The source is left empty, so a moved-from optional<shared<T>> no longer holds a reference.
    optional(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
    {
        if (rhs._has_value)
        {
            impl_engage(ac::move(rhs._storage.value));
            rhs.impl_disengage();
        }
    }

    optional(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T>)
    {
        if (rhs._has_value)
            impl_engage(rhs._storage.value);
    }

    optional& operator=(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
    {
        if (this == &rhs)
            return *this;

        if (!rhs._has_value)
            reset();
        else if (_has_value)
            _storage.value = ac::move(rhs._storage.value);
        else
            impl_engage(ac::move(rhs._storage.value));

        return *this;
    }

    optional& operator=(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T> && std::is_copy_assignable_v<T>)
    {
        if (this == &rhs)
            return *this;

        if (!rhs._has_value)
            reset();
        else if (_has_value)
            _storage.value = rhs._storage.value;
        else
            impl_engage(rhs._storage.value);

        return *this;
    }

    ~optional()
        requires(!std::is_trivially_destructible_v<T>)
    {
        reset();
    }

    // modification
public:
    /// Destroys the current value (if any) and builds a new one in place.
    template <class... Args>
    T& emplace(Args&&... args)
    {
        reset();
        impl_engage(ac::forward<Args>(args)...);
        return _storage.value;
    }

    /// Destroys the held value, if any.
    void reset()
    {
        if (_has_value)
            impl_disengage();
    }

    /// Moves the value out and leaves this optional empty.
    /// Precondition: has_value() == true.
    [[nodiscard]] T take()
    {
        AC_ASSERT(_has_value, "attempted to take the value of an empty optional");
        T v = ac::move(_storage.value);
        impl_disengage();
        return v;
    }

    // queries and access
public:
    [[nodiscard]] bool has_value() const { return _has_value; }

    /// The held value, with the value category of *this.
    /// Precondition: has_value() == true.
    template <class Self>
    [[nodiscard]] auto&& value(this Self&& self)
    {
        AC_ASSERT(self.has_value(), "attempted to access value of empty optional");
        return static_cast<Self&&>(self)._storage.value;
    }

    /// The held value or fallback, always by value.
    template <class U>
    [[nodiscard]] T value_or(U&& fallback) const&
    {
        return _has_value ? _storage.value : T(ac::forward<U>(fallback));
    }

    // comparison
public:
    [[nodiscard]] friend bool operator==(optional const& lhs, optional const& rhs)
        requires requires(T v) { bool(v == v); }
    {
        if (!lhs._has_value || !rhs._has_value)
            return lhs._has_value == rhs._has_value;
        return lhs._storage.value == rhs._storage.value;
    }

    [[nodiscard]] friend bool operator==(optional const& lhs, T const& rhs)
        requires requires(T v) { bool(v == v); }
    {
        return lhs._has_value && lhs._storage.value == rhs;
    }

    [[nodiscard]] friend bool operator==(optional const& lhs, nullopt_t) { return !lhs._has_value; }

    /// `opt == true` on a non-bool optional is almost always a mistaken has_value() check.
    [[nodiscard]] bool operator==(bool) const
        requires(!std::is_same_v<T, bool>)
    = delete;

    // helper
private:
    template <class... Args>
    void impl_engage(Args&&... args)
    {
        new (ac::placement_new, &_storage.value) T(ac::forward<Args>(args)...);
        _has_value = true;
    }

    void impl_disengage()
    {
        _storage.value.~T();
        _has_value = false;
    }

    // members
private:
    ac::storage_for<T> _storage;
    bool _has_value = false;
};
