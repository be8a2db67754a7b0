#pragma once

#include <alloc-core/assert.hh>
#include <alloc-core/fwd.hh>

#include <initializer_list>
#include <type_traits>

/// Non-owning view over a contiguous sequence of T.
/// Stores a pointer and runtime size.
/// Used as the element view of fixed blocks and shared arrays, and as the source of shared::create_copy_of.
template <class T>
struct ac::span
{
    // construction
public:
    /// Default span is empty: data() == nullptr, size() == 0.
    constexpr span() = default;

    /// Creates a span viewing [ptr, ptr+size).
    /// Precondition: size >= 0.
    constexpr explicit span(T* ptr, isize size) : _data(ptr), _size(size)
    {
        AC_ASSERT(size >= 0, "span size must be non-negative");
    }

    /// Creates a span from an initializer_list.
    /// Only available when T is const; allows calling foo({1, 2, 3}) for foo(span<int const>).
    /// WARNING: safe ONLY as an immediate function argument, the list dies at the end of the full expression.
    constexpr span(std::initializer_list<std::remove_const_t<T>> init)
        requires std::is_const_v<T>
      : _data(init.begin()), _size(static_cast<isize>(init.size()))
    {
    }

    /// Creates a span viewing the entire C array.
    template <isize N>
    constexpr span(T (&arr)[N]) : _data(arr), _size(N)
    {
    }

    /// span<T> converts to span<T const>
    template <class U>
        requires(std::is_const_v<T> && std::is_same_v<std::remove_const_t<T>, U>)
    constexpr span(span<U> rhs) : _data(rhs.data()), _size(rhs.size())
    {
    }

    // access
public:
    [[nodiscard]] constexpr T& operator[](isize i) const
    {
        AC_ASSERT(0 <= i && i < _size, "index out of bounds");
        return _data[i];
    }

    [[nodiscard]] constexpr T* data() const { return _data; }

    [[nodiscard]] constexpr T* begin() const { return _data; }
    [[nodiscard]] constexpr T* end() const { return _data + _size; }

    [[nodiscard]] constexpr isize size() const { return _size; }
    [[nodiscard]] constexpr bool empty() const { return _size == 0; }

    // members
private:
    T* _data = nullptr;
    isize _size = 0;
};
