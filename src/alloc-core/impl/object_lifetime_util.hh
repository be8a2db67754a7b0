#pragma once

#include <alloc-core/fwd.hh>
#include <alloc-core/utility.hh>

#include <cstring>
#include <type_traits>

// Helpers for starting and ending object lifetimes inside raw blocks.
// Used by shared array payloads, where the block is allocated first and elements are created in place.
//
// The create helpers share one convention:
// dest_end is advanced past every successfully constructed object, so if a constructor throws,
// [start, dest_end) is exactly the range that needs to be destroyed again.

namespace ac::impl
{
/// Calls destructors on [start, end) in reverse order.
/// Empty ranges (start == end) and nullptr are valid and result in a no-op.
/// Trivially destructible types are optimized out at compile time.
template <class T>
constexpr void destroy_objects_in_reverse(T* start, T* end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");

    if constexpr (!std::is_trivially_destructible_v<T>)
    {
        while (end != start)
        {
            --end;
            end->~T();
        }
    }
}

/// Default-constructs a count of objects using placement new.
/// Objects are initialized via T(), which zero-initializes trivial types.
template <class T>
constexpr void default_create_objects_to(T*& dest_end, isize count)
{
    static_assert(std::is_default_constructible_v<T>, "T must be default constructible");

    for (isize i = 0; i < count; ++i)
    {
        new (ac::placement_new, dest_end) T();
        ++dest_end;
    }
}

/// Copy-constructs objects from [src_start, src_end) using placement new.
/// Trivially copyable types are copied bytewise with a single memcpy,
/// everything else is copy-constructed element by element.
template <class T>
constexpr void copy_create_objects_to(T*& dest_end, T const* src_start, T const* src_end)
{
    static_assert(std::is_copy_constructible_v<T>, "T must be copy constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const size = src_end - src_start;
        if (size > 0)
        {
            std::memcpy(static_cast<void*>(dest_end), src_start, size * sizeof(T));
            dest_end += size;
        }
    }
    else
    {
        while (src_start != src_end)
        {
            new (ac::placement_new, dest_end) T(*src_start);
            ++dest_end;
            ++src_start;
        }
    }
}

/// Move-constructs objects from [src_start, src_end) using placement new.
/// The sources stay alive (moved-from) and must still be destroyed by the caller.
/// No exception safety is promised if move constructors throw.
template <class T>
constexpr void move_create_objects_to(T*& dest_end, T* src_start, T* src_end)
{
    static_assert(std::is_move_constructible_v<T>, "T must be move constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const size = src_end - src_start;
        if (size > 0)
        {
            std::memcpy(static_cast<void*>(dest_end), src_start, size * sizeof(T));
            dest_end += size;
        }
    }
    else
    {
        while (src_start != src_end)
        {
            new (ac::placement_new, dest_end) T(ac::move(*src_start));
            ++dest_end;
            ++src_start;
        }
    }
}
} // namespace ac::impl
