#pragma once

#include <alloc-core/assert.hh>
#include <alloc-core/fwd.hh>
#include <alloc-core/result.hh>
#include <alloc-core/utility.hh>

#include <limits>
#include <type_traits>

// Layout arithmetic for alloc-core.
//
// Every byte count that reaches an allocator is produced here, with overflow checks:
// - ac::layout                       (size, alignment) of a block, alignment is a power of two
// - layout::of<T>()                  layout of a single T
// - layout::array_of<T>(n)           layout of n contiguous T, CapacityOverflow if n * sizeof(T) overflows
// - layout::from_size_alignment()    validated construction from raw numbers
// - layout::extend(next)             append a field after this layout, returns combined layout + field offset
// - impl::alloc_guard(bytes)         narrow-platform guard: no block may exceed half the address space
//
// Failures are reported as ac::alloc_error with kind capacity_overflow.
// Negative counts and non-power-of-two alignments are programmer errors and assert.

/// Size and alignment of a memory block
/// Invariants: size >= 0, alignment > 0 and a power of two
struct ac::layout
{
    isize size = 0;
    isize alignment = 1;

    /// Layout of a single T
    template <class T>
    [[nodiscard]] static constexpr layout of()
    {
        return {isize(sizeof(T)), isize(alignof(T))};
    }

    /// Validated construction from raw numbers
    /// Fails with capacity_overflow if size rounded up to alignment would exceed isize,
    /// or if size exceeds the platform's addressable range
    [[nodiscard]] static result<layout, alloc_error> from_size_alignment(isize size, isize alignment);

    /// Layout of count contiguous T (no trailing padding beyond sizeof(T) * count)
    template <class T>
    [[nodiscard]] static result<layout, alloc_error> array_of(isize count);

    /// Appends a field described by next after this layout
    /// The field starts at the next offset aligned for next.alignment,
    /// the combined alignment is the larger of both.
    [[nodiscard]] result<layout_extension, alloc_error> extend(layout next) const;

    friend bool operator==(layout const&, layout const&) = default;
};

/// Result of layout::extend
struct ac::layout_extension
{
    /// layout covering the original bytes, padding, and the appended field
    ac::layout combined;
    /// byte offset of the appended field
    isize offset = 0;
};

enum class ac::alloc_error_kind : u8
{
    /// a capacity or size computation exceeded the representable or addressable range
    capacity_overflow,
    /// the allocator declined the request
    allocation_failure,
};

/// Error reported by every fallible allocating operation
struct ac::alloc_error
{
    alloc_error_kind kind = alloc_error_kind::capacity_overflow;

    /// the layout the allocator declined (only meaningful for allocation_failure)
    ac::layout failed_layout = {};

    [[nodiscard]] static constexpr alloc_error capacity_overflow() { return {alloc_error_kind::capacity_overflow, {}}; }
    [[nodiscard]] static constexpr alloc_error allocation_failure(ac::layout l)
    {
        return {alloc_error_kind::allocation_failure, l};
    }

    [[nodiscard]] constexpr bool is_capacity_overflow() const { return kind == alloc_error_kind::capacity_overflow; }
    [[nodiscard]] constexpr bool is_allocation_failure() const { return kind == alloc_error_kind::allocation_failure; }

    friend bool operator==(alloc_error const&, alloc_error const&) = default;
};

namespace ac
{
/// Types that are treated as zero-sized: no storage is ever allocated for them
/// and buffers of them report an unbounded capacity.
/// C++ gives every object a size of at least one byte, so we treat empty trivial types as zero-sized.
/// Slots of such a buffer never have backing memory and must not be dereferenced.
/// May be specialized to opt a type in or out.
template <class T>
constexpr bool is_zero_sized
    = std::is_empty_v<T> && std::is_trivially_default_constructible_v<T> && std::is_trivially_destructible_v<T>;

/// Effective element size used for capacity arithmetic (0 for zero-sized types)
template <class T>
constexpr isize element_size = is_zero_sized<T> ? 0 : isize(sizeof(T));

constexpr isize max_isize = std::numeric_limits<isize>::max();
} // namespace ac

namespace ac::impl
{
/// Returns false if a block of the given byte size can never be addressed on this platform
/// On 64-bit targets isize itself is the limit, on narrower targets we reserve the upper half of the
/// address space so that pointer differences inside a block never overflow
[[nodiscard]] constexpr bool alloc_guard(isize bytes)
{
#if AC_POINTER_BITS < 64
    return bytes <= isize(INTPTR_MAX);
#else
    AC_UNUSED(bytes);
    return true;
#endif
}

/// Non-null, well-aligned address that is never dereferenced
/// Stands in for the block of zero-sized element types, which never allocate.
template <class T>
[[nodiscard]] T* dangling_ptr()
{
    return reinterpret_cast<T*>(std::uintptr_t(alignof(T)));
}

/// Block pointer of an empty buffer: dangling for zero-sized T, nullptr otherwise
template <class T>
[[nodiscard]] T* empty_ptr()
{
    if constexpr (ac::is_zero_sized<T>)
        return impl::dangling_ptr<T>();
    else
        return nullptr;
}

/// a + b for non-negative operands, false on overflow
[[nodiscard]] constexpr bool checked_add(isize a, isize b, isize& out)
{
    AC_ASSERT(a >= 0 && b >= 0, "checked_add: operands must be non-negative");
    if (a > max_isize - b)
        return false;
    out = a + b;
    return true;
}

/// a * b for non-negative operands, false on overflow
[[nodiscard]] constexpr bool checked_mul(isize a, isize b, isize& out)
{
    AC_ASSERT(a >= 0 && b >= 0, "checked_mul: operands must be non-negative");
    if (b != 0 && a > max_isize / b)
        return false;
    out = a * b;
    return true;
}
} // namespace ac::impl

// =========================================================================================================
// Implementation
// =========================================================================================================

inline ac::result<ac::layout, ac::alloc_error> ac::layout::from_size_alignment(isize size, isize alignment)
{
    AC_ASSERT(size >= 0, "layout size must be non-negative");
    AC_ASSERT(alignment > 0 && ac::is_power_of_two(alignment), "layout alignment must be a power of 2");

    if (size > max_isize - (alignment - 1) || !impl::alloc_guard(size))
        return ac::error(alloc_error::capacity_overflow());

    return layout{size, alignment};
}

template <class T>
ac::result<ac::layout, ac::alloc_error> ac::layout::array_of(isize count)
{
    AC_ASSERT(count >= 0, "element count must be non-negative");

    isize bytes = 0;
    if (!impl::checked_mul(count, isize(sizeof(T)), bytes) || !impl::alloc_guard(bytes))
        return ac::error(alloc_error::capacity_overflow());

    return layout{bytes, isize(alignof(T))};
}

inline ac::result<ac::layout_extension, ac::alloc_error> ac::layout::extend(layout next) const
{
    AC_ASSERT(next.size >= 0, "layout size must be non-negative");
    AC_ASSERT(next.alignment > 0 && ac::is_power_of_two(next.alignment), "layout alignment must be a power of 2");

    // rounding size up to next.alignment must not overflow
    isize padded_end = 0;
    if (!impl::checked_add(size, next.alignment - 1, padded_end))
        return ac::error(alloc_error::capacity_overflow());

    auto const offset = ac::align_up(size, next.alignment);

    isize total = 0;
    if (!impl::checked_add(offset, next.size, total) || !impl::alloc_guard(total))
        return ac::error(alloc_error::capacity_overflow());

    return layout_extension{
        .combined = {total, ac::max(alignment, next.alignment)},
        .offset = offset,
    };
}
