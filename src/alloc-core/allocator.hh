#pragma once

#include <alloc-core/alloc_error.hh>
#include <alloc-core/fwd.hh>
#include <alloc-core/layout.hh>
#include <alloc-core/macros.hh>
#include <alloc-core/memory_resource.hh>
#include <alloc-core/result.hh>

#include <concepts>
#include <type_traits>

// The allocator abstraction of alloc-core.
//
// An allocator is any type modelling ac::allocator<A>, a capability set of four operations:
//   a.allocate(layout)                         -> result<byte*, alloc_error>
//   a.deallocate(p, layout)                    -> void
//   a.try_grow_in_place(p, old_layout, size)   -> bool
//   a.reallocate(p, old_layout, size)          -> result<byte*, alloc_error>
//
// Contracts:
// - consumers never request zero-size layouts (zero-sized element types bypass allocation entirely)
// - returned blocks satisfy the requested size and alignment (or more)
// - grow/reallocate preserve the first min(old_size, new_size) bytes
// - a failed call leaves the block and the allocator state unchanged
// - moving an allocator never throws (allocators are stored by value inside buffers and shared blocks)
//   and allocators are move-assignable (moving a buffer into another one moves its allocator along)
//
// Two calling conventions coexist and are expressed by the allocator type, not by the consumer:
// - fallible:   failure is returned as alloc_error (e.g. ac::resource_allocator)
// - infallible: failure calls ac::handle_alloc_error and never returns (ac::abort_on_failure<A>)
// raw_buffer and shared are written against the concept only and work with both.
//
// ac::default_allocator is abort_on_failure<resource_allocator> over ac::default_memory_resource.

namespace ac
{
template <class A>
concept allocator = std::is_nothrow_move_constructible_v<A> && std::is_nothrow_move_assignable_v<A>
                    && requires(A& a, byte* p, layout l, isize new_size) {
                           { a.allocate(l) } -> std::same_as<result<byte*, alloc_error>>;
                           { a.deallocate(p, l) } -> std::same_as<void>;
                           { a.try_grow_in_place(p, l, new_size) } -> std::same_as<bool>;
                           { a.reallocate(p, l, new_size) } -> std::same_as<result<byte*, alloc_error>>;
                       };
} // namespace ac

/// Fallible allocator over an ac::memory_resource
/// A null custom_resource means ac::default_memory_resource.
/// Copies share the resource, so stateful resources see all traffic of all copies.
struct ac::resource_allocator
{
    memory_resource const* custom_resource = nullptr;

    [[nodiscard]] memory_resource const& resource() const
    {
        return custom_resource != nullptr ? *custom_resource : *default_memory_resource;
    }

    [[nodiscard]] result<byte*, alloc_error> allocate(layout l) const;
    void deallocate(byte* p, layout l) const;
    [[nodiscard]] bool try_grow_in_place(byte* p, layout old_layout, isize new_size) const;
    [[nodiscard]] result<byte*, alloc_error> reallocate(byte* p, layout old_layout, isize new_size) const;

    friend bool operator==(resource_allocator const&, resource_allocator const&) = default;
};

/// Infallible-by-convention wrapper: any allocation failure of the inner allocator
/// is reported via ac::handle_alloc_error and aborts the process.
/// The returned results therefore always hold a value.
template <class A>
struct ac::abort_on_failure
{
    static_assert(ac::allocator<A>, "abort_on_failure requires an allocator");

    AC_NO_UNIQUE_ADDRESS A inner = {};

    [[nodiscard]] result<byte*, alloc_error> allocate(layout l)
    {
        auto r = inner.allocate(l);
        if (r.has_error()) [[unlikely]]
            ac::handle_alloc_error(l);
        return r;
    }

    void deallocate(byte* p, layout l) { inner.deallocate(p, l); }

    [[nodiscard]] bool try_grow_in_place(byte* p, layout old_layout, isize new_size)
    {
        return inner.try_grow_in_place(p, old_layout, new_size);
    }

    [[nodiscard]] result<byte*, alloc_error> reallocate(byte* p, layout old_layout, isize new_size)
    {
        auto r = inner.reallocate(p, old_layout, new_size);
        if (r.has_error()) [[unlikely]]
            ac::handle_alloc_error(layout{new_size, old_layout.alignment});
        return r;
    }

    friend bool operator==(abort_on_failure const&, abort_on_failure const&) = default;
};
