#pragma once

#include <alloc-core/alloc_error.hh>
#include <alloc-core/allocator.hh>
#include <alloc-core/fwd.hh>
#include <alloc-core/impl/object_lifetime_util.hh>
#include <alloc-core/impl/refcount.hh>
#include <alloc-core/layout.hh>
#include <alloc-core/macros.hh>
#include <alloc-core/result.hh>
#include <alloc-core/utility.hh>

#include <type_traits>

// The inner block behind ac::shared / ac::weak.
//
// A single allocation holds a header followed by the payload:
//
//   [ alloc | strong | weak | (length) | padding | payload ... ]
//   ^ header                                     ^ payload_offset()
//
// - the header is shared_header<A>, or shared_array_header<A> for T = U[] (adds the element count)
// - the payload starts at sizeof(header) rounded up to alignof(element)
// - the block alignment is the larger of header and element alignment
//
// The allocator lives inside the block it allocated.
// deallocate() moves it out before the header is destroyed and uses the moved copy to release the memory.
//
// All functions are static helpers on raw header pointers; ac::shared and ac::weak hold those pointers.

namespace ac::impl
{
template <class A>
struct shared_header
{
    AC_NO_UNIQUE_ADDRESS A alloc;
    strong_counter strong;
    weak_counter weak;

    shared_header(A a, u64 strong_init, u64 weak_init) : alloc(ac::move(a)), strong(strong_init), weak(weak_init) {}
};

template <class A>
struct shared_array_header : shared_header<A>
{
    isize length;

    shared_array_header(A a, u64 strong_init, u64 weak_init, isize len)
      : shared_header<A>(ac::move(a), strong_init, weak_init), length(len)
    {
    }
};

template <class T, class A>
struct shared_block
{
    using element_type = std::remove_extent_t<T>;
    static constexpr bool is_array = std::is_unbounded_array_v<T>;
    using header = std::conditional_t<is_array, shared_array_header<A>, shared_header<A>>;

    /// Independent of the array length
    [[nodiscard]] static constexpr isize payload_offset()
    {
        return ac::align_up(isize(sizeof(header)), isize(alignof(element_type)));
    }

    [[nodiscard]] static result<layout, alloc_error> block_layout(isize length)
    {
        auto payload = layout::array_of<element_type>(length);
        if (payload.has_error())
            return ac::error(payload.error());

        auto ext = layout::of<header>().extend(payload.value());
        if (ext.has_error())
            return ac::error(ext.error());

        AC_ASSERT(ext.value().offset == payload_offset(), "payload offset mismatch");
        return ext.value().combined;
    }

    /// Allocates a block with uninitialized payload and the given initial counts
    /// On success the allocator has been moved into the header.
    [[nodiscard]] static result<header*, alloc_error> allocate(A& alloc, u64 strong_init, u64 weak_init, isize length)
    {
        AC_ASSERT(is_array || length == 1, "single-value blocks hold exactly one element");
        AC_ASSERT(length >= 0, "element count must be non-negative");

        auto l = block_layout(length);
        if (l.has_error())
            return ac::error(l.error());

        auto mem = alloc.allocate(l.value());
        if (mem.has_error())
            return ac::error(mem.error());

        if constexpr (is_array)
            return new (ac::placement_new, mem.value()) header(ac::move(alloc), strong_init, weak_init, length);
        else
            return new (ac::placement_new, mem.value()) header(ac::move(alloc), strong_init, weak_init);
    }

    [[nodiscard]] static element_type* payload(header* h)
    {
        return reinterpret_cast<element_type*>(reinterpret_cast<byte*>(h) + payload_offset());
    }

    [[nodiscard]] static header* from_payload(element_type const* p)
    {
        return reinterpret_cast<header*>(reinterpret_cast<byte*>(const_cast<element_type*>(p)) - payload_offset());
    }

    [[nodiscard]] static isize length(header const* h)
    {
        if constexpr (is_array)
            return h->length;
        else
            return 1;
    }

    static void destroy_payload(header* h)
    {
        auto* const p = payload(h);
        impl::destroy_objects_in_reverse(p, p + length(h));
    }

    /// Releases the memory of the block. The payload must already be destroyed (or never constructed).
    static void deallocate(header* h)
    {
        A alloc = ac::move(h->alloc);
        auto const l = block_layout(length(h));
        AC_ASSERT(l.has_value(), "layout of an allocated block cannot overflow");
        h->~header();
        alloc.deallocate(reinterpret_cast<byte*>(h), l.value());
    }

    /// Drops one weak unit, releasing the block when it was the last
    static void release_weak(header* h)
    {
        if (h->weak.decrement())
            deallocate(h);
    }

    /// Drops one strong handle, destroying the payload when it was the last
    /// The last strong handle also gives up the implicit weak unit.
    static void release_strong(header* h)
    {
        if (!h->strong.decrement())
            return;

        destroy_payload(h);
        release_weak(h);
    }
};
} // namespace ac::impl
