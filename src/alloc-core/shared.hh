#pragma once

#include <alloc-core/alloc_error.hh>
#include <alloc-core/allocator.hh>
#include <alloc-core/assert.hh>
#include <alloc-core/fwd.hh>
#include <alloc-core/impl/object_lifetime_util.hh>
#include <alloc-core/impl/shared_block.hh>
#include <alloc-core/optional.hh>
#include <alloc-core/result.hh>
#include <alloc-core/span.hh>
#include <alloc-core/utility.hh>

#include <atomic>
#include <compare>
#include <cstring>
#include <functional>
#include <utility>
#include <type_traits>

// ac::shared<T, A> is a thread-safe reference-counted handle to an immutable T living in one heap block.
// ac::weak<T, A> is a non-owning handle to the same block that can be upgraded while the value is alive.
//
// Lifecycle of a block:
// - Live:     strong > 0, payload alive, weak handles can upgrade
// - WeakOnly: strong == 0, payload destroyed, block kept for the remaining weak handles
// - Freed:    weak reached 0, memory returned to the allocator
//
// All strong handles together hold one implicit weak unit, so the block outlives the payload
// exactly as long as weak handles exist. See impl/refcount.hh for the atomic protocol.
//
// Creation:
//   auto s = ac::shared<int>::create_from(5);
//   auto a = ac::shared<int[]>::create_copy_of({1, 2, 3});
//   auto c = ac::shared<node>::create_cyclic([](ac::weak<node> const& self) { return node{self}; });
//
// Access is read-only through shared handles. Mutation goes through:
// - get_mut()   pointer to the payload if this is the only handle of any kind, nullptr otherwise
// - make_mut()  copy-on-write: makes this handle unique (cloning or moving the payload if needed)
//
// Handles can be converted to and from raw payload pointers (into_raw / from_raw) for FFI-style transfer.
// A moved-from shared is empty and may only be assigned to or destroyed.
//
// Both handles are the size of a pointer.

template <class T, class A>
struct ac::shared
{
    static_assert(ac::allocator<A>, "shared requires an allocator");
    static_assert(!std::is_bounded_array_v<T>, "use shared<T[]> for arrays");
    static_assert(!std::is_reference_v<T>, "shared does not support reference types");

public:
    using element_type = std::remove_extent_t<T>;
    static constexpr bool is_array = std::is_unbounded_array_v<T>;

private:
    using block = impl::shared_block<T, A>;
    using header = typename block::header;

    // single value factories
public:
    /// Allocates a block with the default allocator and constructs T from args
    template <class... Args>
        requires(!is_array && std::is_default_constructible_v<A> && std::is_constructible_v<T, Args && ...>)
    [[nodiscard]] static shared create_from(Args&&... args)
    {
        return create_in(A{}, ac::forward<Args>(args)...);
    }

    template <class... Args>
        requires(!is_array && std::is_constructible_v<T, Args && ...>)
    [[nodiscard]] static shared create_in(A alloc, Args&&... args)
    {
        return impl::value_or_abort(try_create_in(ac::move(alloc), ac::forward<Args>(args)...));
    }

    /// Like create_in, but reports allocation failure instead of aborting
    /// If the constructor of T throws, the block is released again.
    template <class... Args>
        requires(!is_array && std::is_constructible_v<T, Args && ...>)
    [[nodiscard]] static result<shared, alloc_error> try_create_in(A alloc, Args&&... args)
    {
        auto h = block::allocate(alloc, 1, 1, 1);
        if (h.has_error())
            return ac::error(h.error());

        header* const hdr = h.value();
        bool constructed = false;
        AC_DEFER
        {
            if (!constructed)
                block::deallocate(hdr);
        };

        new (ac::placement_new, block::payload(hdr)) T(ac::forward<Args>(args)...);
        constructed = true;
        return shared(hdr);
    }

    // cyclic construction
public:
    /// Constructs a value that can hold weak references to itself.
    ///
    /// init receives a weak handle to the block under construction and returns the T to store.
    /// During init the weak handle cannot be upgraded (upgrade returns nullopt), but it can be cloned and stored.
    /// The value becomes visible to upgrades only after it is fully constructed.
    /// If init throws, the block stays alive as long as clones of the weak handle do.
    template <class F>
        requires(!is_array && std::is_default_constructible_v<A> && std::is_invocable_r_v<T, F&, weak<T, A> const&>)
    [[nodiscard]] static shared create_cyclic(F&& init)
    {
        return create_cyclic_in(A{}, init);
    }

    template <class F>
        requires(!is_array && std::is_invocable_r_v<T, F&, weak<T, A> const&>)
    [[nodiscard]] static shared create_cyclic_in(A alloc, F&& init)
    {
        return impl::value_or_abort(try_create_cyclic_in(ac::move(alloc), init));
    }

    template <class F>
        requires(!is_array && std::is_invocable_r_v<T, F&, weak<T, A> const&>)
    [[nodiscard]] static result<shared, alloc_error> try_create_cyclic_in(A alloc, F&& init)
    {
        auto h = block::allocate(alloc, 0, 1, 1);
        if (h.has_error())
            return ac::error(h.error());

        header* const hdr = h.value();

        // owns the single weak unit until the value is published
        weak<T, A> self(hdr);
        weak<T, A> const& self_view = self;
        new (ac::placement_new, block::payload(hdr)) T(std::invoke(init, self_view));

        hdr->strong.publish();

        // the weak unit becomes the implicit unit of the strong handles
        self._block = nullptr;
        return shared(hdr);
    }

    // array factories
public:
    /// Copies the elements of source into a new block
    [[nodiscard]] static shared create_copy_of(span<element_type const> source, A alloc = A{})
        requires(is_array && std::is_copy_constructible_v<element_type>)
    {
        return impl::value_or_abort(try_create_copy_of(source, ac::move(alloc)));
    }

    [[nodiscard]] static result<shared, alloc_error> try_create_copy_of(span<element_type const> source, A alloc = A{})
        requires(is_array && std::is_copy_constructible_v<element_type>)
    {
        return impl_try_create_array(ac::move(alloc), source.size(), [&](element_type*& end)
                                     { impl::copy_create_objects_to(end, source.data(), source.data() + source.size()); });
    }

    /// count value-initialized elements
    [[nodiscard]] static shared create_defaulted(isize count, A alloc = A{})
        requires(is_array && std::is_default_constructible_v<element_type>)
    {
        return impl::value_or_abort(try_create_defaulted(count, ac::move(alloc)));
    }

    [[nodiscard]] static result<shared, alloc_error> try_create_defaulted(isize count, A alloc = A{})
        requires(is_array && std::is_default_constructible_v<element_type>)
    {
        return impl_try_create_array(ac::move(alloc), count,
                                     [&](element_type*& end) { impl::default_create_objects_to(end, count); });
    }

    // uninitialized factories
public:
    /// Allocates a block for one T without constructing it
    /// Construct the value through data() and publish with std::move(u).assume_init(), or use write(args...).
    [[nodiscard]] static shared_uninit<T, A> create_uninit(A alloc = A{})
        requires(!is_array)
    {
        return impl::value_or_abort(try_create_uninit(ac::move(alloc)));
    }

    [[nodiscard]] static result<shared_uninit<T, A>, alloc_error> try_create_uninit(A alloc = A{})
        requires(!is_array)
    {
        return impl_try_create_uninit(ac::move(alloc), 1, false);
    }

    /// Like create_uninit, but the payload bytes are zero
    [[nodiscard]] static shared_uninit<T, A> create_zeroed(A alloc = A{})
        requires(!is_array)
    {
        return impl::value_or_abort(try_create_zeroed(ac::move(alloc)));
    }

    [[nodiscard]] static result<shared_uninit<T, A>, alloc_error> try_create_zeroed(A alloc = A{})
        requires(!is_array)
    {
        return impl_try_create_uninit(ac::move(alloc), 1, true);
    }

    /// Allocates a block for count elements without constructing them
    [[nodiscard]] static shared_uninit<T, A> create_uninit(isize count, A alloc = A{})
        requires(is_array)
    {
        return impl::value_or_abort(try_create_uninit(count, ac::move(alloc)));
    }

    [[nodiscard]] static result<shared_uninit<T, A>, alloc_error> try_create_uninit(isize count, A alloc = A{})
        requires(is_array)
    {
        return impl_try_create_uninit(ac::move(alloc), count, false);
    }

    [[nodiscard]] static shared_uninit<T, A> create_zeroed(isize count, A alloc = A{})
        requires(is_array)
    {
        return impl::value_or_abort(try_create_zeroed(count, ac::move(alloc)));
    }

    [[nodiscard]] static result<shared_uninit<T, A>, alloc_error> try_create_zeroed(isize count, A alloc = A{})
        requires(is_array)
    {
        return impl_try_create_uninit(ac::move(alloc), count, true);
    }

    // handle lifecycle
public:
    shared(shared const& rhs) : _block(rhs._block)
    {
        if (_block)
            _block->strong.increment();
    }

    shared(shared&& rhs) noexcept : _block(ac::exchange(rhs._block, nullptr)) {}

    shared& operator=(shared const& rhs)
    {
        if (this != &rhs)
        {
            // increment first: rhs may be owned by our own payload
            if (rhs._block)
                rhs._block->strong.increment();

            auto* const old = ac::exchange(_block, rhs._block);
            if (old)
                block::release_strong(old);
        }
        return *this;
    }

    shared& operator=(shared&& rhs) noexcept
    {
        if (this != &rhs)
        {
            auto* const old = ac::exchange(_block, ac::exchange(rhs._block, nullptr));
            if (old)
                block::release_strong(old);
        }
        return *this;
    }

    ~shared()
    {
        if (_block)
            block::release_strong(_block);
    }

    // access
public:
    /// false only for moved-from handles
    [[nodiscard]] bool is_valid() const { return _block != nullptr; }

    [[nodiscard]] T const& operator*() const
        requires(!is_array)
    {
        AC_ASSERT(is_valid(), "accessing an empty shared");
        return *block::payload(_block);
    }

    [[nodiscard]] T const* operator->() const
        requires(!is_array)
    {
        AC_ASSERT(is_valid(), "accessing an empty shared");
        return block::payload(_block);
    }

    [[nodiscard]] element_type const& operator[](isize i) const
        requires(is_array)
    {
        AC_ASSERT(is_valid(), "accessing an empty shared");
        AC_ASSERT(0 <= i && i < block::length(_block), "index out of bounds");
        return block::payload(_block)[i];
    }

    [[nodiscard]] isize size() const
        requires(is_array)
    {
        AC_ASSERT(is_valid(), "accessing an empty shared");
        return block::length(_block);
    }

    [[nodiscard]] span<element_type const> as_span() const
        requires(is_array)
    {
        AC_ASSERT(is_valid(), "accessing an empty shared");
        return span<element_type const>(block::payload(_block), block::length(_block));
    }

    /// Address of the payload, identical across all handles of the block
    [[nodiscard]] element_type const* as_ptr() const
    {
        AC_ASSERT(is_valid(), "accessing an empty shared");
        return block::payload(_block);
    }

    /// Allocator stored inside the block
    [[nodiscard]] A const& allocator() const
    {
        AC_ASSERT(is_valid(), "accessing an empty shared");
        return _block->alloc;
    }

    // counts
public:
    /// Number of strong handles (a snapshot, other threads may change it at any time)
    [[nodiscard]] isize strong_count() const
    {
        AC_ASSERT(is_valid(), "accessing an empty shared");
        return isize(_block->strong.load());
    }

    /// Number of weak handles, excluding the implicit unit of the strong handles
    /// Reports 0 while another thread performs the exclusivity check.
    [[nodiscard]] isize weak_count() const
    {
        AC_ASSERT(is_valid(), "accessing an empty shared");
        auto const s = _block->weak.load_state();
        return s.is_locked ? 0 : isize(s.count - 1);
    }

    // weak handles
public:
    /// Creates a new weak handle to this block
    /// Spins while another thread holds the exclusivity lock.
    [[nodiscard]] weak<T, A> downgrade() const
    {
        AC_ASSERT(is_valid(), "downgrading an empty shared");
        _block->weak.increment_unless_locked();
        return weak<T, A>(_block);
    }

    // mutation
public:
    /// True if this is the only handle, strong or weak, to the block
    /// Locks the weak counter for the duration of the check so that no downgrade can slip in.
    [[nodiscard]] bool is_unique() const
    {
        AC_ASSERT(is_valid(), "accessing an empty shared");
        if (!_block->weak.try_lock())
            return false;

        // acquire pairs with the release decrement of strong handles dropped on other threads
        bool const unique = _block->strong.load(std::memory_order_acquire) == 1;
        _block->weak.unlock();
        return unique;
    }

    /// Mutable access to the payload if this is the only handle of any kind, nullptr otherwise
    [[nodiscard]] element_type* get_mut() { return is_unique() ? block::payload(_block) : nullptr; }

    /// Mutable access without checking
    /// The caller guarantees that no other handle accesses the payload concurrently.
    [[nodiscard]] element_type* get_mut_unchecked()
    {
        AC_ASSERT(is_valid(), "accessing an empty shared");
        return block::payload(_block);
    }

    /// Copy-on-write access
    /// - other strong handles exist: the payload is cloned into a fresh block owned by this handle
    /// - only weak handles remain:   the payload is moved into a fresh block, the weak handles stay
    ///                               with the old block and can no longer upgrade
    /// - this is the only handle:    no allocation
    /// The fresh block uses a copy of this block's allocator.
    [[nodiscard]] T& make_mut()
        requires(!is_array && std::is_copy_constructible_v<T> && std::is_copy_constructible_v<A>)
    {
        return *impl_make_mut();
    }

    [[nodiscard]] span<element_type> make_mut()
        requires(is_array && std::is_copy_constructible_v<element_type> && std::is_copy_constructible_v<A>)
    {
        auto* const p = impl_make_mut();
        return span<element_type>(p, block::length(_block));
    }

    /// Returns the payload if this is the only strong handle, otherwise gives the handle back as error
    /// Weak handles do not prevent unwrapping, they can no longer upgrade afterwards.
    [[nodiscard]] result<T, shared> try_unwrap() &&
        requires(!is_array && std::is_move_constructible_v<T>)
    {
        AC_ASSERT(is_valid(), "unwrapping an empty shared");

        auto* const h = _block;
        if (!h->strong.try_take_last())
            return ac::error(ac::move(*this));

        _block = nullptr;
        auto* const p = block::payload(h);
        AC_DEFER
        {
            p->~T();
            block::release_weak(h);
        };
        return ac::move(*p);
    }

    /// Payload and allocator of a successfully unwrapped block
    struct unwrapped
    {
        T value;
        A allocator;
    };

    /// Like try_unwrap, but also hands out a copy of the allocator stored in the block
    /// The block itself stays allocated until the remaining weak handles are gone, so it keeps its own copy.
    [[nodiscard]] result<unwrapped, shared> try_unwrap_with_allocator() &&
        requires(!is_array && std::is_move_constructible_v<T> && std::is_copy_constructible_v<A>)
    {
        AC_ASSERT(is_valid(), "unwrapping an empty shared");

        A alloc = _block->alloc;
        auto r = ac::move(*this).try_unwrap();
        if (r.has_error())
            return ac::error(ac::move(r).error());

        return unwrapped{ac::move(r).value(), ac::move(alloc)};
    }

    // raw pointers
public:
    /// Gives up ownership without decrementing, returns the payload address
    /// The strong count stays incremented until the pointer is passed to from_raw or decrement_strong_count.
    [[nodiscard]] element_type const* into_raw() &&
    {
        AC_ASSERT(is_valid(), "into_raw on an empty shared");
        return block::payload(ac::exchange(_block, nullptr));
    }

    /// Reclaims a handle previously given up via into_raw
    /// ptr must come from into_raw of a shared with the same T and A.
    [[nodiscard]] static shared from_raw(element_type const* ptr)
    {
        AC_ASSERT(ptr != nullptr, "from_raw requires a pointer obtained from into_raw");
        return shared(block::from_payload(ptr));
    }

    /// Increments the strong count of the block behind a pointer from into_raw
    static void increment_strong_count(element_type const* ptr)
    {
        AC_ASSERT(ptr != nullptr, "null payload pointer");
        block::from_payload(ptr)->strong.increment();
    }

    /// Decrements the strong count of the block behind a pointer from into_raw
    /// May destroy the payload and release the block.
    static void decrement_strong_count(element_type const* ptr)
    {
        AC_ASSERT(ptr != nullptr, "null payload pointer");
        block::release_strong(block::from_payload(ptr));
    }

    // comparison
public:
    /// True if both handles refer to the same block
    [[nodiscard]] static bool ptr_eq(shared const& a, shared const& b) { return a._block == b._block; }

    /// Compares the payloads by value
    [[nodiscard]] friend bool operator==(shared const& a, shared const& b)
        requires(!is_array)
    {
        return *a == *b;
    }

    /// Orders the payloads by value
    [[nodiscard]] friend auto operator<=>(shared const& a, shared const& b)
        requires(!is_array && std::three_way_comparable<T>)
    {
        return *a <=> *b;
    }

    // helper
private:
    explicit shared(header* h) : _block(h) {}

    [[nodiscard]] static result<shared_uninit<T, A>, alloc_error> impl_try_create_uninit(A alloc, isize count, bool zeroed)
    {
        auto h = block::allocate(alloc, 1, 1, count);
        if (h.has_error())
            return ac::error(h.error());

        if (zeroed)
            std::memset(block::payload(h.value()), 0, std::size_t(count * ac::element_size<element_type>));

        return shared_uninit<T, A>(h.value());
    }

    template <class F>
    [[nodiscard]] static result<shared, alloc_error> impl_try_create_array(A alloc, isize count, F&& fill)
    {
        auto h = block::allocate(alloc, 1, 1, count);
        if (h.has_error())
            return ac::error(h.error());

        header* const hdr = h.value();
        auto* const start = block::payload(hdr);
        auto* end = start;
        bool constructed = false;
        AC_DEFER
        {
            if (!constructed)
            {
                impl::destroy_objects_in_reverse(start, end);
                block::deallocate(hdr);
            }
        };

        fill(end);
        AC_ASSERT(end == start + count, "array payload not completely initialized");
        constructed = true;
        return shared(hdr);
    }

    [[nodiscard]] static shared impl_clone_into_new_block(header* h)
    {
        if constexpr (is_array)
            return create_copy_of(span<element_type const>(block::payload(h), block::length(h)), A(h->alloc));
        else
            return create_in(A(h->alloc), static_cast<T const&>(*block::payload(h)));
    }

    [[nodiscard]] static shared impl_move_into_new_block(header* h)
    {
        auto* const src = block::payload(h);
        if constexpr (is_array)
        {
            auto const count = block::length(h);
            return impl::value_or_abort(impl_try_create_array(A(h->alloc), count, [&](element_type*& end)
                                                              { impl::move_create_objects_to(end, src, src + count); }));
        }
        else
        {
            return create_in(A(h->alloc), ac::move(*src));
        }
    }

    element_type* impl_make_mut()
    {
        AC_ASSERT(is_valid(), "make_mut on an empty shared");

        auto* const h = _block;
        if (!h->strong.try_claim_unique())
        {
            // other strong handles exist
            *this = impl_clone_into_new_block(h);
        }
        else if (h->weak.load_state(std::memory_order_relaxed).count != 1)
        {
            // strong is 0 now, so weak handles can no longer upgrade
            bool moved = false;
            AC_DEFER
            {
                if (!moved)
                    h->strong.restore_unique();
            };

            auto fresh = impl_move_into_new_block(h);
            moved = true;

            block::destroy_payload(h);
            _block = ac::exchange(fresh._block, nullptr);
            block::release_weak(h);
        }
        else
        {
            // no other handle of any kind
            h->strong.restore_unique();
        }

        return block::payload(_block);
    }

    // members
private:
    header* _block = nullptr;

    template <class, class>
    friend struct ac::weak;
    template <class, class>
    friend struct ac::shared_uninit;
};

template <class T, class A>
struct ac::weak
{
public:
    using element_type = std::remove_extent_t<T>;

private:
    using block = impl::shared_block<T, A>;
    using header = typename block::header;

    // handle lifecycle
public:
    /// Empty weak handle: allocates nothing, never upgrades
    weak() = default;

    weak(weak const& rhs) : _block(rhs._block)
    {
        if (_block)
            _block->weak.increment();
    }

    weak(weak&& rhs) noexcept : _block(ac::exchange(rhs._block, nullptr)) {}

    weak& operator=(weak const& rhs)
    {
        if (this != &rhs)
        {
            if (rhs._block)
                rhs._block->weak.increment();

            auto* const old = ac::exchange(_block, rhs._block);
            if (old)
                block::release_weak(old);
        }
        return *this;
    }

    weak& operator=(weak&& rhs) noexcept
    {
        if (this != &rhs)
        {
            auto* const old = ac::exchange(_block, ac::exchange(rhs._block, nullptr));
            if (old)
                block::release_weak(old);
        }
        return *this;
    }

    ~weak()
    {
        if (_block)
            block::release_weak(_block);
    }

    // upgrade
public:
    /// A new strong handle if the value is still alive, nullopt otherwise
    [[nodiscard]] optional<shared<T, A>> upgrade() const
    {
        if (!_block || !_block->strong.try_increment_if_live())
            return nullopt;

        return shared<T, A>(_block);
    }

    // queries
public:
    /// True for default-constructed or moved-from handles
    [[nodiscard]] bool is_empty() const { return _block == nullptr; }

    /// Number of strong handles, 0 if empty or the value is gone
    [[nodiscard]] isize strong_count() const { return _block ? isize(_block->strong.load()) : 0; }

    /// Number of weak handles, 0 if empty or the value is gone
    /// Concurrent changes can make the result off by one.
    [[nodiscard]] isize weak_count() const
    {
        if (!_block)
            return 0;

        auto const w = _block->weak.load_state();
        auto const strong = _block->strong.load();
        if (strong == 0)
            return 0;

        // a strong handle exists, so the implicit unit is included in the count
        return isize(w.count) - 1;
    }

    /// Allocator stored inside the block, also available after the payload is gone
    [[nodiscard]] A const& allocator() const
    {
        AC_ASSERT(!is_empty(), "accessing the allocator of an empty weak");
        return _block->alloc;
    }

    /// Payload address, nullptr for an empty handle
    /// The payload may already be destroyed, so the pointer must not be dereferenced without upgrading.
    [[nodiscard]] element_type const* as_ptr() const { return _block ? block::payload(_block) : nullptr; }

    // raw pointers
public:
    /// Gives up ownership of the weak unit, nullptr for an empty handle
    [[nodiscard]] element_type const* into_raw() &&
    {
        if (!_block)
            return nullptr;
        return block::payload(ac::exchange(_block, nullptr));
    }

    /// Reclaims a handle previously given up via into_raw, nullptr yields an empty handle
    [[nodiscard]] static weak from_raw(element_type const* ptr)
    {
        if (!ptr)
            return weak();
        return weak(block::from_payload(ptr));
    }

    // comparison
public:
    /// True if both refer to the same block, or both are empty
    [[nodiscard]] static bool ptr_eq(weak const& a, weak const& b) { return a._block == b._block; }

    // helper
private:
    explicit weak(header* h) : _block(h) {}

    // members
private:
    header* _block = nullptr;

    template <class, class>
    friend struct ac::shared;
};

/// Unique handle to a freshly allocated shared block whose payload is not constructed yet
/// Produced by shared<T, A>::create_uninit / create_zeroed. No weak handle can exist for it.
///
///   auto u = ac::shared<int[]>::create_uninit(3);
///   for (auto i = 0; i < 3; ++i)
///       new (ac::placement_new, u.data() + i) int(i);
///   ac::shared<int[]> s = ac::move(u).assume_init();
///
/// Dropping it without assume_init releases the block and runs no destructors.
template <class T, class A>
struct ac::shared_uninit
{
public:
    using element_type = std::remove_extent_t<T>;

private:
    using block = impl::shared_block<T, A>;
    using header = typename block::header;

public:
    shared_uninit(shared_uninit&& rhs) noexcept : _block(ac::exchange(rhs._block, nullptr)) {}
    shared_uninit& operator=(shared_uninit&& rhs) noexcept
    {
        if (this != &rhs)
        {
            impl_release();
            _block = ac::exchange(rhs._block, nullptr);
        }
        return *this;
    }
    shared_uninit(shared_uninit const&) = delete;
    shared_uninit& operator=(shared_uninit const&) = delete;

    ~shared_uninit() { impl_release(); }

    // access
public:
    /// Storage of the first element; the memory is zero for create_zeroed and indeterminate otherwise
    [[nodiscard]] element_type* data()
    {
        AC_ASSERT(_block != nullptr, "accessing a consumed shared_uninit");
        return block::payload(_block);
    }

    /// Number of element slots
    [[nodiscard]] isize size() const
    {
        AC_ASSERT(_block != nullptr, "accessing a consumed shared_uninit");
        return block::length(_block);
    }

    // publishing
public:
    /// Precondition: every element slot holds a live object
    /// (for create_zeroed with implicit-lifetime element types the zero bytes already qualify).
    [[nodiscard]] shared<T, A> assume_init() &&
    {
        AC_ASSERT(_block != nullptr, "assume_init on a consumed shared_uninit");
        return shared<T, A>(ac::exchange(_block, nullptr));
    }

    /// Constructs the value from args and publishes it
    /// If the constructor throws, the block is released.
    template <class... Args>
        requires(!std::is_unbounded_array_v<T> && std::is_constructible_v<T, Args && ...>)
    [[nodiscard]] shared<T, A> write(Args&&... args) &&
    {
        new (ac::placement_new, data()) T(ac::forward<Args>(args)...);
        return ac::move(*this).assume_init();
    }

    // helper
private:
    explicit shared_uninit(header* h) : _block(h) {}

    void impl_release()
    {
        if (_block)
            block::deallocate(ac::exchange(_block, nullptr));
    }

    // members
private:
    header* _block = nullptr;

    template <class, class>
    friend struct ac::shared;
};

namespace std
{
/// Hashes the payload, consistent with operator== on ac::shared
template <class T, class A>
    requires(!std::is_unbounded_array_v<T> && requires(T const& v) { std::hash<T>{}(v); })
struct hash<ac::shared<T, A>>
{
    [[nodiscard]] std::size_t operator()(ac::shared<T, A> const& s) const { return std::hash<T>{}(*s); }
};
} // namespace std
