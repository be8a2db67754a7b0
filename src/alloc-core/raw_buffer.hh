#pragma once

#include <alloc-core/alloc_error.hh>
#include <alloc-core/allocator.hh>
#include <alloc-core/assert.hh>
#include <alloc-core/fixed_block.hh>
#include <alloc-core/fwd.hh>
#include <alloc-core/layout.hh>
#include <alloc-core/macros.hh>
#include <alloc-core/result.hh>
#include <alloc-core/utility.hh>

#include <cstring>
#include <limits>
#include <type_traits>

// ac::raw_buffer<T, A> owns exactly one contiguous block sized for `capacity` elements of T.
//
// It is the storage layer of growable containers: the container tracks how many slots are in use
// and asks the buffer for room; the buffer does all capacity arithmetic (overflow-checked) and talks
// to the allocator. It never constructs, moves, or destroys elements: destroying a raw_buffer
// releases the block and nothing else. Moving elements out before shrinking is the owner's job.
//
// Member layout:
// - T* _ptr          block start; nullptr when empty, a dangling aligned address for zero-sized T
// - isize _capacity  number of T slots in the block (stored value, see capacity() for zero-sized T)
// - A _alloc         allocator instance, owned by value
//
// Zero-sized T (see ac::is_zero_sized) never allocate. capacity() reports isize max so that
// "used + extra" checks of the owner still detect overflow, and every growth request that gets
// past the "already enough room" check is necessarily a capacity overflow.
//
// Every growth operation exists twice:
// - try_xyz(...) returns result<..., alloc_error> and leaves the buffer unchanged on failure
// - xyz(...)     calls ac::handle_reserve_error on failure (capacity overflow or allocation failure)
//
// Growth strategies:
// - reserve(used, extra)          amortized: new capacity = max(2 * capacity, used + extra)
// - reserve_exact(used, extra)    exact:     new capacity = used + extra
// - reserve_in_place(used, extra) amortized, but only if the allocator can extend the block without moving it
// - double_capacity()             push fast path: 0 -> 4 (or 1 for huge T), otherwise 2 * capacity
// - shrink_to_fit(amount)         shrink to exactly amount slots, amount == 0 releases the block
//
// Usage:
//   auto buf = ac::raw_buffer<int>();
//   buf.reserve(0, 5);                  // capacity() == 5
//   new (ac::placement_new, buf.data() + 0) int(1);
//   ...
//   buf.reserve(5, 1);                  // capacity() == 10

template <class T, class A>
struct ac::raw_buffer
{
    static_assert(ac::allocator<A>, "raw_buffer requires an allocator");
    static_assert(!std::is_reference_v<T> && !std::is_const_v<T>, "raw_buffer stores non-const object types");

    // construction
public:
    /// Empty buffer without a block: capacity() == 0 (isize max for zero-sized T)
    raw_buffer()
        requires std::is_default_constructible_v<A>
      : raw_buffer(A{})
    {
    }

    explicit raw_buffer(A alloc) : _ptr(impl::empty_ptr<T>()), _alloc(ac::move(alloc)) {}

    /// Buffer with room for exactly `capacity` elements
    /// Fails with capacity_overflow if capacity * sizeof(T) is not addressable
    [[nodiscard]] static result<raw_buffer, alloc_error> try_create_with_capacity(isize capacity, A alloc = A{})
    {
        return impl_allocate_in(capacity, false, ac::move(alloc));
    }
    [[nodiscard]] static raw_buffer create_with_capacity(isize capacity, A alloc = A{})
    {
        return impl::value_or_abort(impl_allocate_in(capacity, false, ac::move(alloc)));
    }

    /// Like create_with_capacity, but every byte of the block is zero
    [[nodiscard]] static result<raw_buffer, alloc_error> try_create_with_capacity_zeroed(isize capacity, A alloc = A{})
    {
        return impl_allocate_in(capacity, true, ac::move(alloc));
    }
    [[nodiscard]] static raw_buffer create_with_capacity_zeroed(isize capacity, A alloc = A{})
    {
        return impl::value_or_abort(impl_allocate_in(capacity, true, ac::move(alloc)));
    }

    /// Adopts a block of `capacity` elements allocated by `alloc` with layout::array_of<T>(capacity).
    /// capacity == 0 means there is no block (ptr is then ignored).
    [[nodiscard]] static raw_buffer from_raw_parts(T* ptr, isize capacity, A alloc)
    {
        AC_ASSERT(capacity >= 0, "capacity must be non-negative");
        raw_buffer b(ac::move(alloc));
        b._capacity = capacity;
        if (!ac::is_zero_sized<T> && capacity != 0)
        {
            AC_ASSERT(ptr != nullptr, "a non-empty block needs a pointer");
            b._ptr = ptr;
        }
        return b;
    }

    /// Takes over the block of a fixed_block, capacity becomes its size
    explicit raw_buffer(fixed_block<T, A>&& block)
      : _ptr(ac::exchange(block._ptr, impl::empty_ptr<T>())),
        _capacity(ac::exchange(block._size, 0)),
        _alloc(ac::move(block._alloc))
    {
    }

    raw_buffer(raw_buffer&& rhs) noexcept
      : _ptr(ac::exchange(rhs._ptr, impl::empty_ptr<T>())),
        _capacity(ac::exchange(rhs._capacity, 0)),
        _alloc(ac::move(rhs._alloc))
    {
    }

    raw_buffer& operator=(raw_buffer&& rhs) noexcept
    {
        if (this != &rhs)
        {
            impl_deallocate();
            _ptr = ac::exchange(rhs._ptr, impl::empty_ptr<T>());
            _capacity = ac::exchange(rhs._capacity, 0);
            _alloc = ac::move(rhs._alloc);
        }
        return *this;
    }

    raw_buffer(raw_buffer const&) = delete;
    raw_buffer& operator=(raw_buffer const&) = delete;

    /// Releases the block. Element destructors are NOT run.
    ~raw_buffer() { impl_deallocate(); }

    // queries
public:
    /// Number of element slots; isize max for zero-sized T
    [[nodiscard]] isize capacity() const
    {
        if constexpr (ac::is_zero_sized<T>)
            return ac::max_isize;
        else
            return _capacity;
    }

    /// Start of the block; nullptr for an empty buffer of sized T, dangling for zero-sized T
    [[nodiscard]] T* data() const { return _ptr; }

    /// True if the buffer currently owns allocator memory
    [[nodiscard]] bool has_block() const { return !ac::is_zero_sized<T> && _capacity != 0; }

    [[nodiscard]] A const& allocator() const { return _alloc; }
    [[nodiscard]] A& allocator() { return _alloc; }

    // amortized growth
public:
    /// Ensures room for used + extra elements, growing to max(2 * capacity, used + extra) if needed.
    /// No-op if capacity - used >= extra.
    /// Preconditions: 0 <= used <= capacity(), extra >= 0
    [[nodiscard]] result<void, alloc_error> try_reserve(isize used, isize extra)
    {
        return impl_reserve(used, extra, reserve_strategy::amortized);
    }
    void reserve(isize used, isize extra) { impl::value_or_abort(impl_reserve(used, extra, reserve_strategy::amortized)); }

    // exact growth
public:
    /// Ensures room for used + extra elements, growing to exactly used + extra if needed.
    /// Preconditions: 0 <= used <= capacity(), extra >= 0
    [[nodiscard]] result<void, alloc_error> try_reserve_exact(isize used, isize extra)
    {
        return impl_reserve(used, extra, reserve_strategy::exact);
    }
    void reserve_exact(isize used, isize extra) { impl::value_or_abort(impl_reserve(used, extra, reserve_strategy::exact)); }

    // in-place growth
public:
    /// Attempts an amortized reserve that extends the current block without moving it.
    /// Returns true if the capacity grew. Returns false if there was already enough room,
    /// if there is no block to extend, or if the allocator cannot grow the block in place.
    /// Only fails on capacity overflow.
    [[nodiscard]] result<bool, alloc_error> try_reserve_in_place(isize used, isize extra)
    {
        impl_check_used_extra(used, extra);

        if (capacity() - used >= extra)
            return false;

        if (!has_block())
            return false;

        isize new_cap = 0;
        if (!impl_amortized_capacity(used, extra, new_cap))
            return ac::error(alloc_error::capacity_overflow());

        auto const new_layout = layout::array_of<T>(new_cap);
        if (new_layout.has_error())
            return ac::error(new_layout.error());

        if (!_alloc.try_grow_in_place(impl_block(), impl_current_layout(), new_layout.value().size))
            return false;

        _capacity = new_cap;
        return true;
    }
    [[nodiscard]] bool reserve_in_place(isize used, isize extra) { return impl::value_or_abort(try_reserve_in_place(used, extra)); }

    // doubling
public:
    /// Grows capacity for the single-element push path.
    /// From empty: 4 slots (1 if sizeof(T) exceeds an eighth of the address space).
    /// Otherwise: 2 * capacity.
    /// Zero-sized T always fail with capacity_overflow (capacity is already unbounded).
    [[nodiscard]] result<void, alloc_error> try_double_capacity()
    {
        if constexpr (ac::is_zero_sized<T>)
            return ac::error(alloc_error::capacity_overflow());

        if (has_block())
        {
            isize new_cap = 0;
            if (!impl::checked_mul(_capacity, 2, new_cap))
                return ac::error(alloc_error::capacity_overflow());

            return impl_finish_grow(new_cap);
        }

        constexpr auto eighth_of_address_space = isize(std::numeric_limits<std::uintptr_t>::max() / 8);
        return impl_finish_grow(isize(sizeof(T)) > eighth_of_address_space ? 1 : 4);
    }
    void double_capacity() { impl::value_or_abort(try_double_capacity()); }

    /// Doubles the capacity by extending the block in place.
    /// Returns false if there is no block or the allocator cannot grow it without moving.
    [[nodiscard]] result<bool, alloc_error> try_double_capacity_in_place()
    {
        if (!has_block())
            return false;

        isize new_cap = 0;
        if (!impl::checked_mul(_capacity, 2, new_cap))
            return ac::error(alloc_error::capacity_overflow());

        auto const new_layout = layout::array_of<T>(new_cap);
        if (new_layout.has_error())
            return ac::error(new_layout.error());

        if (!_alloc.try_grow_in_place(impl_block(), impl_current_layout(), new_layout.value().size))
            return false;

        _capacity = new_cap;
        return true;
    }
    [[nodiscard]] bool double_capacity_in_place() { return impl::value_or_abort(try_double_capacity_in_place()); }

    // shrinking
public:
    /// Shrinks the block to exactly `amount` slots. amount == 0 releases the block.
    /// Fails with capacity_overflow if amount > capacity().
    [[nodiscard]] result<void, alloc_error> try_shrink_to_fit(isize amount)
    {
        AC_ASSERT(amount >= 0, "shrink amount must be non-negative");

        if (amount > capacity())
            return ac::error(alloc_error::capacity_overflow());

        if constexpr (ac::is_zero_sized<T>)
        {
            _capacity = amount;
            return ac::success;
        }

        if (amount == 0)
        {
            impl_deallocate();
            _ptr = impl::empty_ptr<T>();
            _capacity = 0;
            return ac::success;
        }

        if (amount == _capacity)
            return ac::success;

        // amount < _capacity, so the byte size cannot overflow
        auto const new_size = amount * isize(sizeof(T));
        auto new_block = _alloc.reallocate(impl_block(), impl_current_layout(), new_size);
        if (new_block.has_error())
            return ac::error(new_block.error());

        _ptr = reinterpret_cast<T*>(new_block.value());
        _capacity = amount;
        return ac::success;
    }

    /// Infallible shrink. Shrinking to a larger capacity is a programmer error.
    void shrink_to_fit(isize amount)
    {
        AC_ASSERT_ALWAYS(amount <= capacity(), "tried to shrink to a larger capacity");
        impl::value_or_abort(try_shrink_to_fit(amount));
    }

    // conversion
public:
    /// Transfers the block into a fixed_block of capacity() slots (the stored capacity for zero-sized T).
    /// The buffer is left empty.
    [[nodiscard]] fixed_block<T, A> into_fixed_block() &&
    {
        auto block = fixed_block<T, A>(ac::move(_alloc));
        block._ptr = ac::exchange(_ptr, impl::empty_ptr<T>());
        block._size = ac::exchange(_capacity, 0);
        return block;
    }

    // helper
private:
    enum class reserve_strategy
    {
        exact,
        amortized,
    };

    [[nodiscard]] byte* impl_block() const { return reinterpret_cast<byte*>(_ptr); }

    /// Layout of the current block; only valid if has_block()
    [[nodiscard]] layout impl_current_layout() const
    {
        AC_ASSERT(has_block(), "buffer has no block");
        return layout{_capacity * isize(sizeof(T)), isize(alignof(T))};
    }

    void impl_check_used_extra(isize used, isize extra) const
    {
        AC_ASSERT(used >= 0 && extra >= 0, "used and extra must be non-negative");
        AC_ASSERT(used <= capacity(), "used must not exceed the capacity");
        AC_UNUSED(used);
        AC_UNUSED(extra);
    }

    /// max(2 * capacity, used + extra), false if used + extra overflows
    [[nodiscard]] bool impl_amortized_capacity(isize used, isize extra, isize& new_cap) const
    {
        isize required = 0;
        if (!impl::checked_add(used, extra, required))
            return false;

        // saturating: a doubled capacity beyond isize is rejected by layout::array_of anyway
        auto const doubled = _capacity > ac::max_isize / 2 ? ac::max_isize : 2 * _capacity;
        new_cap = ac::max(doubled, required);
        return true;
    }

    [[nodiscard]] result<void, alloc_error> impl_reserve(isize used, isize extra, reserve_strategy strategy)
    {
        impl_check_used_extra(used, extra);

        // also covers zero-sized T: their capacity is unbounded, so getting past this
        // check means used + extra overflows and we report that below
        if (capacity() - used >= extra)
            return ac::success;

        isize new_cap = 0;
        if (strategy == reserve_strategy::exact)
        {
            if (!impl::checked_add(used, extra, new_cap))
                return ac::error(alloc_error::capacity_overflow());
        }
        else
        {
            if (!impl_amortized_capacity(used, extra, new_cap))
                return ac::error(alloc_error::capacity_overflow());
        }

        if constexpr (ac::is_zero_sized<T>)
            return ac::error(alloc_error::capacity_overflow());

        return impl_finish_grow(new_cap);
    }

    /// Allocates (from empty) or reallocates the block to new_cap slots
    [[nodiscard]] result<void, alloc_error> impl_finish_grow(isize new_cap)
    {
        auto const new_layout = layout::array_of<T>(new_cap);
        if (new_layout.has_error())
            return ac::error(new_layout.error());

        auto new_block = has_block() ? _alloc.reallocate(impl_block(), impl_current_layout(), new_layout.value().size)
                                     : _alloc.allocate(new_layout.value());
        if (new_block.has_error())
            return ac::error(new_block.error());

        _ptr = reinterpret_cast<T*>(new_block.value());
        _capacity = new_cap;
        return ac::success;
    }

    [[nodiscard]] static result<raw_buffer, alloc_error> impl_allocate_in(isize capacity, bool zeroed, A alloc)
    {
        AC_ASSERT(capacity >= 0, "capacity must be non-negative");

        raw_buffer b(ac::move(alloc));

        if constexpr (ac::is_zero_sized<T>)
        {
            b._capacity = capacity;
            return b;
        }

        auto const l = layout::array_of<T>(capacity);
        if (l.has_error())
            return ac::error(l.error());

        if (l.value().size == 0)
            return b;

        auto block = b._alloc.allocate(l.value());
        if (block.has_error())
            return ac::error(block.error());

        if (zeroed)
            std::memset(block.value(), 0, l.value().size);

        b._ptr = reinterpret_cast<T*>(block.value());
        b._capacity = capacity;
        return b;
    }

    void impl_deallocate()
    {
        if (has_block())
            _alloc.deallocate(impl_block(), impl_current_layout());
    }

    // members
private:
    T* _ptr;
    isize _capacity = 0;
    AC_NO_UNIQUE_ADDRESS A _alloc;
};
