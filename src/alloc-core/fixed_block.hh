#pragma once

#include <alloc-core/allocator.hh>
#include <alloc-core/fwd.hh>
#include <alloc-core/layout.hh>
#include <alloc-core/macros.hh>
#include <alloc-core/span.hh>
#include <alloc-core/utility.hh>

#include <type_traits>

/// Owning handle for a fixed number of uninitialized T slots obtained from an allocator.
///
/// This is what a raw_buffer turns into once its capacity is final (raw_buffer::into_fixed_block),
/// and what a raw_buffer can be rebuilt from (raw_buffer(fixed_block&&)).
/// Like raw_buffer it never constructs or destroys elements: the destructor only releases the block.
///
/// For zero-sized T the block has no backing memory and data() is a dangling, aligned address.
template <class T, class A>
struct ac::fixed_block
{
    static_assert(ac::allocator<A>, "fixed_block requires an allocator");

    // construction
public:
    fixed_block()
        requires std::is_default_constructible_v<A>
      : fixed_block(A{})
    {
    }

    explicit fixed_block(A alloc) : _ptr(impl::empty_ptr<T>()), _alloc(ac::move(alloc)) {}

    /// Adopts a block of `size` slots previously allocated by `alloc` with layout::array_of<T>(size).
    /// Ownership transfers to the fixed_block.
    [[nodiscard]] static fixed_block from_raw_parts(T* ptr, isize size, A alloc)
    {
        AC_ASSERT(size >= 0, "size must be non-negative");
        fixed_block b(ac::move(alloc));
        b._ptr = ptr;
        b._size = size;
        return b;
    }

    fixed_block(fixed_block&& rhs) noexcept
      : _ptr(ac::exchange(rhs._ptr, impl::empty_ptr<T>())), _size(ac::exchange(rhs._size, 0)), _alloc(ac::move(rhs._alloc))
    {
    }

    fixed_block& operator=(fixed_block&& rhs) noexcept
    {
        if (this != &rhs)
        {
            impl_deallocate();
            _ptr = ac::exchange(rhs._ptr, impl::empty_ptr<T>());
            _size = ac::exchange(rhs._size, 0);
            _alloc = ac::move(rhs._alloc);
        }
        return *this;
    }

    fixed_block(fixed_block const&) = delete;
    fixed_block& operator=(fixed_block const&) = delete;

    ~fixed_block() { impl_deallocate(); }

    // access
public:
    [[nodiscard]] T* data() const { return _ptr; }
    [[nodiscard]] isize size() const { return _size; }
    [[nodiscard]] bool empty() const { return _size == 0; }

    /// View over all slots. The slots are uninitialized unless the owner constructed objects in them.
    [[nodiscard]] span<T> slots() const { return span<T>(_ptr, _size); }

    [[nodiscard]] A const& allocator() const { return _alloc; }

    // helper
private:
    [[nodiscard]] bool impl_has_block() const { return !ac::is_zero_sized<T> && _size != 0; }

    void impl_deallocate()
    {
        if (impl_has_block())
            _alloc.deallocate(reinterpret_cast<byte*>(_ptr), layout{_size * isize(sizeof(T)), isize(alignof(T))});
    }

    // members
private:
    T* _ptr;
    isize _size = 0;
    AC_NO_UNIQUE_ADDRESS A _alloc;

    template <class, class>
    friend struct ac::raw_buffer;
};
