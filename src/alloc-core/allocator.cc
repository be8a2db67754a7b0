#include "allocator.hh"

#include <alloc-core/assert.hh>

#include <cstring>

static_assert(ac::allocator<ac::resource_allocator>);
static_assert(ac::allocator<ac::default_allocator>);

ac::result<ac::byte*, ac::alloc_error> ac::resource_allocator::allocate(layout l) const
{
    AC_ASSERT(l.size > 0, "allocators are never asked for zero-size blocks");

    auto const& res = resource();
    auto* p = res.try_allocate_bytes(l.size, l.alignment, res.userdata);
    if (p == nullptr)
        return ac::error(alloc_error::allocation_failure(l));

    return p;
}

void ac::resource_allocator::deallocate(byte* p, layout l) const
{
    AC_ASSERT(p != nullptr, "cannot deallocate a null block");

    auto const& res = resource();
    res.deallocate_bytes(p, l.size, l.alignment, res.userdata);
}

bool ac::resource_allocator::try_grow_in_place(byte* p, layout old_layout, isize new_size) const
{
    AC_ASSERT(p != nullptr, "cannot grow a null block");
    AC_ASSERT(new_size >= old_layout.size, "try_grow_in_place cannot shrink");

    auto const& res = resource();
    if (res.try_grow_bytes_in_place == nullptr)
        return false;

    return res.try_grow_bytes_in_place(p, old_layout.size, new_size, old_layout.alignment, res.userdata);
}

ac::result<ac::byte*, ac::alloc_error> ac::resource_allocator::reallocate(byte* p, layout old_layout, isize new_size) const
{
    AC_ASSERT(p != nullptr, "cannot reallocate a null block");
    AC_ASSERT(new_size > 0, "allocators are never asked for zero-size blocks");

    auto const new_layout = layout{new_size, old_layout.alignment};
    auto const& res = resource();

    if (res.try_reallocate_bytes != nullptr)
    {
        auto* new_p = res.try_reallocate_bytes(p, old_layout.size, new_size, old_layout.alignment, res.userdata);
        if (new_p == nullptr)
            return ac::error(alloc_error::allocation_failure(new_layout));
        return new_p;
    }

    // resource without a realloc entry point: allocate, copy, free
    auto* new_p = res.try_allocate_bytes(new_size, old_layout.alignment, res.userdata);
    if (new_p == nullptr)
        return ac::error(alloc_error::allocation_failure(new_layout));

    std::memcpy(new_p, p, old_layout.size < new_size ? old_layout.size : new_size);
    res.deallocate_bytes(p, old_layout.size, old_layout.alignment, res.userdata);
    return new_p;
}
