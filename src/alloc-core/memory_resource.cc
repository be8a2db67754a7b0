#include "memory_resource.hh"

#include <alloc-core/assert.hh>
#include <alloc-core/macros.hh>

#include <cstdlib>
#include <cstring>

#ifdef AC_OS_WINDOWS
#include <malloc.h>
#endif

namespace
{
// Static function implementations for the system memory resource.
// These ignore the userdata parameter as the system allocator is stateless.

/// alignment that malloc/realloc guarantee without an aligned entry point
constexpr ac::isize fundamental_alignment = alignof(std::max_align_t);

ac::byte* system_try_allocate_bytes(ac::isize bytes, ac::isize alignment, void* userdata)
{
    AC_UNUSED(userdata);

    AC_ASSERT(bytes > 0, "the system resource is never asked for zero bytes");
    AC_ASSERT(alignment > 0 && ac::is_power_of_two(alignment), "alignment must be a power of 2");

#ifdef AC_OS_WINDOWS
    return static_cast<ac::byte*>(_aligned_malloc(bytes, alignment));
#else
    // posix_memalign instead of std::aligned_alloc avoids the bytes % alignment == 0 requirement
    // posix_memalign requires alignment >= sizeof(void*), so we clamp to that minimum
    void* raw_ptr = nullptr;
    ac::isize effective_alignment = alignment < ac::isize(sizeof(void*)) ? ac::isize(sizeof(void*)) : alignment;
    int result = posix_memalign(&raw_ptr, effective_alignment, bytes);
    return result == 0 ? static_cast<ac::byte*>(raw_ptr) : nullptr;
#endif
}

void system_deallocate_bytes(ac::byte* p, ac::isize bytes, ac::isize alignment, void* userdata)
{
    AC_UNUSED(bytes);
    AC_UNUSED(alignment);
    AC_UNUSED(userdata);

    // _aligned_malloc requires _aligned_free, posix_memalign pairs with free
#ifdef AC_OS_WINDOWS
    _aligned_free(p);
#else
    std::free(p);
#endif
}

ac::byte* system_try_reallocate_bytes(ac::byte* p, ac::isize old_bytes, ac::isize new_bytes, ac::isize alignment, void* userdata)
{
    AC_ASSERT(p != nullptr, "cannot reallocate a null block");
    AC_ASSERT(old_bytes > 0 && new_bytes > 0, "block sizes must be positive");

#ifdef AC_OS_WINDOWS
    AC_UNUSED(old_bytes);
    AC_UNUSED(userdata);
    return static_cast<ac::byte*>(_aligned_realloc(p, new_bytes, alignment));
#else
    // realloc only preserves fundamental alignment
    if (alignment <= fundamental_alignment)
        return static_cast<ac::byte*>(std::realloc(p, new_bytes));

    auto* new_p = system_try_allocate_bytes(new_bytes, alignment, userdata);
    if (new_p == nullptr)
        return nullptr;

    std::memcpy(new_p, p, old_bytes < new_bytes ? old_bytes : new_bytes);
    system_deallocate_bytes(p, old_bytes, alignment, userdata);
    return new_p;
#endif
}

/// System memory resource instance stored in the data segment.
/// Standard malloc does not support in-place growth, so try_grow_bytes_in_place stays null.
constinit ac::memory_resource const system_memory_resource = {
    .try_allocate_bytes = system_try_allocate_bytes,
    .deallocate_bytes = system_deallocate_bytes,
    .try_grow_bytes_in_place = nullptr,
    .try_reallocate_bytes = system_try_reallocate_bytes,
    .userdata = nullptr,
};

} // namespace

constinit ac::memory_resource const* const ac::default_memory_resource = &system_memory_resource;
