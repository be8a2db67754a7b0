#pragma once

#include <alloc-core/fwd.hh>
#include <alloc-core/utility.hh>

// ac::memory_resource is the type-erased bottom layer of the allocator abstraction.
//
// It is a POD struct of function pointers plus a userdata pointer:
// - no virtual dispatch, no non-trivial constructors, safe to define as constinit globals
// - stateful resources put their state behind userdata
// - ac::resource_allocator adapts a resource to the ac::allocator concept (see <alloc-core/allocator.hh>)
//
// A null resource pointer in resource_allocator means "use ac::default_memory_resource".
//
// Contracts shared by all entry points:
// - bytes > 0 and alignment is a power of two (consumers never request zero-size blocks)
// - deallocate / grow / reallocate receive exactly the bytes and alignment the block currently has
// - failure is reported by a null / false return and leaves the block and resource state unchanged

namespace ac
{
/// System allocator stored in the data segment
/// Valid during static initialization in other translation units.
extern ac::memory_resource const* const default_memory_resource;
} // namespace ac

/// Polymorphic memory resource interface powering ac::resource_allocator
struct ac::memory_resource
{
    /// Allocate `bytes` with at least `alignment` alignment.
    /// Returns nullptr if the request cannot be satisfied.
    ac::function_ptr<byte*(isize bytes, isize alignment, void* userdata)> try_allocate_bytes = nullptr;

    /// Deallocate a block previously obtained from this resource with matching bytes and alignment.
    /// Must not fail.
    ac::function_ptr<void(byte* p, isize bytes, isize alignment, void* userdata)> deallocate_bytes = nullptr;

    /// Attempt to grow an existing block in place to `new_bytes` without moving it.
    /// Success: the block stays at `p`, old contents are preserved, new_bytes becomes its canonical size.
    /// Failure (false): the block is unchanged.
    /// May be nullptr, which means "in-place growth is never possible".
    ac::function_ptr<bool(byte* p, isize old_bytes, isize new_bytes, isize alignment, void* userdata)> try_grow_bytes_in_place
        = nullptr;

    /// Resize a block to `new_bytes`, moving it if necessary (grow or shrink).
    /// Success: returns the new block, the first min(old_bytes, new_bytes) bytes are preserved,
    ///          the old block must no longer be used.
    /// Failure: returns nullptr, the old block stays valid and unchanged.
    /// May be nullptr, in which case callers allocate a new block, copy, and free the old one.
    ac::function_ptr<byte*(byte* p, isize old_bytes, isize new_bytes, isize alignment, void* userdata)> try_reallocate_bytes
        = nullptr;

    /// User-defined data for custom resources. Can be nullptr for stateless resources.
    void* userdata = nullptr;
};
