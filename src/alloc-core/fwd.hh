#pragma once

#include <cstddef>
#include <cstdint>


namespace ac
{

//
// Primitives
//

// signed integers
using i8 = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

// unsigned integers
using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

// generic bytes
using byte = std::byte;

// signed size type
// Sizes, capacities, counts and offsets are signed i64 throughout.
// Subtractions such as "capacity - used" stay meaningful instead of silently wrapping,
// and the half of the range we give up is exactly the addressable-range guard we want anyway:
// no block can ever be larger than isize max bytes.
// Reference counters are the exception: they are unsigned atomics whose top value is a reserved sentinel.
using isize = i64;

// pointer
using nullptr_t = std::nullptr_t;

//
// Memory
//

struct layout;
struct layout_extension;
enum class alloc_error_kind : u8;
struct alloc_error;
struct memory_resource;
struct resource_allocator;
template <class A>
struct abort_on_failure;

using default_allocator = abort_on_failure<resource_allocator>;

template <class T, class A = default_allocator>
struct raw_buffer;
template <class T, class A = default_allocator>
struct fixed_block;

template <class T, class A = default_allocator>
struct shared;
template <class T, class A = default_allocator>
struct weak;
template <class T, class A = default_allocator>
struct shared_uninit;

//
// Views
//

template <class T>
struct span;

//
// Sum types
//

struct nullopt_t;
template <class T>
struct optional;

template <class E>
struct error_value;
template <class T, class E>
struct result;

} // namespace ac
