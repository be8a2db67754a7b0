#pragma once

#include <cstdint>

// =========================================================================================================
// Compiler detection
// =========================================================================================================
// Conditionally defined: AC_COMPILER_MSVC, AC_COMPILER_CLANG, AC_COMPILER_GCC, AC_COMPILER_POSIX

#if defined(_MSC_VER)
#define AC_COMPILER_MSVC
#elif defined(__clang__)
#define AC_COMPILER_CLANG
#elif defined(__GNUC__)
#define AC_COMPILER_GCC
#else
#error "Unknown compiler"
#endif

#if defined(AC_COMPILER_CLANG) || defined(AC_COMPILER_GCC)
#define AC_COMPILER_POSIX
#endif

// =========================================================================================================
// Operating system detection
// =========================================================================================================
// Conditionally defined: AC_OS_WINDOWS, AC_OS_LINUX, AC_OS_APPLE, AC_OS_BSD

#if defined(WIN32) || defined(_WIN32) || defined(__WIN32)
#define AC_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__)
#define AC_OS_APPLE
#elif defined(__linux__) || defined(linux)
#define AC_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define AC_OS_BSD
#else
#error "Unknown platform"
#endif

// =========================================================================================================
// Address width
// =========================================================================================================
// Always defined: AC_POINTER_BITS (32 or 64)
// Allocation sizes on narrow targets are additionally limited to half the address space (see ac::impl::alloc_guard)

#if UINTPTR_MAX > 0xFFFFFFFFu || defined(_WIN64) || defined(__LP64__) || defined(__x86_64__) || defined(__aarch64__)
#define AC_POINTER_BITS 64
#else
#define AC_POINTER_BITS 32
#endif

// =========================================================================================================
// Compilation modes
// =========================================================================================================
// From CMake: AC_DEBUG, AC_RELEASE, AC_RELWITHDEBINFO, AC_ENABLE_ASSERT_IN_RELEASE
// Always defined: AC_ASSERT_ENABLED (0 or 1)

#if defined(AC_RELEASE) && !defined(AC_ENABLE_ASSERT_IN_RELEASE)
#define AC_ASSERT_ENABLED 0
#else
#define AC_ASSERT_ENABLED 1
#endif

// =========================================================================================================
// Public macros
// =========================================================================================================

// AC_FORCE_INLINE - Force function to be inlined
#define AC_FORCE_INLINE AC_IMPL_FORCE_INLINE

// AC_DONT_INLINE - Prevent function from being inlined
#define AC_DONT_INLINE AC_IMPL_DONT_INLINE

// AC_COLD_FUNC - Mark function as rarely executed (error paths, assertions)
// Usage: AC_COLD_FUNC void handle_error() { ... }
#define AC_COLD_FUNC AC_IMPL_COLD_FUNC

// AC_NO_UNIQUE_ADDRESS - Let empty members (typically stateless allocators) occupy no storage
// Usage: AC_NO_UNIQUE_ADDRESS A _alloc;
#define AC_NO_UNIQUE_ADDRESS AC_IMPL_NO_UNIQUE_ADDRESS

// AC_MACRO_JOIN(a, b) - Concatenate two tokens at preprocessing time
// Note: Indirection ensures arguments are expanded before concatenation
#define AC_MACRO_JOIN(arg1, arg2) AC_IMPL_MACRO_JOIN(arg1, arg2)

// AC_UNUSED(expr) - Suppress unused variable/expression warnings (forces semicolon)
// Note: Expression is NOT evaluated, only its type is checked (sizeof is unevaluated context)
#define AC_UNUSED(expr) (void)(sizeof((expr)))


// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(AC_COMPILER_MSVC)

#define AC_IMPL_FORCE_INLINE __forceinline
#define AC_IMPL_DONT_INLINE __declspec(noinline)
#define AC_IMPL_COLD_FUNC
#define AC_IMPL_NO_UNIQUE_ADDRESS [[msvc::no_unique_address]]

#elif defined(AC_COMPILER_POSIX)

// additional 'inline' is required on gcc and makes no difference on clang
#define AC_IMPL_FORCE_INLINE __attribute__((always_inline)) inline
#define AC_IMPL_DONT_INLINE __attribute__((noinline))
#define AC_IMPL_COLD_FUNC __attribute__((cold))
#define AC_IMPL_NO_UNIQUE_ADDRESS [[no_unique_address]]

#else
#error "Unknown compiler"
#endif

#define AC_IMPL_MACRO_JOIN(arg1, arg2) arg1##arg2
