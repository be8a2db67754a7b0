#pragma once

// Lean header with minimal dependencies, safe to include from every allocation path.
#include <alloc-core/macros.hh>
#include <alloc-core/source_location.hh>

// =========================================================================================================
// AC_ASSERT - Runtime assertion with string literal message
//
// Validates a condition at runtime and triggers a debugger break + abort on failure.
// The failure is first reported through the assertion handler stack (see <alloc-core/assert-handler.hh>).
//
// When assertions are active:
//   Enabled unless AC_RELEASE is defined without AC_ENABLE_ASSERT_IN_RELEASE.
//
// What assertions are for:
//   Preconditions on sizes, alignments and handle states. They catch PROGRAMMER ERRORS.
//   Running out of memory or overflowing a capacity is NOT a programmer error:
//   those go through ac::result<T, ac::alloc_error> or the fatal hooks in <alloc-core/alloc_error.hh>.
//
// Usage:
//   AC_ASSERT(used >= 0 && extra >= 0, "used and extra must be non-negative");
//   AC_ASSERT(_block != nullptr, "accessing an empty ac::shared");
//
#define AC_ASSERT(cond, msg) AC_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// AC_ASSERT_ALWAYS - Always-active assertion
//
// Like AC_ASSERT but remains active in all build configurations.
// Used for invariants whose violation would corrupt memory (e.g. a broken refcount publication).
//
#define AC_ASSERT_ALWAYS(cond, msg) AC_IMPL_ASSERT_ALWAYS(cond, msg)

// =========================================================================================================
// AC_DEBUG_BREAK - Conditional debugger breakpoint
//
// Triggers a debugger break if a debugger is attached, otherwise does nothing.
//
#define AC_DEBUG_BREAK() AC_IMPL_DEBUG_BREAK()

// =========================================================================================================
// AC_BREAK_AND_ABORT - Debug break followed by program termination
//
// Used after a failure has been reported through the handler stack.
// A handler that throws never reaches this point.
//
#define AC_BREAK_AND_ABORT() (AC_DEBUG_BREAK(), ::ac::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace ac::impl
{
// Called when an assertion fails
// Dispatches to the topmost assertion handler, or prints diagnostic information to stderr
// Note: does not abort, caller must follow with AC_BREAK_AND_ABORT()
AC_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, ac::source_location location);

// Checks if a debugger is currently attached to the process
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace ac::impl

// The debugger should break right in the assert macro, so this cannot hide in a function call

#ifdef AC_COMPILER_MSVC

// __debugbreak() terminates immediately without an attached debugger
#define AC_IMPL_DEBUG_BREAK() (::ac::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(AC_COMPILER_POSIX)

// SIGTRAP is 5 according to https://man7.org/linux/man-pages/man7/signal.7.html
// NOTE: we don't want to pull in any posix header here, so we simply declare raise
extern "C" int raise(int) noexcept;
#define AC_IMPL_DEBUG_BREAK() (::ac::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define AC_IMPL_DEBUG_BREAK() void(0)

#endif

#define AC_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::ac::impl::handle_assert_failure(#cond, msg, ::ac::source_location::current()); \
            AC_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

#if AC_ASSERT_ENABLED

#define AC_IMPL_ASSERT(cond, msg) AC_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// We still type-check condition and message so release builds don't rot
#define AC_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        AC_UNUSED(cond);          \
        AC_UNUSED(msg);           \
    } while (false)

#endif
