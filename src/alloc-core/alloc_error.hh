#pragma once

#include <alloc-core/layout.hh>
#include <alloc-core/macros.hh>
#include <alloc-core/source_location.hh>

#include <string>

// Fatal-error hooks of the infallible calling convention.
//
// Fallible entry points return ac::result<..., ac::alloc_error>.
// Their infallible counterparts call one of the hooks below instead, which
//   1) reports the failure through the assertion handler stack (see <alloc-core/assert-handler.hh>)
//      with failure_kind::fatal_error,
//   2) breaks into an attached debugger and aborts the process.
//
// A handler that throws unwinds out of the hook instead of aborting.
// Tests use that to observe fatal paths; production code should treat the hooks as [[noreturn]].

namespace ac
{
/// Human-readable description of an allocation error
/// e.g. "capacity overflow" or "allocation of 64 bytes with alignment 16 failed"
[[nodiscard]] std::string to_string(alloc_error const& error);

/// A capacity or size computation exceeded the representable or addressable range
[[noreturn]] AC_COLD_FUNC void capacity_overflow(ac::source_location location = ac::source_location::current());

/// The allocator declined to provide a block for the given layout
[[noreturn]] AC_COLD_FUNC void handle_alloc_error(ac::layout failed_layout,
                                                  ac::source_location location = ac::source_location::current());

/// Dispatches to capacity_overflow or handle_alloc_error depending on the error kind
[[noreturn]] AC_COLD_FUNC void handle_reserve_error(alloc_error const& error,
                                                    ac::source_location location = ac::source_location::current());

/// A reference count exceeded its soft maximum (almost certainly a leak of handles via into_raw or similar)
[[noreturn]] AC_COLD_FUNC void refcount_overflow(ac::source_location location = ac::source_location::current());
} // namespace ac

namespace ac::impl
{
/// Bridges a fallible entry point to its infallible counterpart
/// Usage:
///   void reserve(isize used, isize extra) { impl::value_or_abort(try_reserve(used, extra)); }
template <class T>
T value_or_abort(result<T, alloc_error>&& r, ac::source_location location = ac::source_location::current())
{
    if (r.has_error()) [[unlikely]]
        ac::handle_reserve_error(r.error(), location);
    return ac::move(r).value();
}

inline void value_or_abort(result<void, alloc_error>&& r, ac::source_location location = ac::source_location::current())
{
    if (r.has_error()) [[unlikely]]
        ac::handle_reserve_error(r.error(), location);
}
} // namespace ac::impl
