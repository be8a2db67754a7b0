#pragma once

#include <alloc-core/macros.hh>
#include <alloc-core/source_location.hh>

#include <functional>
#include <string>

namespace ac::impl
{
// Customizable failure handler system
// Both failed assertions and fatal runtime errors (capacity overflow, allocation failure
// under the aborting convention, reference count overflow) are reported through it.
// NOTE: Handler functions are global state and must be externally synchronized
//
// Usage example:
//   {
//       auto handler = ac::impl::scoped_assertion_handler([](ac::impl::assertion_info const& info) {
//           log_failure(info);
//           throw recoverable_failure{info.message};
//       });
//
//       // Any assertion or fatal error in this scope will use the custom handler
//       risky_operation();
//   } // handler is automatically popped here

enum class failure_kind
{
    assertion,
    fatal_error,
};

struct assertion_info
{
    failure_kind kind = failure_kind::assertion;
    /// stringified condition for assertions, error category (e.g. "capacity overflow") for fatal errors
    std::string expression;
    std::string message;
    ac::source_location location;
};

// Push a custom handler onto the handler stack
// Handlers are allowed to throw exceptions as a way to unwind to some recovery point
// If a handler returns normally, the process is aborted
void push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);

// Pop the topmost handler from the stack
// NOTE: prefer scoped_assertion_handler so throwing handlers stay balanced
void pop_assertion_handler();

// RAII wrapper for pushing/popping assertion handlers
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};

// Reports a fatal runtime error through the handler stack
// Note: does not abort, caller must follow with AC_BREAK_AND_ABORT()
AC_COLD_FUNC void handle_fatal_error(char const* category, std::string message, ac::source_location location);
} // namespace ac::impl
