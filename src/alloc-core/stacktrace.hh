#pragma once

#include <stacktrace>

namespace ac
{
/// Call stack snapshot, printed by the default failure handler after every assertion or fatal error.
/// Usage:
///   auto trace = ac::stacktrace::current();
///   std::cerr << std::to_string(trace);
using stacktrace = std::stacktrace;

/// One frame of an ac::stacktrace
using stacktrace_entry = std::stacktrace_entry;
} // namespace ac
