#pragma once

#include <source_location>

namespace ac
{
/// Type alias for std::source_location
/// Fatal-error hooks and assertions take it as a defaulted trailing parameter:
///   [[noreturn]] void capacity_overflow(ac::source_location location = ac::source_location::current());
using source_location = std::source_location;
} // namespace ac
