#include "assert.hh"

#include <alloc-core/assert-handler.hh>
#include <alloc-core/stacktrace.hh>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <vector>

#ifdef AC_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

#ifdef AC_COMPILER_POSIX
#include <unistd.h>

#include <cstring>
#endif

namespace
{
// Global stack of failure handlers
// NOTE: This is not thread-safe and must be externally synchronized
std::vector<std::move_only_function<void(ac::impl::assertion_info const&)>> g_assertion_handlers;

void default_assert_handler(ac::impl::assertion_info const& info)
{
    if (info.kind == ac::impl::failure_kind::assertion)
        std::cerr << "Assertion failed: " << info.expression << '\n';
    else
        std::cerr << "Fatal error: " << info.expression << '\n';

    std::cerr << "  Message: " << info.message << '\n';
    std::cerr << "  Location: " << info.location.file_name() << ':' << info.location.line() << ':'
              << info.location.column() << " (" << info.location.function_name() << ")\n";

    std::cerr << "\nStacktrace:\n";
    std::cerr << std::to_string(ac::stacktrace::current()) << '\n';
}

void dispatch_failure(ac::impl::assertion_info const& info)
{
    // Call the topmost handler if available, otherwise use default handler
    if (!g_assertion_handlers.empty())
        g_assertion_handlers.back()(info);
    else
        default_assert_handler(info);

    // no abort here, it's outside
}
} // namespace

void ac::impl::push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    g_assertion_handlers.push_back(std::move(handler));
}

void ac::impl::pop_assertion_handler()
{
    if (!g_assertion_handlers.empty())
        g_assertion_handlers.pop_back();
}

ac::impl::scoped_assertion_handler::scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    push_assertion_handler(std::move(handler));
}

ac::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    pop_assertion_handler();
}

AC_COLD_FUNC void ac::impl::handle_assert_failure(char const* expression, char const* message, ac::source_location location)
{
    dispatch_failure(assertion_info{
        .kind = failure_kind::assertion,
        .expression = expression,
        .message = message,
        .location = location,
    });
}

AC_COLD_FUNC void ac::impl::handle_fatal_error(char const* category, std::string message, ac::source_location location)
{
    dispatch_failure(assertion_info{
        .kind = failure_kind::fatal_error,
        .expression = category,
        .message = std::move(message),
        .location = location,
    });
}

bool ac::impl::is_debugger_connected() noexcept
{
#ifdef AC_COMPILER_MSVC
    return ::IsDebuggerPresent() != 0;
#elif defined(AC_OS_LINUX)
    // Check /proc/self/status for TracerPid
    if (auto* f = std::fopen("/proc/self/status", "r"))
    {
        char buf[1024];
        while (std::fgets(buf, sizeof(buf), f))
        {
            if (std::strncmp(buf, "TracerPid:", 10) == 0)
            {
                int pid = 0;
                std::sscanf(buf + 10, "%d", &pid);
                std::fclose(f);
                return pid != 0;
            }
        }
        std::fclose(f);
    }
    return false;
#else
    return false;
#endif
}

[[noreturn]] void ac::impl::perform_abort() noexcept
{
    std::abort();
}
