#include "assert.hh"

#include <raw-region/assert-handler.hh>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <vector>

#ifdef RR_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

#ifdef RR_OS_LINUX
#include <cstring>
#endif

namespace
{
// Global stack of handlers
// NOTE: This is not thread-safe and must be externally synchronized
std::vector<std::move_only_function<void(rr::impl::assertion_info const&)>> g_assertion_handlers;

// Default handler: report to stderr, the caller aborts afterwards
void default_assert_handler(rr::impl::assertion_info const& info)
{
    if (info.kind == rr::fault::assertion)
        std::cerr << "Assertion failed: " << info.expression << '\n';
    else
        std::cerr << "Region fault (" << rr::to_string(info.kind) << "): " << info.expression << '\n';
    std::cerr << "  Message: " << info.message << '\n';
    std::cerr << "  Location: " << info.location.file_name() << ':' << info.location.line() << ':'
              << info.location.column() << " (" << info.location.function_name() << ")\n";
}
} // namespace

void rr::impl::push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    g_assertion_handlers.push_back(std::move(handler));
}

void rr::impl::pop_assertion_handler()
{
    if (!g_assertion_handlers.empty())
        g_assertion_handlers.pop_back();
}

rr::impl::scoped_assertion_handler::scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    push_assertion_handler(std::move(handler));
}

rr::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    pop_assertion_handler();
}

RR_COLD_FUNC void rr::impl::handle_assert_failure(rr::fault kind,
                                                  char const* expression,
                                                  char const* message,
                                                  rr::source_location location)
{
    assertion_info const info{
        .kind = kind,
        .expression = expression,
        .message = message,
        .location = location,
    };

    // Call the topmost handler if available, otherwise use default handler
    if (!g_assertion_handlers.empty())
        g_assertion_handlers.back()(info);
    else
        default_assert_handler(info);

    // no abort here, it's outside
}

bool rr::impl::is_debugger_connected() noexcept
{
#ifdef RR_COMPILER_MSVC
    return ::IsDebuggerPresent() != 0;
#elif defined(RR_OS_LINUX)
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

[[noreturn]] void rr::impl::perform_abort() noexcept
{
    std::abort();
}
