#include "assert.hh"

#include <unordered-core/assert-handler.hh>

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <format>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

#ifdef UC_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

namespace
{
// function-local so that assertions fired during static initialization see a constructed stack
std::vector<uc::impl::assertion_handler>& handler_stack()
{
    static std::vector<uc::impl::assertion_handler> stack;
    return stack;
}

// one write per report, so reports from concurrent failures do not interleave line by line
void print_to_stderr(uc::impl::assertion_info const& info)
{
    auto const report = std::format("assertion failed: {}\n"
                                    "  message:  {}\n"
                                    "  location: {}:{}:{}\n"
                                    "  function: {}\n",
                                    info.expression, info.message, info.location.file_name(), info.location.line(),
                                    info.location.column(), info.location.function_name());
    std::fputs(report.c_str(), stderr);
    std::fflush(stderr);
}

#ifdef UC_OS_LINUX
// TracerPid in /proc/self/status is the pid of an attached tracer, 0 if there is none
bool has_tracer()
{
    auto status = std::ifstream("/proc/self/status");
    auto line = std::string();
    while (std::getline(status, line))
    {
        if (!line.starts_with("TracerPid:"))
            continue;

        auto const value = line.find_first_not_of(" \t", 10);
        return value != std::string::npos && line[value] != '0';
    }
    return false;
}
#endif
} // namespace

void uc::impl::push_assertion_handler(assertion_handler handler)
{
    handler_stack().push_back(std::move(handler));
}

void uc::impl::pop_assertion_handler()
{
    auto& stack = handler_stack();
    if (!stack.empty())
        stack.pop_back();
}

UC_COLD_FUNC void uc::impl::handle_assert_failure(char const* expression, char const* message, uc::source_location location)
{
    auto const info = assertion_info{
        .expression = expression,
        .message = message,
        .location = location,
    };

    auto& stack = handler_stack();
    if (stack.empty())
        print_to_stderr(info);
    else
        stack.back()(info); // may throw, the caller aborts otherwise
}

bool uc::impl::is_debugger_connected() noexcept
{
#if defined(UC_COMPILER_MSVC)
    return ::IsDebuggerPresent() != 0;
#elif defined(UC_OS_LINUX)
    try
    {
        return has_tracer();
    }
    catch (std::exception const&)
    {
        // unreadable status file, treat as "no debugger"
        return false;
    }
#else
    return false;
#endif
}

void uc::impl::perform_abort() noexcept
{
    std::abort();
}
