/**
 * @file debug_info.cpp
 * @brief Stack trace printing used by FBR_PANIC and by the test workers on failure.
 */
#include "fbr_base.hpp"

#include <cstdlib>
#include <string>

#if defined(FILEBRIDGE_IS_POSIX)
#include <cxxabi.h>   // __cxa_demangle
#include <dlfcn.h>    // dladdr
#include <execinfo.h> // backtrace, backtrace_symbols
#endif

namespace filebridge::debug
{

namespace
{

template <typename... Args>
void safe_format_to_stderr(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        fmt::print(stderr, fmt_str, std::forward<Args>(args)...);
    }
    catch (const std::exception &)
    {
        // Nothing sensible left to report to while printing a stack trace.
    }
}

#if defined(FILEBRIDGE_IS_POSIX)
std::string demangle(const char *symbol)
{
    int status = 0;
    char *dem = abi::__cxa_demangle(symbol, nullptr, nullptr, &status);
    if (status == 0 && dem != nullptr)
    {
        std::string out(dem);
        std::free(dem);
        return out;
    }
    return std::string(symbol);
}
#endif

} // namespace

void print_stack_trace() noexcept
{
    safe_format_to_stderr("Stack Trace (most recent call first):\n");
#if defined(FILEBRIDGE_IS_POSIX)
    constexpr int kMaxFrames = 128;
    void *callstack[kMaxFrames];
    const int nframes = backtrace(callstack, kMaxFrames);
    if (nframes <= 0)
    {
        safe_format_to_stderr("  [No stack frames available]\n");
        return;
    }

    char **symbols = backtrace_symbols(callstack, nframes);
    // Frame 0 is print_stack_trace itself.
    for (int i = 1; i < nframes; ++i)
    {
        const auto addr = reinterpret_cast<uintptr_t>(callstack[i]);
        Dl_info dlinfo;
        if (dladdr(callstack[i], &dlinfo) != 0 && dlinfo.dli_sname != nullptr)
        {
            const auto offset = addr - reinterpret_cast<uintptr_t>(dlinfo.dli_saddr);
            safe_format_to_stderr("  #{:<3} {:#018x} {} + {:#x} ({})\n", i, addr,
                                  demangle(dlinfo.dli_sname), offset,
                                  format_tools::filename_only(
                                      dlinfo.dli_fname != nullptr ? dlinfo.dli_fname : "?"));
        }
        else if (symbols != nullptr)
        {
            safe_format_to_stderr("  #{:<3} {:#018x} {}\n", i, addr, symbols[i]);
        }
        else
        {
            safe_format_to_stderr("  #{:<3} {:#018x} [symbol unknown]\n", i, addr);
        }
    }
    std::free(symbols);
#else
    safe_format_to_stderr("  [Stack trace not supported on this platform]\n");
#endif
    std::fflush(stderr);
}

} // namespace filebridge::debug
