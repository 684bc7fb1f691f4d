/**
 * @file debug_info.hpp
 * @brief Debugging utilities: stack trace printing, panic and debug messages.
 *
 * `FBR_PANIC` is reserved for broken internal invariants that leave no sane way to
 * continue (dependency cycles in the lifecycle graph, use of a service before its
 * module started). Recoverable conditions are reported with exceptions instead.
 *
 * `FBR_DEBUG` writes to stderr only when the build defines
 * `FILEBRIDGE_ENABLE_DEBUG_MESSAGES`; otherwise it compiles to nothing.
 */
#pragma once

#include <cstdio>
#include <cstdlib>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "filebridge_utils_export.h"
#include "utils/format_tools.hpp"

/**
 * @brief Formats a source_location as "file:line:function".
 */
inline std::string SRCLOC_TO_STR(std::source_location loc)
{
    return fmt::format("{}:{}:{}", filebridge::format_tools::filename_only(loc.file_name()),
                       loc.line(), loc.function_name());
}

namespace filebridge::debug
{

/**
 * @brief Prints the current call stack to stderr.
 *
 * Uses `backtrace`/`backtrace_symbols` with C++ demangling on POSIX. On other
 * platforms only a notice is printed. Never throws.
 */
FILEBRIDGE_UTILS_EXPORT void print_stack_trace() noexcept;

/**
 * @brief Prints a formatted fatal message with its source location and a stack trace,
 *        then aborts the process.
 */
template <typename... Args>
[[noreturn]] inline void panic(std::source_location loc, fmt::format_string<Args...> fmt_str,
                               Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[PANIC] {} -- {}\n", SRCLOC_TO_STR(loc), body);
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[PANIC] fatal error while formatting panic message: %s\n",
                     e.what());
    }
    std::fflush(stderr);
    print_stack_trace();
    std::abort();
}

/**
 * @brief Prints a formatted debug message to stderr. Never throws.
 */
template <typename... Args>
inline void debug_msg(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[DBG]  {}\n", body);
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[DBG]  FORMAT ERROR DURING DEBUG_MSG: %s\n", e.what());
    }
}

} // namespace filebridge::debug

#ifndef FBR_LOC_HERE_STR
#define FBR_LOC_HERE_STR (SRCLOC_TO_STR(std::source_location::current()))
#endif

#ifndef FBR_PANIC
#define FBR_PANIC(fmt, ...)                                                                        \
    ::filebridge::debug::panic(std::source_location::current(),                                    \
                               FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#endif

#ifndef FBR_DEBUG
#if defined(FILEBRIDGE_ENABLE_DEBUG_MESSAGES)
#define FBR_DEBUG(fmt, ...)                                                                        \
    ::filebridge::debug::debug_msg(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#else
#define FBR_DEBUG(fmt, ...)                                                                        \
    do                                                                                             \
    {                                                                                              \
    } while (0)
#endif
#endif
