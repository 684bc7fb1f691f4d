#pragma once
/**
 * @file fbr_platform.hpp
 * @brief Layer 0: Platform detection and platform utility declarations.
 *
 * Include this header (directly or via fbr_base.hpp) in any translation unit that
 * needs platform macros (FILEBRIDGE_PLATFORM_WIN64, FILEBRIDGE_IS_POSIX, etc.) or the
 * process/thread/clock helpers in `filebridge::platform`.
 */

// --- Platform detection ------------------------------------------------------
#if defined(_WIN32) || defined(_WIN64)
#define FILEBRIDGE_PLATFORM_WIN64 1
#undef FILEBRIDGE_PLATFORM_APPLE
#undef FILEBRIDGE_PLATFORM_LINUX
#undef FILEBRIDGE_PLATFORM_FREEBSD
#elif defined(__APPLE__) && defined(__MACH__)
#define FILEBRIDGE_PLATFORM_APPLE 1
#undef FILEBRIDGE_PLATFORM_WIN64
#undef FILEBRIDGE_PLATFORM_LINUX
#undef FILEBRIDGE_PLATFORM_FREEBSD
#elif defined(__FreeBSD__)
#define FILEBRIDGE_PLATFORM_FREEBSD 1
#undef FILEBRIDGE_PLATFORM_APPLE
#undef FILEBRIDGE_PLATFORM_WIN64
#undef FILEBRIDGE_PLATFORM_LINUX
#elif defined(__linux__)
#define FILEBRIDGE_PLATFORM_LINUX 1
#undef FILEBRIDGE_PLATFORM_APPLE
#undef FILEBRIDGE_PLATFORM_WIN64
#undef FILEBRIDGE_PLATFORM_FREEBSD
#else
#define FILEBRIDGE_PLATFORM_UNKNOWN 1
#endif

#if defined(FILEBRIDGE_PLATFORM_WIN64)
#define FILEBRIDGE_IS_WINDOWS 1
#undef FILEBRIDGE_IS_POSIX
#elif defined(FILEBRIDGE_PLATFORM_APPLE) || defined(FILEBRIDGE_PLATFORM_FREEBSD) ||                \
    defined(FILEBRIDGE_PLATFORM_LINUX)
#undef FILEBRIDGE_IS_WINDOWS
#define FILEBRIDGE_IS_POSIX 1
#else
#undef FILEBRIDGE_IS_WINDOWS
#undef FILEBRIDGE_IS_POSIX
#endif

#if defined(FILEBRIDGE_PLATFORM_WIN64)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

// --- Require C++20 or later --------------------------------------------------
// std::span, std::stop_token, std::source_location and designated initializers are
// used throughout. Fail early with a clear message on an older language standard.
#if defined(_MSC_VER)
#if !defined(_MSVC_LANG) || (_MSVC_LANG < 202002L)
#error "This project requires C++20 or later. Please compile with /std:c++20 or newer (MSVC)."
#endif
#else
#if __cplusplus < 202002L
#error "This project requires C++20 or later. Please compile with -std=c++20 or newer."
#endif
#endif

#include "filebridge_utils_export.h"

#include <cstddef>
#include <cstdint>
#include <string>

namespace filebridge::platform
{

/**
 * @brief Gets the native thread ID for the calling thread.
 * @return A 64-bit unsigned integer representing the thread ID.
 */
FILEBRIDGE_UTILS_EXPORT uint64_t get_native_thread_id() noexcept;
/**
 * @brief Gets the process ID (PID) for the current process.
 * @return A 64-bit unsigned integer representing the process ID.
 */
FILEBRIDGE_UTILS_EXPORT uint64_t get_pid();
/**
 * @brief Gets the name of the current executable.
 * @param include_path If `true`, returns the full absolute path to the executable.
 *                     If `false` (default), returns only the filename.
 * @return A string containing the name of the executable. Returns "unknown" on failure.
 */
FILEBRIDGE_UTILS_EXPORT std::string get_executable_name(bool include_path = false) noexcept;

/// @brief Major version of the filebridge package.
FILEBRIDGE_UTILS_EXPORT int get_version_major() noexcept;
/// @brief Minor version of the filebridge package.
FILEBRIDGE_UTILS_EXPORT int get_version_minor() noexcept;
/// @brief Patch version of the filebridge package.
FILEBRIDGE_UTILS_EXPORT int get_version_patch() noexcept;
/// @brief Full version string ("major.minor.patch").
FILEBRIDGE_UTILS_EXPORT const char *get_version_string() noexcept;

/**
 * @brief Gets a monotonic timestamp in nanoseconds.
 * @details Backed by std::chrono::steady_clock. The absolute value is meaningless;
 *          use it for computing deltas (timeouts, poll budgets, transfer timing) only.
 */
FILEBRIDGE_UTILS_EXPORT uint64_t monotonic_time_ns() noexcept;

/**
 * @brief Computes elapsed nanoseconds since a monotonic_time_ns() timestamp.
 * @return Nanoseconds elapsed, or 0 if start_ns lies in the future.
 */
FILEBRIDGE_UTILS_EXPORT uint64_t elapsed_time_ns(uint64_t start_ns) noexcept;

} // namespace filebridge::platform
