/*******************************************************************************
 * @file logger.hpp
 * @brief Asynchronous, thread-safe logging utility.
 *
 * **Design: Command-Queue Pattern**
 *
 * 1.  **Non-Blocking API**: `LOGGER_INFO(...)` and friends format the message on the
 *     calling thread and push it into a queue. Transfer threads never wait on I/O.
 * 2.  **Single Worker Thread**: one background thread is the sole consumer of the
 *     queue. It performs all sink I/O and applies control commands (sink switch,
 *     flush, error callback) in order with the messages around them.
 * 3.  **Sink Abstraction**: `ConsoleSink` (stderr, the default) and `FileSink`.
 * 4.  **Bounded Queue**: above `max_queue_size` log messages are dropped; above twice
 *     that, control commands are rejected too. The worker reports how many messages
 *     were lost once the pressure ends.
 * 5.  **Lifecycle**: the worker starts with the `Logger` lifecycle module and drains
 *     the queue on shutdown. Messages logged while the module is not running are
 *     discarded without side effects, so library code may log unconditionally.
 *
 * **Usage**
 * ```cpp
 * LOGGER_INFO("read_range: fileRef={} pos={} count={}", file_ref, position, count);
 *
 * auto &logger = filebridge::utils::Logger::instance();
 * logger.set_logfile("/var/log/filebridge.log");
 * logger.set_level(filebridge::utils::Logger::Level::L_DEBUG);
 * logger.flush(); // blocks until everything queued so far is written
 * ```
 ******************************************************************************/
#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "filebridge_utils_export.h"
#include "utils/module_def.hpp"

#ifndef LOGGER_FMT_BUFFER_RESERVE
#define LOGGER_FMT_BUFFER_RESERVE (1024u)
#endif

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace filebridge::utils
{

class FILEBRIDGE_UTILS_EXPORT Logger
{
  public:
    enum class Level : int
    {
        L_TRACE = 0,
        L_DEBUG = 1,
        L_INFO = 2,
        L_WARNING = 3,
        L_ERROR = 4,
        L_SYSTEM = 5,
    };

    static Logger &instance();

    /**
     * @brief Lifecycle module definition for the logger ("filebridge::utils::Logger").
     */
    static ModuleDef GetLifecycleModule();

    /// @brief True once the lifecycle module has started (also after it stopped).
    static bool lifecycle_initialized() noexcept;

    /**
     * @brief Parses "trace", "debug", "info", "warn"/"warning", "error" or "system"
     *        (case-insensitive).
     * @return std::nullopt for anything else.
     */
    static std::optional<Level> parse_level(std::string_view text);

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    ~Logger();

    /**
     * @brief Switches logging to the console (stderr). Blocks until the worker applied it.
     * @return false if the logger is not running or the switch was rejected.
     */
    bool set_console();

    /**
     * @brief Switches logging to a file, appending. Blocks until the worker applied it.
     * @param utf8_path Path to the log file. Created if missing.
     * @param use_flock Hold an advisory lock during each write (POSIX).
     * @return false if the file could not be opened; the previous sink stays active
     *         and the error callback (if any) receives the reason.
     */
    bool set_logfile(const std::string &utf8_path, bool use_flock = true);

    /**
     * @brief Drains the queue and stops the worker. Called by the lifecycle module.
     */
    void shutdown();

    /**
     * @brief Blocks until every message queued before this call has been written.
     */
    void flush();

    void set_level(Level lvl);
    Level level() const;

    /**
     * @brief Sets the soft queue limit. Values below 1 are treated as 1.
     */
    void set_max_queue_size(size_t max_size);
    size_t get_max_queue_size() const;

    /// @brief Messages dropped because the queue was full since the last sink switch.
    size_t get_total_dropped_since_sink_switch() const;

    /**
     * @brief Sets a callback invoked on sink errors (failed write, failed sink creation).
     *
     * The callback runs on a dedicated dispatcher thread, never on the worker.
     */
    void set_write_error_callback(std::function<void(const std::string &)> cb);

    // Compile-time format string API.
    template <Level lvl, typename... Args>
    void log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept;

    template <typename... Args>
    void trace_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_TRACE>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void debug_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_DEBUG>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void info_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_INFO>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void warn_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_WARNING>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void error_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_ERROR>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void system_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_SYSTEM>(fmt_str, std::forward<Args>(args)...);
    }

    // Runtime format string API.
    template <typename... Args>
    void log_fmt_runtime(Level lvl, fmt::string_view fmt_str, Args &&...args) noexcept;

    template <typename... Args> void info_fmt_rt(fmt::string_view fmt_str, Args &&...args) noexcept
    {
        log_fmt_runtime(Level::L_INFO, fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args> void warn_fmt_rt(fmt::string_view fmt_str, Args &&...args) noexcept
    {
        log_fmt_runtime(Level::L_WARNING, fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void error_fmt_rt(fmt::string_view fmt_str, Args &&...args) noexcept
    {
        log_fmt_runtime(Level::L_ERROR, fmt_str, std::forward<Args>(args)...);
    }

    struct Impl;

  private:
    Logger();

    friend void do_logger_startup(const char *arg);

    std::unique_ptr<Impl> pImpl;

    bool enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept;
    bool should_log(Level lvl) const noexcept;
};

// --- Compile-Time Log Level ---
#ifndef LOGGER_COMPILE_LEVEL
#define LOGGER_COMPILE_LEVEL 0 // 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error
#endif

// ----------------- Template implementation (must be in header) -----------------

template <Logger::Level lvl, typename... Args>
void Logger::log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    if constexpr (static_cast<int>(lvl) >= LOGGER_COMPILE_LEVEL)
    {
        if (!should_log(lvl))
            return;

        try
        {
            fmt::memory_buffer mb;
            mb.reserve(LOGGER_FMT_BUFFER_RESERVE);
            fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
            enqueue_log(lvl, std::move(mb));
        }
        catch (const std::exception &ex)
        {
            fmt::memory_buffer err;
            fmt::format_to(std::back_inserter(err), "[FORMAT ERROR] {}", ex.what());
            enqueue_log(lvl, std::move(err));
        }
    }
}

template <typename... Args>
void Logger::log_fmt_runtime(Level lvl, fmt::string_view fmt_str, Args &&...args) noexcept
{
    if (!should_log(lvl))
        return;

    try
    {
        fmt::memory_buffer mb;
        mb.reserve(LOGGER_FMT_BUFFER_RESERVE);
        fmt::format_to(std::back_inserter(mb), fmt::runtime(fmt_str), std::forward<Args>(args)...);
        enqueue_log(lvl, std::move(mb));
    }
    catch (const std::exception &ex)
    {
        fmt::memory_buffer err;
        fmt::format_to(std::back_inserter(err), "[FORMAT ERROR] {}", ex.what());
        enqueue_log(lvl, std::move(err));
    }
}

} // namespace filebridge::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

// --- Macro Implementation ---
#define LOGGER_TRACE(fmt, ...)                                                                     \
    ::filebridge::utils::Logger::instance().trace_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG(fmt, ...)                                                                     \
    ::filebridge::utils::Logger::instance().debug_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...)                                                                      \
    ::filebridge::utils::Logger::instance().info_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...)                                                                      \
    ::filebridge::utils::Logger::instance().warn_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...)                                                                     \
    ::filebridge::utils::Logger::instance().error_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_SYSTEM(fmt, ...)                                                                    \
    ::filebridge::utils::Logger::instance().system_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)

#define LOGGER_INFO_RT(fmt, ...)                                                                   \
    ::filebridge::utils::Logger::instance().info_fmt_rt(fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN_RT(fmt, ...)                                                                   \
    ::filebridge::utils::Logger::instance().warn_fmt_rt(fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR_RT(fmt, ...)                                                                  \
    ::filebridge::utils::Logger::instance().error_fmt_rt(fmt __VA_OPT__(, ) __VA_ARGS__)
