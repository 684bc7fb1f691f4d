/*******************************************************************************
 * @file logger.cpp
 * @brief Implementation of the asynchronous logger.
 ******************************************************************************/

#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <stdexcept>
#include <variant>

#include "fbr_base.hpp"

#include "utils/lifecycle.hpp"
#include "utils/logger.hpp"

#include "utils/logger_sinks/console_sink.hpp"
#include "utils/logger_sinks/file_sink.hpp"
#include "utils/logger_sinks/sink.hpp"

using namespace filebridge::format_tools;

namespace filebridge::utils
{

enum class LoggerState
{
    Uninitialized,
    Initialized,
    ShuttingDown,
    Shutdown
};

static std::atomic<LoggerState> g_logger_state{LoggerState::Uninitialized};

/**
 * @class CallbackDispatcher
 * @brief Runs user-provided error callbacks on their own thread so a slow or
 *        throwing callback cannot stall the logger worker.
 */
class CallbackDispatcher
{
  public:
    CallbackDispatcher() : shutdown_requested_(false)
    {
        worker_ = std::thread([this] { this->run(); });
    }

    ~CallbackDispatcher() { shutdown(); }

    void post(std::function<void()> fn)
    {
        if (shutdown_requested_.load(std::memory_order_relaxed))
            return;
        {
            std::lock_guard<std::mutex> lg(mutex_);
            queue_.push_back(std::move(fn));
        }
        cv_.notify_one();
    }

    void shutdown()
    {
        if (shutdown_requested_.exchange(true))
        {
            return;
        }
        cv_.notify_one();
        if (worker_.joinable())
        {
            worker_.join();
        }
    }

  private:
    void run()
    {
        for (;;)
        {
            std::function<void()> fn;
            {
                std::unique_lock<std::mutex> ul(mutex_);
                cv_.wait(ul, [this] { return shutdown_requested_.load() || !queue_.empty(); });
                if (shutdown_requested_.load() && queue_.empty())
                {
                    return;
                }
                fn = std::move(queue_.front());
                queue_.pop_front();
            }
            try
            {
                fn();
            }
            catch (const std::exception &e)
            {
                fmt::print(stderr, "[LOGGER] write-error callback threw: {}\n", e.what());
            }
        }
    }

    std::deque<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread worker_;
    std::atomic<bool> shutdown_requested_;
};

// Command Definitions
struct SetSinkCommand
{
    std::unique_ptr<Sink> new_sink;
    std::shared_ptr<std::promise<bool>> promise;
};
struct SinkCreationErrorCommand
{
    std::string error_message;
    std::shared_ptr<std::promise<bool>> promise;
};
struct FlushCommand
{
    std::shared_ptr<std::promise<bool>> promise;
};
struct SetErrorCallbackCommand
{
    std::function<void(const std::string &)> callback;
    std::shared_ptr<std::promise<bool>> promise;
};

using Command = std::variant<LogMessage, SetSinkCommand, SinkCreationErrorCommand, FlushCommand,
                             SetErrorCallbackCommand>;

// Every promise is fulfilled exactly once by the worker, so set_value cannot throw
// promise_already_satisfied here.
template <typename T> void promise_set(const std::shared_ptr<std::promise<T>> &p, T value)
{
    if (p)
    {
        p->set_value(std::move(value));
    }
}

namespace
{
LogMessage make_internal_message(Logger::Level lvl, fmt::memory_buffer &&body)
{
    return LogMessage{.timestamp = std::chrono::system_clock::now(),
                      .process_id = filebridge::platform::get_pid(),
                      .thread_id = filebridge::platform::get_native_thread_id(),
                      .level = static_cast<int>(lvl),
                      .body = std::move(body)};
}
} // namespace

struct Logger::Impl
{
    Impl();
    ~Impl();
    void start_worker();
    void worker_loop();
    bool enqueue_command(Command &&cmd);
    static void reject_command(Command &cmd);
    void report_error(std::string msg);
    void write_to_sink(const LogMessage &msg);
    void shutdown();

    std::function<void(const std::string &)> error_callback_;
    std::thread worker_thread_;
    std::unique_ptr<Sink> sink_;
    size_t m_max_queue_size{10000};
    std::chrono::system_clock::time_point m_dropping_since;
    std::vector<Command> queue_;
    std::condition_variable cv_;
    std::mutex queue_mutex_;
    std::mutex m_sink_mutex;
    CallbackDispatcher callback_dispatcher_;
    std::atomic<Logger::Level> level_{Logger::Level::L_INFO};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> shutdown_completed_{false};
    std::atomic<bool> m_was_dropping{false};
    std::atomic<size_t> m_messages_dropped{0};                // batch counter; exchange(0) by worker
    std::atomic<size_t> m_total_dropped_since_sink_switch{0}; // reset on sink switch
};

Logger::Impl::Impl() : sink_(std::make_unique<ConsoleSink>()) {}

Logger::Impl::~Impl()
{
    if (worker_thread_.joinable())
    {
        // Only reachable when the lifecycle module was started but never stopped.
        FBR_DEBUG("**Logger Impl destructor called without prior shutdown. Check lifecycle "
                  "management.**");
        shutdown();
    }
}

void Logger::Impl::start_worker()
{
    if (!worker_thread_.joinable())
    {
        worker_thread_ = std::thread(&Logger::Impl::worker_loop, this);
    }
}

void Logger::Impl::reject_command(Command &cmd)
{
    std::visit(
        [](auto &&arg)
        {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (!std::is_same_v<T, LogMessage>)
            {
                promise_set(arg.promise, false);
            }
        },
        cmd);
}

void Logger::Impl::report_error(std::string msg)
{
    if (error_callback_)
    {
        auto cb = error_callback_;
        callback_dispatcher_.post([cb, msg = std::move(msg)]() { cb(msg); });
    }
    else
    {
        FBR_DEBUG("Logger error with no error callback installed: {}", msg);
    }
}

void Logger::Impl::write_to_sink(const LogMessage &msg)
{
    std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
    if (sink_)
    {
        sink_->write(msg, Sink::ASYNC_WRITE);
    }
}

bool Logger::Impl::enqueue_command(Command &&cmd)
{
    if (shutdown_requested_.load(std::memory_order_relaxed))
    {
        reject_command(cmd);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_.load(std::memory_order_acquire))
        {
            reject_command(cmd);
            return false;
        }

        const size_t current_queue_size = queue_.size();
        const size_t max_queue_size_soft = m_max_queue_size;
        const size_t max_queue_size_hard = m_max_queue_size * 2;

        const bool is_log = std::holds_alternative<LogMessage>(cmd);
        if (current_queue_size >= max_queue_size_hard ||
            (is_log && current_queue_size >= max_queue_size_soft))
        {
            if (is_log)
            {
                m_messages_dropped.fetch_add(1, std::memory_order_relaxed);
                m_total_dropped_since_sink_switch.fetch_add(1, std::memory_order_relaxed);
                if (!m_was_dropping.exchange(true, std::memory_order_relaxed))
                {
                    m_dropping_since = std::chrono::system_clock::now();
                }
            }
            reject_command(cmd);
            return false;
        }

        queue_.emplace_back(std::move(cmd));
    }
    cv_.notify_one();
    return true;
}

void Logger::Impl::worker_loop()
{
    std::vector<Command> local_queue;

    while (true)
    {
        bool was_dropping = false;
        size_t dropped_count = 0;
        double dropping_duration_s = 0.0;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || shutdown_requested_.load(); });
            local_queue.swap(queue_);

            if (m_was_dropping.exchange(false, std::memory_order_relaxed))
            {
                was_dropping = true;
                dropped_count = m_messages_dropped.exchange(0, std::memory_order_relaxed);
                dropping_duration_s = std::chrono::duration_cast<std::chrono::duration<double>>(
                                          std::chrono::system_clock::now() - m_dropping_since)
                                          .count();
            }
        }

        // Only the last sink switch in a batch is applied; earlier ones are superseded.
        ptrdiff_t last_set_sink_idx = -1;
        for (ptrdiff_t i = static_cast<ptrdiff_t>(local_queue.size()) - 1; i >= 0; --i)
        {
            if (std::holds_alternative<SetSinkCommand>(local_queue[i]))
            {
                last_set_sink_idx = i;
                break;
            }
        }

        for (ptrdiff_t i = 0; i < static_cast<ptrdiff_t>(local_queue.size()); ++i)
        {
            try
            {
                if (auto *msg = std::get_if<LogMessage>(&local_queue[i]))
                {
                    if (msg->level >= static_cast<int>(level_.load(std::memory_order_relaxed)))
                    {
                        write_to_sink(*msg);
                    }
                    continue;
                }

                std::visit(
                    [&, this, i](auto &&arg)
                    {
                        using T = std::decay_t<decltype(arg)>;

                        if constexpr (std::is_same_v<T, SetSinkCommand>)
                        {
                            if (i != last_set_sink_idx)
                            {
                                promise_set(arg.promise, false);
                            }
                        }
                        else if constexpr (std::is_same_v<T, SinkCreationErrorCommand>)
                        {
                            report_error(arg.error_message);
                            promise_set(arg.promise, false);
                        }
                        else if constexpr (std::is_same_v<T, FlushCommand>)
                        {
                            {
                                std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
                                if (sink_)
                                {
                                    sink_->flush();
                                }
                            }
                            promise_set(arg.promise, true);
                        }
                        else if constexpr (std::is_same_v<T, SetErrorCallbackCommand>)
                        {
                            error_callback_ = std::move(arg.callback);
                            promise_set(arg.promise, true);
                        }
                    },
                    local_queue[i]);
            }
            catch (const std::exception &e)
            {
                report_error(fmt::format("Logger worker error: {}", e.what()));
            }
        }

        if (was_dropping && dropped_count > 0)
        {
            try
            {
                write_to_sink(make_internal_message(
                    Logger::Level::L_WARNING,
                    make_buffer("Logger dropped {} messages over {:.2f}s due to full queue.",
                                dropped_count, dropping_duration_s)));
            }
            catch (const std::exception &e)
            {
                report_error(fmt::format("Logger worker error: {}", e.what()));
            }
        }

        if (last_set_sink_idx != -1)
        {
            if (auto *sink_cmd = std::get_if<SetSinkCommand>(&local_queue[last_set_sink_idx]))
            {
                std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
                const std::string old_desc = sink_ ? sink_->description() : "null";
                const std::string new_desc =
                    sink_cmd->new_sink ? sink_cmd->new_sink->description() : "null";
                try
                {
                    if (sink_)
                    {
                        sink_->write(make_internal_message(
                                         Logger::Level::L_SYSTEM,
                                         make_buffer("Switching log sink to: {}", new_desc)),
                                     Sink::ASYNC_WRITE);
                        sink_->flush();
                    }
                    sink_ = std::move(sink_cmd->new_sink);
                    m_total_dropped_since_sink_switch.store(0, std::memory_order_relaxed);
                    if (sink_)
                    {
                        sink_->write(make_internal_message(
                                         Logger::Level::L_SYSTEM,
                                         make_buffer("Log sink switched from: {}", old_desc)),
                                     Sink::ASYNC_WRITE);
                    }
                }
                catch (const std::exception &e)
                {
                    report_error(fmt::format("Logger sink switch error: {}", e.what()));
                }
                if (sink_cmd->new_sink)
                {
                    // The old sink threw before the switch happened.
                    sink_ = std::move(sink_cmd->new_sink);
                }
                promise_set(sink_cmd->promise, true);
            }
        }

        local_queue.clear();

        if (shutdown_requested_.load())
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            if (!queue_.empty())
            {
                lock.unlock();
                continue;
            }

            std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
            if (sink_)
            {
                try
                {
                    sink_->write(make_internal_message(Logger::Level::L_SYSTEM,
                                                       make_buffer("Logger is shutting down.")),
                                 Sink::ASYNC_WRITE);
                    sink_->flush();
                }
                catch (const std::exception &e)
                {
                    fmt::print(stderr, "[LOGGER] final write failed: {}\n", e.what());
                }
            }
            g_logger_state.store(LoggerState::Shutdown, std::memory_order_release);
            break;
        }
    }
}

void Logger::Impl::shutdown()
{
    if (shutdown_completed_.load() || shutdown_requested_.exchange(true))
    {
        return;
    }
    cv_.notify_one();
    if (worker_thread_.joinable())
    {
        worker_thread_.join();
    }
    callback_dispatcher_.shutdown();
    shutdown_completed_.store(true);
}

// ============================================================================
// Logger public API
// ============================================================================

Logger::Logger() : pImpl(std::make_unique<Impl>()) {}
Logger::~Logger() = default;

Logger &Logger::instance()
{
    static Logger instance;
    return instance;
}

bool Logger::lifecycle_initialized() noexcept
{
    return g_logger_state.load(std::memory_order_acquire) != LoggerState::Uninitialized;
}

std::optional<Logger::Level> Logger::parse_level(std::string_view text)
{
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "trace")
        return Level::L_TRACE;
    if (lowered == "debug")
        return Level::L_DEBUG;
    if (lowered == "info")
        return Level::L_INFO;
    if (lowered == "warn" || lowered == "warning")
        return Level::L_WARNING;
    if (lowered == "error")
        return Level::L_ERROR;
    if (lowered == "system")
        return Level::L_SYSTEM;
    return std::nullopt;
}

static bool logger_is_running()
{
    return g_logger_state.load(std::memory_order_acquire) == LoggerState::Initialized;
}

bool Logger::set_console()
{
    if (!logger_is_running())
        return false;
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(SetSinkCommand{std::make_unique<ConsoleSink>(), promise});
    return future.get();
}

bool Logger::set_logfile(const std::string &utf8_path, bool use_flock)
{
    if (!logger_is_running())
        return false;
    std::unique_ptr<Sink> sink;
    try
    {
        sink = std::make_unique<FileSink>(utf8_path, use_flock);
    }
    catch (const std::exception &e)
    {
        auto promise_err = std::make_shared<std::promise<bool>>();
        auto future_err = promise_err->get_future();
        pImpl->enqueue_command(SinkCreationErrorCommand{
            fmt::format("Failed to create FileSink: {}", e.what()), promise_err});
        (void)future_err.get(); // always false; waited on so the callback is posted
        return false;
    }
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(SetSinkCommand{std::move(sink), promise});
    return future.get();
}

void Logger::shutdown()
{
    if (!lifecycle_initialized())
    {
        return;
    }
    pImpl->shutdown();
}

void Logger::flush()
{
    if (!logger_is_running() || pImpl->shutdown_requested_.load())
        return;
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(FlushCommand{promise});
    (void)future.get(); // false only if rejected during shutdown
}

void Logger::set_level(Level lvl)
{
    pImpl->level_.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    return pImpl->level_.load(std::memory_order_relaxed);
}

void Logger::set_max_queue_size(size_t max_size)
{
    std::lock_guard<std::mutex> lock(pImpl->queue_mutex_);
    pImpl->m_max_queue_size = (max_size > 0) ? max_size : 1;
}

size_t Logger::get_max_queue_size() const
{
    std::lock_guard<std::mutex> lock(pImpl->queue_mutex_);
    return pImpl->m_max_queue_size;
}

size_t Logger::get_total_dropped_since_sink_switch() const
{
    return pImpl->m_total_dropped_since_sink_switch.load(std::memory_order_relaxed);
}

void Logger::set_write_error_callback(std::function<void(const std::string &)> cb)
{
    if (!logger_is_running())
        return;
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(SetErrorCallbackCommand{std::move(cb), promise});
    (void)future.get();
}

bool Logger::should_log(Level lvl) const noexcept
{
    if (!logger_is_running())
        return false;
    return static_cast<int>(lvl) >= static_cast<int>(pImpl->level_.load(std::memory_order_relaxed));
}

bool Logger::enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept
{
    if (!logger_is_running())
        return false;
    try
    {
        return pImpl->enqueue_command(make_internal_message(lvl, std::move(body)));
    }
    catch (const std::exception &e)
    {
        // Allocation failure while queueing; nothing else can report it.
        std::fprintf(stderr, "[LOGGER] failed to enqueue message: %s\n", e.what());
        return false;
    }
}

// C-style callbacks for the lifecycle module.
void do_logger_startup(const char *arg)
{
    (void)arg;
    Logger::instance().pImpl->start_worker();
    g_logger_state.store(LoggerState::Initialized, std::memory_order_release);
}

static void do_logger_shutdown(const char *arg)
{
    (void)arg;
    LoggerState expected = LoggerState::Initialized;
    if (g_logger_state.compare_exchange_strong(expected, LoggerState::ShuttingDown,
                                               std::memory_order_acq_rel))
    {
        Logger::instance().shutdown();
        if (g_logger_state.load(std::memory_order_acquire) != LoggerState::Shutdown)
        {
            FBR_DEBUG("Logger worker exited without reaching Shutdown state. Forcing it.");
        }
        g_logger_state.store(LoggerState::Shutdown, std::memory_order_release);
    }
}

ModuleDef Logger::GetLifecycleModule()
{
    ModuleDef module("filebridge::utils::Logger");
    module.set_startup(&do_logger_startup);
    module.set_shutdown(&do_logger_shutdown, std::chrono::milliseconds(5000));
    return module;
}

} // namespace filebridge::utils
