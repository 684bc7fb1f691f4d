/**
 * @file local_producer.cpp
 * @brief LocalProducerRuntime: command-queue worker serving memory and disk files.
 */
#include "transfer/local_producer.hpp"
#include "transfer/transfer_errors.hpp"
#include "fbr_service.hpp"

#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <cstring>
#include <fstream>
#include <map>
#include <random>
#include <unordered_map>
#include <variant>

namespace filebridge::transfer
{

namespace
{

struct Resource
{
    FileInfo info;
    std::variant<std::vector<uint8_t>, std::filesystem::path> source;
};

struct MarshalledReadCommand
{
    ReadRequest request;
    std::promise<std::optional<std::string>> promise;
};

struct UnmarshalledReadCommand
{
    UnmarshalledReadParams params;
    std::span<uint8_t> shared;
};

struct FlushCommand
{
    std::promise<void> promise;
};

using Command = std::variant<MarshalledReadCommand, UnmarshalledReadCommand, FlushCommand>;

struct Signal
{
    uint64_t task_id;
    bool ok;
    uint32_t bytes_read;
    std::string message;
};

std::string guess_mime_type(const std::filesystem::path &path)
{
    static const std::map<std::string, std::string> kTypes = {
        {".txt", "text/plain"},         {".csv", "text/csv"},
        {".json", "application/json"},  {".bin", "application/octet-stream"},
        {".pdf", "application/pdf"},    {".png", "image/png"},
        {".jpg", "image/jpeg"},         {".jpeg", "image/jpeg"},
    };
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = kTypes.find(ext);
    return it != kTypes.end() ? it->second : std::string{};
}

/// Reads min(length - position, count) bytes of `resource`; empty at or past the end.
std::vector<uint8_t> read_resource(const Resource &resource, uint64_t position, uint32_t count)
{
    const uint64_t length = resource.info.size;
    if (position >= length || count == 0)
    {
        return {};
    }
    const auto n = static_cast<size_t>(std::min<uint64_t>(length - position, count));

    if (const auto *bytes = std::get_if<std::vector<uint8_t>>(&resource.source))
    {
        return std::vector<uint8_t>(bytes->begin() + static_cast<ptrdiff_t>(position),
                                    bytes->begin() + static_cast<ptrdiff_t>(position + n));
    }

    const auto &path = std::get<std::filesystem::path>(resource.source);
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        throw TransferError(fmt::format("Unable to open '{}' for reading.", path.string()));
    }
    in.seekg(static_cast<std::streamoff>(position));
    std::vector<uint8_t> out(n);
    in.read(reinterpret_cast<char *>(out.data()), static_cast<std::streamsize>(n));
    // A file that shrank after registration reads short.
    out.resize(static_cast<size_t>(std::max<std::streamsize>(in.gcount(), 0)));
    if (in.bad())
    {
        throw TransferError(fmt::format("I/O error reading '{}' at {}.", path.string(), position));
    }
    return out;
}

} // namespace

struct LocalProducerRuntime::Impl
{
    explicit Impl(LocalProducerOptions opts) : options(opts) {}

    void worker_loop();
    void enqueue(Command &&cmd);
    static void reject(Command &cmd, const std::string &reason);
    void handle(MarshalledReadCommand &cmd);
    void handle(UnmarshalledReadCommand &cmd, std::vector<Signal> &deferred);
    void deliver(const Signal &signal);
    std::shared_ptr<const Resource> find_open(FileRef ref) const;
    std::shared_ptr<const Resource> find_element_file(const std::string &element,
                                                      int index) const;

    LocalProducerOptions options;

    // resources
    mutable std::mutex resource_mutex;
    std::unordered_map<std::string, std::vector<std::shared_ptr<const Resource>>> elements;
    std::unordered_map<FileRef, std::shared_ptr<const Resource>> open_files;
    FileRef next_ref{1};

    // readiness
    mutable std::mutex ready_mutex;
    int bootstraps{0};
    int probes{0};
    int polls_seen{0};

    // completion sink; held while writing a shared buffer and while signaling
    std::mutex sink_mutex;
    CompletionSink *sink{nullptr};

    // worker
    std::thread worker;
    std::mutex queue_mutex;
    std::condition_variable cv;
    std::vector<Command> queue;
    bool stop_requested{false};

    std::atomic<int> faults_remaining{0};
    std::atomic<int64_t> delay_ms{0};
    std::atomic<bool> shuffle{false};
    std::mt19937 rng{std::random_device{}()};
};

void LocalProducerRuntime::Impl::reject(Command &cmd, const std::string &reason)
{
    std::visit(
        [&reason](auto &arg)
        {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (std::is_same_v<T, MarshalledReadCommand>)
            {
                arg.promise.set_exception(std::make_exception_ptr(TransferError(reason)));
            }
            else if constexpr (std::is_same_v<T, FlushCommand>)
            {
                arg.promise.set_value();
            }
        },
        cmd);
}

void LocalProducerRuntime::Impl::enqueue(Command &&cmd)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        if (!stop_requested)
        {
            queue.emplace_back(std::move(cmd));
            cv.notify_one();
            return;
        }
    }
    if (auto *unmarshalled = std::get_if<UnmarshalledReadCommand>(&cmd))
    {
        deliver(Signal{unmarshalled->params.task_id, false, 0, "producer stopped"});
        return;
    }
    reject(cmd, "producer stopped");
}

std::shared_ptr<const Resource> LocalProducerRuntime::Impl::find_open(FileRef ref) const
{
    std::lock_guard<std::mutex> lock(resource_mutex);
    auto it = open_files.find(ref);
    return it != open_files.end() ? it->second : nullptr;
}

std::shared_ptr<const Resource>
LocalProducerRuntime::Impl::find_element_file(const std::string &element, int index) const
{
    std::lock_guard<std::mutex> lock(resource_mutex);
    auto it = elements.find(element);
    if (it == elements.end() || index < 0 || static_cast<size_t>(index) >= it->second.size())
    {
        return nullptr;
    }
    return it->second[static_cast<size_t>(index)];
}

void LocalProducerRuntime::Impl::handle(MarshalledReadCommand &cmd)
{
    try
    {
        auto resource = find_open(cmd.request.file_ref);
        if (!resource)
        {
            throw TransferError(fmt::format("Invalid fileRef {}.", cmd.request.file_ref));
        }
        const std::vector<uint8_t> bytes =
            read_resource(*resource, cmd.request.position, cmd.request.count);
        if (bytes.empty())
        {
            cmd.promise.set_value(std::nullopt);
            return;
        }
        cmd.promise.set_value(crypto::encode_base64(bytes));
    }
    catch (const std::exception &)
    {
        cmd.promise.set_exception(std::current_exception());
    }
}

void LocalProducerRuntime::Impl::handle(UnmarshalledReadCommand &cmd, std::vector<Signal> &deferred)
{
    const auto &p = cmd.params;
    const int64_t delay = delay_ms.load(std::memory_order_relaxed);
    if (delay > 0)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(delay));
    }

    Signal signal{p.task_id, false, 0, {}};
    std::lock_guard<std::mutex> sink_lock(sink_mutex);
    if (sink == nullptr)
    {
        LOGGER_DEBUG("LocalProducer: no completion sink bound; dropping shared-buffer read {}.",
                     p.task_id);
        return;
    }

    try
    {
        auto resource = find_open(p.file_ref);
        if (!resource)
        {
            throw TransferError(fmt::format("Invalid fileRef {}.", p.file_ref));
        }
        if (p.count < 0 || p.buffer_offset > cmd.shared.size() ||
            static_cast<uint64_t>(p.count) > cmd.shared.size() - p.buffer_offset)
        {
            throw TransferError(fmt::format("Read of {} bytes at buffer offset {} does not fit a "
                                            "{}-byte buffer.",
                                            p.count, p.buffer_offset, cmd.shared.size()));
        }
        const std::vector<uint8_t> bytes =
            read_resource(*resource, p.position, static_cast<uint32_t>(p.count));
        if (!bytes.empty())
        {
            std::memcpy(cmd.shared.data() + p.buffer_offset, bytes.data(), bytes.size());
        }

        if (!cmd.shared.empty() && faults_remaining.load(std::memory_order_relaxed) > 0 &&
            faults_remaining.fetch_sub(1, std::memory_order_relaxed) > 0)
        {
            size_t at = p.buffer_offset + bytes.size() / 2;
            if (at >= cmd.shared.size())
            {
                at = 0;
            }
            cmd.shared[at] ^= 0xFF;
            LOGGER_DEBUG("LocalProducer: corrupted byte {} of shared buffer for read {}.", at,
                         p.task_id);
        }

        signal.ok = true;
        signal.bytes_read = static_cast<uint32_t>(bytes.size());
    }
    catch (const std::exception &e)
    {
        signal.message = e.what();
    }

    if (shuffle.load(std::memory_order_relaxed))
    {
        deferred.push_back(std::move(signal));
        return;
    }
    if (signal.ok)
    {
        sink->on_read_completed(signal.task_id, signal.bytes_read);
    }
    else
    {
        sink->on_read_failed(signal.task_id, signal.message);
    }
}

void LocalProducerRuntime::Impl::deliver(const Signal &signal)
{
    std::lock_guard<std::mutex> sink_lock(sink_mutex);
    if (sink == nullptr)
    {
        return;
    }
    if (signal.ok)
    {
        sink->on_read_completed(signal.task_id, signal.bytes_read);
    }
    else
    {
        sink->on_read_failed(signal.task_id, signal.message);
    }
}

void LocalProducerRuntime::Impl::worker_loop()
{
    std::vector<Command> local_queue;
    std::vector<Signal> deferred;

    while (true)
    {
        bool stopping = false;
        {
            std::unique_lock<std::mutex> lock(queue_mutex);
            cv.wait(lock, [this] { return !queue.empty() || stop_requested; });
            local_queue.swap(queue);
            stopping = stop_requested;
        }

        std::vector<FlushCommand *> flushes;
        for (auto &cmd : local_queue)
        {
            if (stopping)
            {
                if (auto *unmarshalled = std::get_if<UnmarshalledReadCommand>(&cmd))
                {
                    deliver(Signal{unmarshalled->params.task_id, false, 0, "producer stopped"});
                }
                else
                {
                    reject(cmd, "producer stopped");
                }
                continue;
            }
            std::visit(
                [&, this](auto &arg)
                {
                    using T = std::decay_t<decltype(arg)>;
                    if constexpr (std::is_same_v<T, MarshalledReadCommand>)
                    {
                        handle(arg);
                    }
                    else if constexpr (std::is_same_v<T, UnmarshalledReadCommand>)
                    {
                        handle(arg, deferred);
                    }
                    else if constexpr (std::is_same_v<T, FlushCommand>)
                    {
                        flushes.push_back(&arg);
                    }
                },
                cmd);
        }

        if (!deferred.empty())
        {
            std::shuffle(deferred.begin(), deferred.end(), rng);
            for (const auto &signal : deferred)
            {
                deliver(signal);
            }
            deferred.clear();
        }
        for (auto *flush : flushes)
        {
            flush->promise.set_value();
        }
        local_queue.clear();

        if (stopping)
        {
            return;
        }
    }
}

// ============================================================================
// LocalProducerRuntime
// ============================================================================

LocalProducerRuntime::LocalProducerRuntime(LocalProducerOptions options)
    : pImpl(std::make_unique<Impl>(options))
{
    pImpl->delay_ms.store(options.completion_delay.count());
    pImpl->shuffle.store(options.shuffle_completions);
    pImpl->worker = std::thread(&Impl::worker_loop, pImpl.get());
}

LocalProducerRuntime::~LocalProducerRuntime()
{
    stop();
}

void LocalProducerRuntime::stop()
{
    {
        std::lock_guard<std::mutex> lock(pImpl->queue_mutex);
        pImpl->stop_requested = true;
    }
    pImpl->cv.notify_all();
    if (pImpl->worker.joinable())
    {
        pImpl->worker.join();
    }
}

bool LocalProducerRuntime::is_ready()
{
    std::lock_guard<std::mutex> lock(pImpl->ready_mutex);
    ++pImpl->probes;
    if (pImpl->options.ready_at_start)
    {
        return true;
    }
    if (pImpl->options.never_ready || pImpl->bootstraps == 0)
    {
        return false;
    }
    if (pImpl->polls_seen >= pImpl->options.polls_until_ready)
    {
        return true;
    }
    ++pImpl->polls_seen;
    return false;
}

void LocalProducerRuntime::inject_bootstrap()
{
    std::lock_guard<std::mutex> lock(pImpl->ready_mutex);
    ++pImpl->bootstraps;
    LOGGER_DEBUG("LocalProducer: bootstrap injected ({}).", pImpl->bootstraps);
}

FileRef LocalProducerRuntime::open_read(const std::string &element, int index)
{
    auto resource = pImpl->find_element_file(element, index);
    if (!resource)
    {
        throw TransferError(fmt::format("No file {} in element '{}'.", index, element));
    }
    std::lock_guard<std::mutex> lock(pImpl->resource_mutex);
    const FileRef ref = pImpl->next_ref++;
    pImpl->open_files.emplace(ref, std::move(resource));
    return ref;
}

bool LocalProducerRuntime::dispose(FileRef file_ref)
{
    std::lock_guard<std::mutex> lock(pImpl->resource_mutex);
    return pImpl->open_files.erase(file_ref) != 0;
}

int LocalProducerRuntime::file_count(const std::string &element)
{
    std::lock_guard<std::mutex> lock(pImpl->resource_mutex);
    auto it = pImpl->elements.find(element);
    return it != pImpl->elements.end() ? static_cast<int>(it->second.size()) : 0;
}

FileInfo LocalProducerRuntime::file_info(const std::string &element, int index)
{
    auto resource = pImpl->find_element_file(element, index);
    if (!resource)
    {
        throw TransferError(fmt::format("No file {} in element '{}'.", index, element));
    }
    return resource->info;
}

void LocalProducerRuntime::clear_value(const std::string &element)
{
    std::lock_guard<std::mutex> lock(pImpl->resource_mutex);
    pImpl->elements.erase(element);
}

std::future<std::optional<std::string>>
LocalProducerRuntime::read_marshalled(const ReadRequest &request)
{
    MarshalledReadCommand cmd{request, {}};
    auto future = cmd.promise.get_future();
    pImpl->enqueue(std::move(cmd));
    return future;
}

void LocalProducerRuntime::read_unmarshalled(const UnmarshalledReadParams &params,
                                             std::span<uint8_t> shared)
{
    pImpl->enqueue(UnmarshalledReadCommand{params, shared});
}

void LocalProducerRuntime::bind_completion_sink(CompletionSink *sink)
{
    std::lock_guard<std::mutex> lock(pImpl->sink_mutex);
    pImpl->sink = sink;
}

void LocalProducerRuntime::add_memory_file(const std::string &element, FileInfo info,
                                           std::vector<uint8_t> bytes)
{
    auto resource = std::make_shared<Resource>();
    info.size = bytes.size();
    resource->info = std::move(info);
    resource->source = std::move(bytes);

    std::lock_guard<std::mutex> lock(pImpl->resource_mutex);
    pImpl->elements[element].push_back(std::move(resource));
}

void LocalProducerRuntime::add_disk_file(const std::string &element,
                                         const std::filesystem::path &path)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec))
    {
        throw TransferError(fmt::format("'{}' is not a regular file.", path.string()));
    }
    auto resource = std::make_shared<Resource>();
    resource->info.name = path.filename().string();
    resource->info.size = std::filesystem::file_size(path);
    resource->info.type = guess_mime_type(path);
    const auto mtime = std::chrono::file_clock::to_sys(std::filesystem::last_write_time(path));
    resource->info.last_modified_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(mtime.time_since_epoch()).count();
    resource->info.non_standard_properties = nlohmann::json{{"path", path.string()}};
    resource->source = path;

    std::lock_guard<std::mutex> lock(pImpl->resource_mutex);
    pImpl->elements[element].push_back(std::move(resource));
}

void LocalProducerRuntime::inject_shared_buffer_faults(int count)
{
    pImpl->faults_remaining.store(std::max(count, 0), std::memory_order_relaxed);
}

void LocalProducerRuntime::set_completion_delay(std::chrono::milliseconds delay)
{
    pImpl->delay_ms.store(delay.count(), std::memory_order_relaxed);
}

void LocalProducerRuntime::set_shuffle_completions(bool shuffle)
{
    pImpl->shuffle.store(shuffle, std::memory_order_relaxed);
}

void LocalProducerRuntime::flush()
{
    FlushCommand cmd;
    auto done = cmd.promise.get_future();
    pImpl->enqueue(std::move(cmd));
    done.wait();
}

size_t LocalProducerRuntime::open_count() const
{
    std::lock_guard<std::mutex> lock(pImpl->resource_mutex);
    return pImpl->open_files.size();
}

int LocalProducerRuntime::bootstrap_count() const
{
    std::lock_guard<std::mutex> lock(pImpl->ready_mutex);
    return pImpl->bootstraps;
}

int LocalProducerRuntime::ready_probe_count() const
{
    std::lock_guard<std::mutex> lock(pImpl->ready_mutex);
    return pImpl->probes;
}

} // namespace filebridge::transfer
