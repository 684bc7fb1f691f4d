// tests/test_layer3_transfer/fake_producer.h
#pragma once
/**
 * @file fake_producer.h
 * @brief A synchronous, scriptable ProducerBoundary for protocol-violation tests.
 *
 * Serves one in-memory file under the element "input". Both read paths answer inline on the
 * caller's thread unless a handler is installed; handlers can return bad payloads, report more
 * bytes than requested, fail, or throw from the dispatch itself. For realistic cross-thread
 * behavior use LocalProducerRuntime instead.
 */
#include "fbr_transfer.hpp"

#include <algorithm>
#include <atomic>
#include <cstring>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace filebridge::tests::helper
{

class FakeProducer : public filebridge::transfer::ProducerBoundary
{
  public:
    using ReadRequest = filebridge::transfer::ReadRequest;
    using UnmarshalledReadParams = filebridge::transfer::UnmarshalledReadParams;
    using CompletionSink = filebridge::transfer::CompletionSink;

    using MarshalledFn = std::function<std::optional<std::string>(const ReadRequest &)>;
    using UnmarshalledFn =
        std::function<void(const UnmarshalledReadParams &, std::span<uint8_t>, CompletionSink &)>;

    explicit FakeProducer(std::vector<uint8_t> contents) : m_contents(std::move(contents)) {}

    // --- scripting ---
    bool ready{true};
    MarshalledFn on_marshalled;
    UnmarshalledFn on_unmarshalled;

    const std::vector<uint8_t> &contents() const { return m_contents; }
    int bootstrap_count() const { return m_bootstraps.load(); }
    int marshalled_calls() const { return m_marshalled_calls.load(); }
    int unmarshalled_calls() const { return m_unmarshalled_calls.load(); }
    int disposed_count() const { return m_disposed.load(); }
    CompletionSink *bound_sink()
    {
        std::lock_guard<std::mutex> lock(m_sink_mutex);
        return m_sink;
    }

    /// The slice of the file a well-behaved producer returns.
    std::vector<uint8_t> slice(uint64_t position, uint32_t count) const
    {
        if (position >= m_contents.size())
            return {};
        const auto n = static_cast<size_t>(std::min<uint64_t>(m_contents.size() - position, count));
        return std::vector<uint8_t>(m_contents.begin() + static_cast<ptrdiff_t>(position),
                                    m_contents.begin() + static_cast<ptrdiff_t>(position + n));
    }

    // --- ProducerBoundary ---
    bool is_ready() override { return ready; }
    void inject_bootstrap() override { ++m_bootstraps; }

    filebridge::transfer::FileRef open_read(const std::string &element, int index) override
    {
        if (element != "input" || index != 0)
            throw filebridge::transfer::TransferError("No such file.");
        return m_next_ref++;
    }
    bool dispose(filebridge::transfer::FileRef) override
    {
        ++m_disposed;
        return true;
    }
    int file_count(const std::string &element) override { return element == "input" ? 1 : 0; }
    filebridge::transfer::FileInfo file_info(const std::string &element, int index) override
    {
        if (element != "input" || index != 0)
            throw filebridge::transfer::TransferError("No such file.");
        filebridge::transfer::FileInfo info;
        info.name = "input.bin";
        info.size = m_contents.size();
        info.type = "application/octet-stream";
        return info;
    }
    void clear_value(const std::string &) override {}

    std::future<std::optional<std::string>> read_marshalled(const ReadRequest &request) override
    {
        ++m_marshalled_calls;
        std::promise<std::optional<std::string>> promise;
        try
        {
            if (on_marshalled)
            {
                promise.set_value(on_marshalled(request));
            }
            else
            {
                const auto bytes = slice(request.position, request.count);
                promise.set_value(bytes.empty() ? std::nullopt
                                                : std::optional<std::string>(
                                                      filebridge::crypto::encode_base64(bytes)));
            }
        }
        catch (const std::exception &)
        {
            promise.set_exception(std::current_exception());
        }
        return promise.get_future();
    }

    void read_unmarshalled(const UnmarshalledReadParams &params,
                           std::span<uint8_t> shared) override
    {
        ++m_unmarshalled_calls;
        std::lock_guard<std::mutex> lock(m_sink_mutex);
        if (m_sink == nullptr)
            return;
        if (on_unmarshalled)
        {
            on_unmarshalled(params, shared, *m_sink);
            return;
        }
        const auto bytes = slice(params.position, static_cast<uint32_t>(params.count));
        if (!bytes.empty())
            std::memcpy(shared.data() + params.buffer_offset, bytes.data(), bytes.size());
        m_sink->on_read_completed(params.task_id, static_cast<uint32_t>(bytes.size()));
    }

    void bind_completion_sink(CompletionSink *sink) override
    {
        std::lock_guard<std::mutex> lock(m_sink_mutex);
        m_sink = sink;
    }

  private:
    std::vector<uint8_t> m_contents;
    std::atomic<int> m_bootstraps{0};
    std::atomic<int> m_marshalled_calls{0};
    std::atomic<int> m_unmarshalled_calls{0};
    std::atomic<int> m_disposed{0};
    std::atomic<filebridge::transfer::FileRef> m_next_ref{1};
    std::mutex m_sink_mutex;
    CompletionSink *m_sink{nullptr};
};

/// TransferConfig for tests: no readiness wait, optionally on the shared-buffer path.
inline filebridge::utils::TransferConfig fast_config(bool use_shared_buffer)
{
    filebridge::utils::TransferConfig cfg;
    cfg.use_shared_buffer = use_shared_buffer;
    cfg.init_poll_attempts = 3;
    cfg.init_poll_interval = std::chrono::milliseconds(0);
    return cfg;
}

} // namespace filebridge::tests::helper
