#pragma once
/**
 * @file producer_boundary.hpp
 * @brief The two abstract seams between the host side and the producer runtime.
 *
 * `ProducerBoundary` is what the host consumes: resource management plus the two read paths.
 * `CompletionSink` is what the host exposes back: the producer calls it from its own thread
 * when a shared-buffer read finishes.
 *
 * The producer owns its thread and its resource registry. It must treat `read_unmarshalled`
 * as fire-and-forget: the call returns before the bytes are written, and the byte count comes
 * back later through the sink, tagged with `params.task_id`.
 */
#include "filebridge_utils_export.h"
#include "transfer/transfer_types.hpp"

#include <future>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace filebridge::transfer
{

class FILEBRIDGE_UTILS_EXPORT CompletionSink
{
  public:
    virtual ~CompletionSink() = default;

    /// @brief A shared-buffer read finished. Unknown ids are logged and ignored.
    virtual void on_read_completed(uint64_t task_id, uint32_t bytes_read) noexcept = 0;

    /// @brief A shared-buffer read failed on the producer side.
    virtual void on_read_failed(uint64_t task_id, std::string_view message) noexcept = 0;
};

class FILEBRIDGE_UTILS_EXPORT ProducerBoundary
{
  public:
    virtual ~ProducerBoundary() = default;

    // --- readiness ---
    [[nodiscard]] virtual bool is_ready() = 0;
    /// @brief Loads the producer's support code. Called at most once per coordinator.
    virtual void inject_bootstrap() = 0;

    // --- resources ---
    /**
     * @brief Opens file `index` of `element` for reading.
     * @throws TransferError if there is no such file.
     */
    virtual FileRef open_read(const std::string &element, int index) = 0;
    /// @return false if `file_ref` was not open.
    virtual bool dispose(FileRef file_ref) = 0;
    virtual int file_count(const std::string &element) = 0;
    /// @throws TransferError if there is no such file.
    virtual FileInfo file_info(const std::string &element, int index) = 0;
    virtual void clear_value(const std::string &element) = 0;

    // --- reads ---
    /**
     * @brief Encoded read. The future yields base64 text, or nullopt / an empty string for
     *        zero bytes, or holds the producer's exception.
     */
    virtual std::future<std::optional<std::string>> read_marshalled(const ReadRequest &request) = 0;

    /**
     * @brief Shared-buffer read. Writes up to `params.count` bytes into
     *        `shared[params.buffer_offset..]` and then signals the bound sink.
     *
     * `shared` stays valid until the sink has been called for `params.task_id`, even when the
     * host has stopped waiting. A producer that finds no sink bound must drop the read without
     * touching `shared`; `bind_completion_sink(nullptr)` must not return while a write into a
     * shared buffer is in progress.
     */
    virtual void read_unmarshalled(const UnmarshalledReadParams &params,
                                   std::span<uint8_t> shared) = 0;

    /// @brief Sets the sink that receives shared-buffer completions. nullptr unbinds.
    virtual void bind_completion_sink(CompletionSink *sink) = 0;
};

} // namespace filebridge::transfer
