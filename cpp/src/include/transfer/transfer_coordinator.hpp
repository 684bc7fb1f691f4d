#pragma once
/**
 * @file transfer_coordinator.hpp
 * @brief TransferCoordinator: the host-side entry point for reading producer-side files.
 *
 * Owns the correlation registry, the buffer pool and both channels, and is the
 * CompletionSink the producer reports shared-buffer completions to. The read path
 * (encoded or shared-buffer) is fixed at construction by `use_shared_buffer`.
 *
 * ```cpp
 * LocalProducerRuntime producer;
 * TransferCoordinator coordinator(producer, TransferConfig::current());
 * FileRef ref = coordinator.open_read("input", 0);
 * std::vector<uint8_t> buf(4096);
 * uint32_t n = coordinator.read_range(ref, 0, 4096, buf);
 * ```
 *
 * Thread safety: every public method may be called concurrently. Reads are independent of
 * one another; only initialization is serialized.
 */
#include "filebridge_utils_export.h"
#include "transfer/buffer_pool.hpp"
#include "transfer/correlation_registry.hpp"
#include "transfer/marshalled_channel.hpp"
#include "transfer/producer_boundary.hpp"
#include "transfer/unmarshalled_channel.hpp"
#include "utils/transfer_config.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <span>
#include <stop_token>
#include <string>
#include <unordered_set>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace filebridge::transfer
{

struct TransferStats
{
    uint64_t reads{0};            ///< read_range / read_range_base64 calls that returned
    uint64_t bytes_read{0};
    uint64_t failed_reads{0};     ///< calls that threw anything but TransferCanceled
    uint64_t canceled_reads{0};
    uint64_t integrity_failures{0};
    uint64_t retries{0};
    uint64_t unknown_completions{0};
};

class FILEBRIDGE_UTILS_EXPORT TransferCoordinator : public CompletionSink
{
  public:
    /**
     * @brief Binds itself as `boundary`'s completion sink. `boundary` must outlive it.
     */
    explicit TransferCoordinator(ProducerBoundary &boundary,
                                 const utils::TransferConfig &config = utils::TransferConfig{});
    ~TransferCoordinator() override;

    TransferCoordinator(const TransferCoordinator &) = delete;
    TransferCoordinator &operator=(const TransferCoordinator &) = delete;

    /**
     * @brief Reads up to `count` bytes at `position` into `dest[buffer_offset..]`.
     *
     * `count` is clamped to `dest.size() - buffer_offset` and to kMaxReadCount.
     * @return Bytes read; 0 at or past the end of the file.
     * @throws InvalidReadRequest if `buffer_offset > dest.size()` or `file_ref` is not open.
     * @throws TransferError (or a subclass) from the channel; see UnmarshalledChannel::read.
     */
    uint32_t read_range(FileRef file_ref, uint64_t position, uint32_t count,
                        std::span<uint8_t> dest, uint64_t buffer_offset = 0,
                        std::stop_token stop = {});

    /**
     * @brief Base64 text of up to `count` bytes at `position`, always over the encoded path.
     */
    std::string read_range_base64(FileRef file_ref, uint64_t position, uint32_t count,
                                  std::stop_token stop = {});

    // --- CompletionSink ---
    void on_read_completed(uint64_t task_id, uint32_t bytes_read) noexcept override;
    void on_read_failed(uint64_t task_id, std::string_view message) noexcept override;

    /**
     * @brief Makes sure the producer runtime is loaded.
     *
     * Probes is_ready(); if false, injects the bootstrap (once per coordinator) and polls up to
     * `init_poll_attempts` times, sleeping `init_poll_interval` before each poll.
     * @throws InitializationTimeoutError if the producer never reports ready.
     */
    void ensure_initialized();
    [[nodiscard]] bool is_initialized() const noexcept;

    // --- producer passthroughs ---
    FileRef open_read(const std::string &element, int index);
    bool dispose(FileRef file_ref);
    int file_count(const std::string &element);
    FileInfo file_info(const std::string &element, int index);
    void clear_value(const std::string &element);

    /**
     * @brief Cancels pending reads, unbinds from the producer and rejects further reads.
     *        Idempotent.
     *
     * A shared-buffer read already past the accepting check when this runs fails with
     * TransferCanceled instead of registering a slot nobody would complete.
     */
    void shutdown() noexcept;
    [[nodiscard]] bool is_shut_down() const noexcept;

    [[nodiscard]] TransferStats stats() const;
    [[nodiscard]] bool uses_shared_buffer() const noexcept { return m_config.use_shared_buffer; }
    [[nodiscard]] const utils::TransferConfig &config() const noexcept { return m_config; }

    /// @brief Exposed for diagnostics and tests.
    [[nodiscard]] const BufferPool &pool() const noexcept { return m_pool; }
    [[nodiscard]] const CorrelationRegistry &registry() const noexcept { return m_registry; }

  private:
    void initialize_if_configured();
    void check_accepting() const;
    void check_file_ref(FileRef file_ref) const;
    template <typename Fn> auto run_read(Fn &&fn) -> decltype(fn());

    ProducerBoundary &m_boundary;
    const utils::TransferConfig m_config;

    CorrelationRegistry m_registry;
    BufferPool m_pool;
    MarshalledChannel m_marshalled;
    UnmarshalledChannel m_unmarshalled;

    mutable std::mutex m_init_mutex;
    std::atomic<bool> m_ready{false};
    bool m_bootstrap_injected{false};

    mutable std::mutex m_refs_mutex;
    std::unordered_set<FileRef> m_open_refs;

    std::mutex m_shutdown_mutex;
    std::atomic<bool> m_shut_down{false};

    std::atomic<uint64_t> m_reads{0};
    std::atomic<uint64_t> m_bytes_read{0};
    std::atomic<uint64_t> m_failed_reads{0};
    std::atomic<uint64_t> m_canceled_reads{0};
};

} // namespace filebridge::transfer

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
