#pragma once
/**
 * @file local_producer.hpp
 * @brief LocalProducerRuntime: an in-process ProducerBoundary serving memory and disk files.
 *
 * All reads run on one worker thread fed by a command queue, so shared-buffer completions
 * arrive on a thread other than the caller's, as they do with a real out-of-process runtime.
 * Files are grouped by "element" (the name a UI would give the file picker that holds them).
 *
 * Knobs for exercising the host side:
 *  - readiness: not ready until `inject_bootstrap()` plus `polls_until_ready` readiness
 *    probes, or never (`never_ready`);
 *  - `completion_delay`: sleep before each shared-buffer completion;
 *  - `shuffle_completions`: completions of one queue batch are delivered in random order;
 *  - `inject_shared_buffer_faults(n)`: the next `n` shared-buffer reads corrupt one byte of the
 *    buffer after writing it.
 *
 * Lifecycle: the worker starts in the constructor and is joined by `stop()` / the destructor.
 * Reads still queued at stop fail with "producer stopped".
 */
#include "filebridge_utils_export.h"
#include "transfer/producer_boundary.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace filebridge::transfer
{

struct LocalProducerOptions
{
    bool ready_at_start{false};
    bool never_ready{false};
    int polls_until_ready{0}; ///< is_ready() probes after inject_bootstrap() that still say no
    std::chrono::milliseconds completion_delay{0};
    bool shuffle_completions{false};
};

class FILEBRIDGE_UTILS_EXPORT LocalProducerRuntime : public ProducerBoundary
{
  public:
    explicit LocalProducerRuntime(LocalProducerOptions options = LocalProducerOptions{});
    ~LocalProducerRuntime() override;

    LocalProducerRuntime(const LocalProducerRuntime &) = delete;
    LocalProducerRuntime &operator=(const LocalProducerRuntime &) = delete;

    // --- ProducerBoundary ---
    bool is_ready() override;
    void inject_bootstrap() override;
    FileRef open_read(const std::string &element, int index) override;
    bool dispose(FileRef file_ref) override;
    int file_count(const std::string &element) override;
    FileInfo file_info(const std::string &element, int index) override;
    void clear_value(const std::string &element) override;
    std::future<std::optional<std::string>> read_marshalled(const ReadRequest &request) override;
    void read_unmarshalled(const UnmarshalledReadParams &params,
                           std::span<uint8_t> shared) override;
    void bind_completion_sink(CompletionSink *sink) override;

    // --- resources ---
    /// @brief Registers an in-memory file. `info.size` is overwritten with `bytes.size()`.
    void add_memory_file(const std::string &element, FileInfo info, std::vector<uint8_t> bytes);

    /**
     * @brief Registers a file on disk; metadata comes from the filesystem.
     * @throws TransferError if `path` is not a regular file.
     */
    void add_disk_file(const std::string &element, const std::filesystem::path &path);

    // --- test knobs ---
    void inject_shared_buffer_faults(int count);
    void set_completion_delay(std::chrono::milliseconds delay);
    void set_shuffle_completions(bool shuffle);

    /// @brief Blocks until every command queued so far has run and its completion was sent.
    void flush();

    /// @brief Stops the worker. Idempotent.
    void stop();

    [[nodiscard]] size_t open_count() const;
    [[nodiscard]] int bootstrap_count() const;
    [[nodiscard]] int ready_probe_count() const;

  private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace filebridge::transfer

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
