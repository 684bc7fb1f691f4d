#pragma once
/**
 * @file unmarshalled_channel.hpp
 * @brief UnmarshalledChannel: shared-buffer reads, verified against the encoded path.
 *
 * One call runs at most `RetryPolicy::max_attempts` attempts. An attempt:
 *
 *  1. rents buffer A, zero-fills it and stamps `id % 255` into A[0];
 *  2. dispatches A to the producer under a fresh correlation id and waits for the completion;
 *  3. rents buffer B, zero-fills it, stamps the same marker and reads the same range into it
 *     through the MarshalledChannel;
 *  4. compares A and B over their full length.
 *
 * A match on the first attempt copies the bytes into the caller's buffer and returns. A
 * mismatch is logged with a verification report and hex dumps, and the attempt is repeated
 * with new buffers and a new id. When the repeat matches, the bytes are copied but the call
 * still fails with TransferIntegrityError(recovered_on_retry = true), unless the policy says
 * otherwise.
 *
 * A buffer whose wait was canceled may still be written by the producer, so it is parked until
 * the late completion arrives (`release_orphan`) or the producer is detached.
 */
#include "filebridge_utils_export.h"
#include "transfer/buffer_pool.hpp"
#include "transfer/correlation_registry.hpp"
#include "transfer/integrity_verifier.hpp"
#include "transfer/marshalled_channel.hpp"
#include "transfer/producer_boundary.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <span>
#include <stop_token>
#include <unordered_map>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace filebridge::transfer
{

struct RetryPolicy
{
    int max_attempts{2};
    /// A call that only matched on retry still throws TransferIntegrityError.
    bool report_recovered_as_failure{true};
};

class FILEBRIDGE_UTILS_EXPORT UnmarshalledChannel
{
  public:
    UnmarshalledChannel(ProducerBoundary &boundary, CorrelationRegistry &registry,
                        BufferPool &pool, MarshalledChannel &reference,
                        IntegrityVerifier verifier = IntegrityVerifier{},
                        RetryPolicy policy = RetryPolicy{});
    ~UnmarshalledChannel();

    UnmarshalledChannel(const UnmarshalledChannel &) = delete;
    UnmarshalledChannel &operator=(const UnmarshalledChannel &) = delete;

    /**
     * @brief Verified shared-buffer read into `dest[buffer_offset..]`.
     *
     * The caller guarantees `buffer_offset + count <= dest.size()`.
     * @return Bytes read.
     * @throws TransferError             producer failure or protocol violation
     * @throws TransferIntegrityError    verification failed (see file comment)
     * @throws TransferCanceled          `stop` fired or the registry was canceled
     * @throws BufferPoolExhausted       no buffer could be rented
     */
    uint32_t read(FileRef file_ref, uint64_t position, uint32_t count, std::span<uint8_t> dest,
                  uint64_t buffer_offset, std::stop_token stop = {});

    /// @brief Releases the parked buffer of a canceled attempt. false if none is parked.
    bool release_orphan(CorrelationId id) noexcept;

    /**
     * @brief Releases every parked buffer; buffers canceled later are released at once.
     *
     * Call only after the producer can no longer write (its sink has been unbound).
     */
    void detach_producer() noexcept;

    [[nodiscard]] size_t orphan_count() const;

    [[nodiscard]] const RetryPolicy &policy() const noexcept { return m_policy; }
    [[nodiscard]] uint64_t integrity_failures() const noexcept { return m_integrity_failures.load(); }
    [[nodiscard]] uint64_t retries() const noexcept { return m_retries.load(); }

  private:
    struct Attempt;
    Attempt run_attempt(const ReadRequest &request, size_t buffer_size, std::stop_token stop);
    void park_orphan(CorrelationId id, ScopedBuffer &&buffer);
    void log_mismatch(const ReadRequest &request, int attempt, const Attempt &result) const;

    ProducerBoundary &m_boundary;
    CorrelationRegistry &m_registry;
    BufferPool &m_pool;
    MarshalledChannel &m_reference;
    IntegrityVerifier m_verifier;
    RetryPolicy m_policy;

    mutable std::mutex m_orphan_mutex;
    std::unordered_map<CorrelationId, ScopedBuffer> m_orphans;
    bool m_producer_detached{false};

    std::atomic<uint64_t> m_integrity_failures{0};
    std::atomic<uint64_t> m_retries{0};
};

} // namespace filebridge::transfer

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
