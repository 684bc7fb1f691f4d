#include "transfer/unmarshalled_channel.hpp"
#include "transfer/transfer_errors.hpp"
#include "fbr_service.hpp"

#include <algorithm>
#include <cstring>
#include <type_traits>

namespace filebridge::transfer
{

namespace
{
template <class> inline constexpr bool kAlwaysFalse = false;

uint8_t marker_for(CorrelationId id) noexcept
{
    return static_cast<uint8_t>(id % 255);
}
} // namespace

struct UnmarshalledChannel::Attempt
{
    CorrelationId id;
    uint32_t bytes_read;
    VerificationReport report;
    ScopedBuffer shared;
    ScopedBuffer reference;
};

UnmarshalledChannel::UnmarshalledChannel(ProducerBoundary &boundary,
                                         CorrelationRegistry &registry, BufferPool &pool,
                                         MarshalledChannel &reference, IntegrityVerifier verifier,
                                         RetryPolicy policy)
    : m_boundary(boundary), m_registry(registry), m_pool(pool), m_reference(reference),
      m_verifier(verifier), m_policy(policy)
{
    m_policy.max_attempts = std::max(m_policy.max_attempts, 1);
}

UnmarshalledChannel::~UnmarshalledChannel()
{
    std::lock_guard<std::mutex> lock(m_orphan_mutex);
    if (!m_orphans.empty())
    {
        LOGGER_WARN("UnmarshalledChannel: releasing {} buffer(s) of canceled reads that never "
                    "completed.",
                    m_orphans.size());
    }
}

UnmarshalledChannel::Attempt UnmarshalledChannel::run_attempt(const ReadRequest &request,
                                                              size_t buffer_size,
                                                              std::stop_token stop)
{
    ScopedBuffer shared = m_pool.acquire_scoped(buffer_size);
    shared.zero_fill();

    PendingHandle handle = m_registry.begin();
    const uint8_t marker = marker_for(handle.id);
    if (shared.size() > 0)
    {
        shared.span()[0] = marker;
    }

    UnmarshalledReadParams params{};
    params.task_id = handle.id;
    params.buffer_offset = request.buffer_offset;
    params.count = static_cast<int32_t>(request.count);
    params.file_ref = request.file_ref;
    params.position = request.position;

    try
    {
        m_boundary.read_unmarshalled(params, shared.span());
    }
    catch (const TransferError &)
    {
        m_registry.abandon(handle.id);
        throw;
    }
    catch (const std::exception &e)
    {
        m_registry.abandon(handle.id);
        throw TransferError(fmt::format("Dispatch of shared-buffer read failed: {}", e.what()));
    }

    // A canceled buffer is parked in the same step that drops the slot, so a completion that
    // misses the slot always finds the buffer to release.
    bool parked = false;
    const auto park_on_cancel = [&]()
    {
        park_orphan(handle.id, std::move(shared));
        parked = true;
    };
    const CompletionOutcome outcome = m_registry.await_result(handle, stop, park_on_cancel);
    const uint32_t bytes_read = std::visit(
        [&](const auto &o) -> uint32_t
        {
            using T = std::decay_t<decltype(o)>;
            if constexpr (std::is_same_v<T, CompletionSuccess>)
            {
                return o.bytes_read;
            }
            else if constexpr (std::is_same_v<T, CompletionFailure>)
            {
                throw TransferError(o.message);
            }
            else if constexpr (std::is_same_v<T, CompletionCanceled>)
            {
                if (!parked)
                {
                    park_orphan(handle.id, std::move(shared));
                }
                throw TransferCanceled(fmt::format("Read of fileRef {} canceled: {}",
                                                   request.file_ref, o.reason));
            }
            else
            {
                static_assert(kAlwaysFalse<T>, "unhandled CompletionOutcome alternative");
            }
        },
        outcome);

    if (bytes_read > request.count)
    {
        throw TransferError(fmt::format(
            "Producer reported {} bytes read for fileRef {}, but only {} were requested.",
            bytes_read, request.file_ref, request.count));
    }

    ScopedBuffer reference = m_pool.acquire_scoped(buffer_size);
    reference.zero_fill();
    if (reference.size() > 0)
    {
        reference.span()[0] = marker;
    }
    m_reference.read_into(request.file_ref, request.position, request.count, reference.span(),
                          request.buffer_offset);

    VerificationReport report = m_verifier.verify(shared.span(), reference.span());
    return Attempt{handle.id, bytes_read, std::move(report), std::move(shared),
                   std::move(reference)};
}

void UnmarshalledChannel::log_mismatch(const ReadRequest &request, int attempt,
                                       const Attempt &result) const
{
    LOGGER_WARN("Shared-buffer read failed verification (attempt {}/{}): taskId={} fileRef={} "
                "position={} count={} bufferOffset={} bytesRead={}; {}",
                attempt, m_policy.max_attempts, result.id, request.file_ref, request.position,
                request.count, request.buffer_offset, result.bytes_read, result.report.summary());
    LOGGER_WARN("Verification dump for taskId={}:\n{}", result.id,
                m_verifier.describe_mismatch(result.report, result.shared.span(),
                                             result.reference.span()));
}

uint32_t UnmarshalledChannel::read(FileRef file_ref, uint64_t position, uint32_t count,
                                   std::span<uint8_t> dest, uint64_t buffer_offset,
                                   std::stop_token stop)
{
    if (count > kMaxReadCount)
    {
        throw InvalidReadRequest(fmt::format(
            "Shared-buffer read of {} bytes exceeds the {}-byte limit of one request.", count,
            kMaxReadCount));
    }
    const ReadRequest request{file_ref, position, count, buffer_offset};

    for (int attempt = 1;; ++attempt)
    {
        Attempt result = run_attempt(request, dest.size(), stop);
        if (result.report.match)
        {
            if (result.bytes_read > 0)
            {
                std::memcpy(dest.data() + buffer_offset, result.shared.span().data() + buffer_offset,
                            result.bytes_read);
            }
            if (attempt == 1)
            {
                return result.bytes_read;
            }
            if (!m_policy.report_recovered_as_failure)
            {
                LOGGER_WARN("Shared-buffer read of fileRef {} at {} verified after {} attempts.",
                            file_ref, position, attempt);
                return result.bytes_read;
            }
            LOGGER_ERROR("Shared-buffer read of fileRef {} at {} verified only after retrying; "
                         "reporting the call as broken.",
                         file_ref, position);
            throw TransferIntegrityError("Call was broken, but was correct after retrying",
                                         request, true);
        }

        m_integrity_failures.fetch_add(1, std::memory_order_relaxed);
        log_mismatch(request, attempt, result);
        if (attempt >= m_policy.max_attempts)
        {
            LOGGER_ERROR("Shared-buffer read of fileRef {} at {} count {} failed verification "
                         "{} time(s).",
                         file_ref, position, count, attempt);
            throw TransferIntegrityError("Call was broken", request, false);
        }
        m_retries.fetch_add(1, std::memory_order_relaxed);
    }
}

void UnmarshalledChannel::park_orphan(CorrelationId id, ScopedBuffer &&buffer)
{
    std::lock_guard<std::mutex> lock(m_orphan_mutex);
    if (m_producer_detached)
    {
        return; // left with the caller's lease, released on unwind
    }
    m_orphans.emplace(id, std::move(buffer));
}

bool UnmarshalledChannel::release_orphan(CorrelationId id) noexcept
{
    std::unordered_map<CorrelationId, ScopedBuffer>::node_type node;
    {
        std::lock_guard<std::mutex> lock(m_orphan_mutex);
        node = m_orphans.extract(id);
    }
    return !node.empty();
}

void UnmarshalledChannel::detach_producer() noexcept
{
    std::unordered_map<CorrelationId, ScopedBuffer> released;
    {
        std::lock_guard<std::mutex> lock(m_orphan_mutex);
        m_producer_detached = true;
        released.swap(m_orphans);
    }
    if (!released.empty())
    {
        LOGGER_DEBUG("UnmarshalledChannel: released {} parked buffer(s).", released.size());
    }
}

size_t UnmarshalledChannel::orphan_count() const
{
    std::lock_guard<std::mutex> lock(m_orphan_mutex);
    return m_orphans.size();
}

} // namespace filebridge::transfer
