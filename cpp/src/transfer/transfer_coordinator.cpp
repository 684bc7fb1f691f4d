#include "transfer/transfer_coordinator.hpp"
#include "transfer/transfer_errors.hpp"
#include "fbr_service.hpp"

#include <algorithm>

namespace filebridge::transfer
{

namespace
{
RetryPolicy make_retry_policy(const utils::TransferConfig &config)
{
    RetryPolicy policy;
    policy.report_recovered_as_failure = config.report_recovered_as_failure;
    return policy;
}
} // namespace

TransferCoordinator::TransferCoordinator(ProducerBoundary &boundary,
                                         const utils::TransferConfig &config)
    : m_boundary(boundary), m_config(config),
      m_pool(config.pool_max_outstanding, config.pool_max_retained), m_marshalled(boundary),
      m_unmarshalled(boundary, m_registry, m_pool, m_marshalled,
                     IntegrityVerifier(config.diagnostics_dump_bytes), make_retry_policy(config))
{
    m_boundary.bind_completion_sink(this);
    LOGGER_DEBUG("TransferCoordinator created: {} path, lazy init {}, {} poll(s) every {}ms.",
                 m_config.use_shared_buffer ? "shared-buffer" : "encoded",
                 m_config.initialize_on_first_call, m_config.init_poll_attempts,
                 m_config.init_poll_interval.count());
}

TransferCoordinator::~TransferCoordinator()
{
    shutdown();
}

// ============================================================================
// Reads
// ============================================================================

template <typename Fn> auto TransferCoordinator::run_read(Fn &&fn) -> decltype(fn())
{
    try
    {
        auto result = fn();
        m_reads.fetch_add(1, std::memory_order_relaxed);
        return result;
    }
    catch (const TransferCanceled &)
    {
        m_canceled_reads.fetch_add(1, std::memory_order_relaxed);
        throw;
    }
    catch (const std::exception &)
    {
        m_failed_reads.fetch_add(1, std::memory_order_relaxed);
        throw;
    }
}

uint32_t TransferCoordinator::read_range(FileRef file_ref, uint64_t position, uint32_t count,
                                         std::span<uint8_t> dest, uint64_t buffer_offset,
                                         std::stop_token stop)
{
    return run_read(
        [&]() -> uint32_t
        {
            check_accepting();
            if (buffer_offset > dest.size())
            {
                throw InvalidReadRequest(
                    fmt::format("buffer_offset {} is past the end of a {}-byte destination.",
                                buffer_offset, dest.size()));
            }
            check_file_ref(file_ref);
            initialize_if_configured();
            if (stop.stop_requested())
            {
                throw TransferCanceled(fmt::format("Read of fileRef {} canceled before dispatch.",
                                                   file_ref));
            }

            const uint64_t capacity = dest.size() - buffer_offset;
            const auto clamped = static_cast<uint32_t>(
                std::min<uint64_t>({count, capacity, uint64_t{kMaxReadCount}}));

            const uint32_t bytes_read =
                m_config.use_shared_buffer
                    ? m_unmarshalled.read(file_ref, position, clamped, dest, buffer_offset, stop)
                    : m_marshalled.read_into(file_ref, position, clamped, dest, buffer_offset);

            m_bytes_read.fetch_add(bytes_read, std::memory_order_relaxed);
            LOGGER_TRACE("read_range fileRef {} pos {} count {} -> {}", file_ref, position,
                         clamped, bytes_read);
            return bytes_read;
        });
}

std::string TransferCoordinator::read_range_base64(FileRef file_ref, uint64_t position,
                                                   uint32_t count, std::stop_token stop)
{
    return run_read(
        [&]() -> std::string
        {
            check_accepting();
            check_file_ref(file_ref);
            initialize_if_configured();
            if (stop.stop_requested())
            {
                throw TransferCanceled(fmt::format("Read of fileRef {} canceled before dispatch.",
                                                   file_ref));
            }
            return m_marshalled.read_base64(file_ref, position, count);
        });
}

// ============================================================================
// CompletionSink
// ============================================================================

void TransferCoordinator::on_read_completed(uint64_t task_id, uint32_t bytes_read) noexcept
{
    if (!m_registry.complete(task_id, bytes_read))
    {
        m_unmarshalled.release_orphan(task_id);
    }
}

void TransferCoordinator::on_read_failed(uint64_t task_id, std::string_view message) noexcept
{
    if (!m_registry.fail(task_id, message))
    {
        m_unmarshalled.release_orphan(task_id);
    }
}

// ============================================================================
// Initialization
// ============================================================================

void TransferCoordinator::initialize_if_configured()
{
    if (m_config.initialize_on_first_call)
    {
        ensure_initialized();
    }
}

void TransferCoordinator::ensure_initialized()
{
    if (m_ready.load(std::memory_order_acquire))
    {
        return;
    }
    std::lock_guard<std::mutex> lock(m_init_mutex);
    if (m_ready.load(std::memory_order_acquire))
    {
        return;
    }

    if (m_boundary.is_ready())
    {
        m_ready.store(true, std::memory_order_release);
        return;
    }

    if (!m_bootstrap_injected)
    {
        LOGGER_INFO("Producer runtime not loaded; injecting bootstrap.");
        m_boundary.inject_bootstrap();
        m_bootstrap_injected = true;
    }

    const utils::ConstantBackoff wait_between_polls(
        std::chrono::duration_cast<std::chrono::microseconds>(m_config.init_poll_interval));
    for (int poll = 1; poll <= m_config.init_poll_attempts; ++poll)
    {
        wait_between_polls(poll);
        if (m_boundary.is_ready())
        {
            LOGGER_INFO("Producer runtime ready after {} poll(s).", poll);
            m_ready.store(true, std::memory_order_release);
            return;
        }
    }

    LOGGER_ERROR("Producer runtime not ready after {} poll(s) of {}ms.",
                 m_config.init_poll_attempts, m_config.init_poll_interval.count());
    throw InitializationTimeoutError(
        fmt::format("Unable to initialize the producer runtime: not ready after {} poll(s).",
                    m_config.init_poll_attempts),
        m_config.init_poll_attempts);
}

bool TransferCoordinator::is_initialized() const noexcept
{
    return m_ready.load(std::memory_order_acquire);
}

// ============================================================================
// Passthroughs
// ============================================================================

FileRef TransferCoordinator::open_read(const std::string &element, int index)
{
    check_accepting();
    initialize_if_configured();
    const FileRef ref = m_boundary.open_read(element, index);
    {
        std::lock_guard<std::mutex> lock(m_refs_mutex);
        m_open_refs.insert(ref);
    }
    LOGGER_DEBUG("Opened '{}'[{}] as fileRef {}.", element, index, ref);
    return ref;
}

bool TransferCoordinator::dispose(FileRef file_ref)
{
    {
        std::lock_guard<std::mutex> lock(m_refs_mutex);
        m_open_refs.erase(file_ref);
    }
    if (m_shut_down.load(std::memory_order_acquire))
    {
        return false;
    }
    return m_boundary.dispose(file_ref);
}

int TransferCoordinator::file_count(const std::string &element)
{
    check_accepting();
    initialize_if_configured();
    return m_boundary.file_count(element);
}

FileInfo TransferCoordinator::file_info(const std::string &element, int index)
{
    check_accepting();
    initialize_if_configured();
    return m_boundary.file_info(element, index);
}

void TransferCoordinator::clear_value(const std::string &element)
{
    check_accepting();
    initialize_if_configured();
    m_boundary.clear_value(element);
}

// ============================================================================
// Shutdown / state
// ============================================================================

void TransferCoordinator::shutdown() noexcept
{
    std::lock_guard<std::mutex> lock(m_shutdown_mutex);
    if (m_shut_down.exchange(true, std::memory_order_acq_rel))
    {
        return;
    }
    m_registry.cancel_all("coordinator is shut down");
    try
    {
        m_boundary.bind_completion_sink(nullptr);
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("TransferCoordinator: unbinding from the producer failed: {}", e.what());
    }
    m_unmarshalled.detach_producer();
    LOGGER_DEBUG("TransferCoordinator shut down after {} read(s).",
                 m_reads.load(std::memory_order_relaxed));
}

bool TransferCoordinator::is_shut_down() const noexcept
{
    return m_shut_down.load(std::memory_order_acquire);
}

void TransferCoordinator::check_accepting() const
{
    if (m_shut_down.load(std::memory_order_acquire))
    {
        throw TransferError("coordinator is shut down");
    }
}

void TransferCoordinator::check_file_ref(FileRef file_ref) const
{
    if (file_ref < 0)
    {
        throw InvalidReadRequest(fmt::format("Invalid fileRef {}.", file_ref));
    }
    std::lock_guard<std::mutex> lock(m_refs_mutex);
    if (m_open_refs.count(file_ref) == 0)
    {
        throw InvalidReadRequest(fmt::format("fileRef {} is not open.", file_ref));
    }
}

TransferStats TransferCoordinator::stats() const
{
    TransferStats s;
    s.reads = m_reads.load(std::memory_order_relaxed);
    s.bytes_read = m_bytes_read.load(std::memory_order_relaxed);
    s.failed_reads = m_failed_reads.load(std::memory_order_relaxed);
    s.canceled_reads = m_canceled_reads.load(std::memory_order_relaxed);
    s.integrity_failures = m_unmarshalled.integrity_failures();
    s.retries = m_unmarshalled.retries();
    s.unknown_completions = m_registry.unknown_completions();
    return s;
}

} // namespace filebridge::transfer
