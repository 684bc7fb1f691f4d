#pragma once
/**
 * @file buffer_pool.hpp
 * @brief Pool of byte buffers used as shared-buffer read targets and verification operands.
 *
 * Buffers are handed out as `TransferBuffer` handles. A handle owns nothing; the pool keeps
 * ownership of the storage and tracks every buffer it handed out, so releasing a foreign
 * buffer or releasing twice is detected. Channels use `ScopedBuffer` so that every exit path
 * releases.
 *
 * ```cpp
 * auto lease = pool.acquire_scoped(dest.size());
 * lease.zero_fill();
 * boundary.read_unmarshalled(params, lease.span());
 * ```                                       // released when `lease` goes out of scope
 */
#include "filebridge_utils_export.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace filebridge::transfer
{

class BufferPool;

/**
 * @brief Non-owning view of a pooled buffer, valid until released.
 *
 * Its size is exactly the size that was requested. Contents are stale until zero-filled.
 */
class FILEBRIDGE_UTILS_EXPORT TransferBuffer
{
  public:
    TransferBuffer() = default;

    [[nodiscard]] uint8_t *data() const noexcept { return m_data; }
    [[nodiscard]] size_t size() const noexcept { return m_size; }
    [[nodiscard]] std::span<uint8_t> span() const noexcept { return {m_data, m_size}; }
    [[nodiscard]] bool valid() const noexcept { return m_data != nullptr; }

    void zero_fill() const noexcept;

  private:
    friend class BufferPool;
    TransferBuffer(uint8_t *data, size_t size, uint64_t lease_id)
        : m_data(data), m_size(size), m_lease_id(lease_id)
    {
    }

    uint8_t *m_data{nullptr};
    size_t m_size{0};
    uint64_t m_lease_id{0};
};

class ScopedBuffer;

class FILEBRIDGE_UTILS_EXPORT BufferPool
{
  public:
    /**
     * @param max_outstanding Buffers that may be out at once; 0 = unlimited.
     * @param max_retained    Idle buffers kept for reuse.
     */
    explicit BufferPool(size_t max_outstanding = 0, size_t max_retained = 16);
    ~BufferPool();

    BufferPool(const BufferPool &) = delete;
    BufferPool &operator=(const BufferPool &) = delete;

    /**
     * @brief Hands out a buffer of exactly `size` bytes. Contents are unspecified.
     *
     * Reuses an idle buffer whose capacity is at least `size`, else allocates.
     * @throws BufferPoolExhausted if `max_outstanding` buffers are already out.
     */
    [[nodiscard]] TransferBuffer acquire(size_t size);

    /// @brief `acquire` wrapped in an RAII lease.
    [[nodiscard]] ScopedBuffer acquire_scoped(size_t size);

    /**
     * @brief Returns a buffer to the pool.
     * @throws std::logic_error if `buffer` is not currently out from this pool (foreign
     *         buffer, double release, or a default-constructed handle).
     */
    void release(const TransferBuffer &buffer);

    [[nodiscard]] size_t outstanding() const;
    [[nodiscard]] size_t retained() const;
    [[nodiscard]] size_t max_outstanding() const noexcept;

  private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

/**
 * @brief Move-only lease that releases its buffer on destruction.
 */
class FILEBRIDGE_UTILS_EXPORT ScopedBuffer
{
  public:
    ScopedBuffer(BufferPool &pool, TransferBuffer buffer) noexcept
        : m_pool(&pool), m_buffer(buffer)
    {
    }
    ScopedBuffer(ScopedBuffer &&other) noexcept
        : m_pool(other.m_pool), m_buffer(other.m_buffer)
    {
        other.m_pool = nullptr;
    }
    ScopedBuffer &operator=(ScopedBuffer &&) = delete;
    ScopedBuffer(const ScopedBuffer &) = delete;
    ScopedBuffer &operator=(const ScopedBuffer &) = delete;

    ~ScopedBuffer();

    [[nodiscard]] const TransferBuffer &get() const noexcept { return m_buffer; }
    [[nodiscard]] std::span<uint8_t> span() const noexcept { return m_buffer.span(); }
    [[nodiscard]] size_t size() const noexcept { return m_buffer.size(); }
    void zero_fill() const noexcept { m_buffer.zero_fill(); }

  private:
    BufferPool *m_pool;
    TransferBuffer m_buffer;
};

} // namespace filebridge::transfer

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
