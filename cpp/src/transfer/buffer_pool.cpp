/**
 * @file buffer_pool.cpp
 * @brief BufferPool: leases tracked by id, idle buffers kept by capacity.
 */
#include "transfer/buffer_pool.hpp"
#include "transfer/transfer_errors.hpp"
#include "fbr_service.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <unordered_map>
#include <vector>

namespace filebridge::transfer
{

void TransferBuffer::zero_fill() const noexcept
{
    if (m_data != nullptr && m_size > 0)
    {
        std::memset(m_data, 0, m_size);
    }
}

struct BufferPool::Impl
{
    struct Storage
    {
        std::unique_ptr<uint8_t[]> bytes;
        size_t capacity{0};
    };

    size_t max_outstanding;
    size_t max_retained;

    mutable std::mutex mutex;
    uint64_t next_lease_id{1};
    std::unordered_map<uint64_t, Storage> leased;
    std::vector<Storage> idle;

    Impl(size_t max_out, size_t max_ret) : max_outstanding(max_out), max_retained(max_ret) {}

    Storage take_idle_or_allocate(size_t size)
    {
        // Smallest idle buffer that fits, so large buffers stay available for large reads.
        auto best = idle.end();
        for (auto it = idle.begin(); it != idle.end(); ++it)
        {
            if (it->capacity >= size && (best == idle.end() || it->capacity < best->capacity))
            {
                best = it;
            }
        }
        if (best != idle.end())
        {
            Storage s = std::move(*best);
            idle.erase(best);
            return s;
        }
        Storage s;
        // One byte minimum so that a zero-size lease still has a distinct, valid address.
        s.capacity = std::max<size_t>(size, 1);
        s.bytes = std::make_unique<uint8_t[]>(s.capacity);
        return s;
    }
};

BufferPool::BufferPool(size_t max_outstanding, size_t max_retained)
    : pImpl(std::make_unique<Impl>(max_outstanding, max_retained))
{
}

BufferPool::~BufferPool()
{
    if (pImpl && !pImpl->leased.empty())
    {
        LOGGER_WARN("BufferPool destroyed with {} buffer(s) still outstanding.",
                    pImpl->leased.size());
    }
}

TransferBuffer BufferPool::acquire(size_t size)
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (pImpl->max_outstanding != 0 && pImpl->leased.size() >= pImpl->max_outstanding)
    {
        throw BufferPoolExhausted(fmt::format(
            "Buffer pool exhausted: {} buffer(s) outstanding (limit {}).", pImpl->leased.size(),
            pImpl->max_outstanding));
    }

    Impl::Storage storage = pImpl->take_idle_or_allocate(size);
    const uint64_t lease_id = pImpl->next_lease_id++;
    uint8_t *data = storage.bytes.get();
    pImpl->leased.emplace(lease_id, std::move(storage));
    return TransferBuffer(data, size, lease_id);
}

ScopedBuffer BufferPool::acquire_scoped(size_t size)
{
    return ScopedBuffer(*this, acquire(size));
}

void BufferPool::release(const TransferBuffer &buffer)
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto it = pImpl->leased.find(buffer.m_lease_id);
    if (it == pImpl->leased.end() || it->second.bytes.get() != buffer.m_data)
    {
        throw std::logic_error(
            fmt::format("BufferPool::release: buffer (lease {}) is not outstanding from this pool",
                        buffer.m_lease_id));
    }

    Impl::Storage storage = std::move(it->second);
    pImpl->leased.erase(it);
    if (pImpl->idle.size() < pImpl->max_retained)
    {
        pImpl->idle.push_back(std::move(storage));
    }
}

size_t BufferPool::outstanding() const
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->leased.size();
}

size_t BufferPool::retained() const
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->idle.size();
}

size_t BufferPool::max_outstanding() const noexcept
{
    return pImpl->max_outstanding;
}

ScopedBuffer::~ScopedBuffer()
{
    if (m_pool == nullptr)
    {
        return;
    }
    try
    {
        m_pool->release(m_buffer);
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("ScopedBuffer: release failed: {}", e.what());
    }
}

} // namespace filebridge::transfer
