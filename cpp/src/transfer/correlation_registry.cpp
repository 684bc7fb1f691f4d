/**
 * @file correlation_registry.cpp
 * @brief CorrelationRegistry implementation: one map mutex, one mutex + condvar per slot.
 */
#include "transfer/correlation_registry.hpp"
#include "transfer/transfer_errors.hpp"
#include "fbr_service.hpp"

#include <condition_variable>
#include <optional>
#include <unordered_map>

namespace filebridge::transfer
{

// Ids are unique per process, not per registry, so a stale completion aimed at one
// coordinator can never alias a live request of another.
namespace
{
std::atomic<CorrelationId> g_next_correlation_id{1};
}

struct PendingCompletion
{
    std::mutex mutex;
    std::condition_variable_any cv;
    std::optional<CompletionOutcome> outcome;

    /// @return false if the slot was already fulfilled.
    bool fulfill(CompletionOutcome value)
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (outcome.has_value())
            {
                return false;
            }
            outcome = std::move(value);
        }
        cv.notify_all();
        return true;
    }
};

struct CorrelationRegistry::Impl
{
    mutable std::mutex map_mutex;
    std::unordered_map<CorrelationId, std::shared_ptr<PendingCompletion>> pending;
    bool closed{false};
    std::string closed_reason;
    std::atomic<uint64_t> unknown_count{0};

    std::shared_ptr<PendingCompletion> take(CorrelationId id)
    {
        std::lock_guard<std::mutex> lock(map_mutex);
        auto it = pending.find(id);
        if (it == pending.end())
        {
            return nullptr;
        }
        auto slot = std::move(it->second);
        pending.erase(it);
        return slot;
    }

    bool deliver(CorrelationId id, CompletionOutcome outcome, const char *what) noexcept
    {
        try
        {
            auto slot = take(id);
            if (!slot)
            {
                unknown_count.fetch_add(1, std::memory_order_relaxed);
                LOGGER_WARN("Unknown correlation id {} ({}); the request was already completed, "
                            "canceled or never issued.",
                            id, what);
                return false;
            }
            return slot->fulfill(std::move(outcome));
        }
        catch (const std::exception &e)
        {
            LOGGER_ERROR("CorrelationRegistry: failed to deliver {} for id {}: {}", what, id,
                         e.what());
            return false;
        }
    }
};

CorrelationRegistry::CorrelationRegistry() : pImpl(std::make_unique<Impl>()) {}

CorrelationRegistry::~CorrelationRegistry()
{
    if (pImpl)
    {
        cancel_all("correlation registry destroyed");
    }
}

PendingHandle CorrelationRegistry::begin()
{
    PendingHandle handle;
    handle.id = g_next_correlation_id.fetch_add(1, std::memory_order_relaxed);
    handle.completion = std::make_shared<PendingCompletion>();

    std::lock_guard<std::mutex> lock(pImpl->map_mutex);
    if (pImpl->closed)
    {
        throw TransferCanceled(pImpl->closed_reason);
    }
    pImpl->pending.emplace(handle.id, handle.completion);
    return handle;
}

bool CorrelationRegistry::complete(CorrelationId id, uint32_t bytes_read) noexcept
{
    return pImpl->deliver(id, CompletionSuccess{bytes_read}, "completion");
}

bool CorrelationRegistry::fail(CorrelationId id, std::string_view message) noexcept
{
    try
    {
        return pImpl->deliver(id, CompletionFailure{std::string(message)}, "failure");
    }
    catch (const std::exception &e)
    {
        // Only the std::string copy above can throw here.
        LOGGER_ERROR("CorrelationRegistry: failed to record failure for id {}: {}", id, e.what());
        return false;
    }
}

CompletionOutcome CorrelationRegistry::await_result(const PendingHandle &handle,
                                                    std::stop_token stop,
                                                    const std::function<void()> &on_cancel)
{
    PendingCompletion &slot = *handle.completion;
    {
        std::unique_lock<std::mutex> lock(slot.mutex);
        slot.cv.wait(lock, stop, [&slot] { return slot.outcome.has_value(); });
        if (slot.outcome.has_value())
        {
            return *slot.outcome;
        }
    }

    // Stop requested before the producer answered. The erase decides the race: whoever takes
    // the slot out of the map owns its fulfillment.
    std::shared_ptr<PendingCompletion> taken;
    {
        std::lock_guard<std::mutex> lock(pImpl->map_mutex);
        auto it = pImpl->pending.find(handle.id);
        if (it != pImpl->pending.end())
        {
            taken = std::move(it->second);
            pImpl->pending.erase(it);
            // A completion racing this one blocks on map_mutex and sees the hook's effect.
            if (on_cancel)
            {
                try
                {
                    on_cancel();
                }
                catch (const std::exception &e)
                {
                    LOGGER_ERROR("CorrelationRegistry: cancel hook for id {} failed: {}",
                                 handle.id, e.what());
                }
            }
        }
    }
    if (taken)
    {
        taken->fulfill(CompletionCanceled{"canceled by caller"});
    }
    // If someone else took it, their fulfill is already under way.
    std::unique_lock<std::mutex> lock(slot.mutex);
    slot.cv.wait(lock, [&slot] { return slot.outcome.has_value(); });
    return *slot.outcome;
}

void CorrelationRegistry::abandon(CorrelationId id) noexcept
{
    std::lock_guard<std::mutex> lock(pImpl->map_mutex);
    pImpl->pending.erase(id);
}

void CorrelationRegistry::cancel_all(std::string_view reason) noexcept
{
    std::unordered_map<CorrelationId, std::shared_ptr<PendingCompletion>> drained;
    {
        std::lock_guard<std::mutex> lock(pImpl->map_mutex);
        if (!pImpl->closed)
        {
            pImpl->closed = true;
            try
            {
                pImpl->closed_reason = std::string(reason);
            }
            catch (const std::exception &)
            {
                pImpl->closed_reason.clear(); // begin() still refuses, with an empty message
            }
        }
        drained.swap(pImpl->pending);
    }
    for (auto &[id, slot] : drained)
    {
        try
        {
            slot->fulfill(CompletionCanceled{std::string(reason)});
        }
        catch (const std::exception &e)
        {
            LOGGER_ERROR("CorrelationRegistry: failed to cancel id {}: {}", id, e.what());
        }
    }
    if (!drained.empty())
    {
        LOGGER_DEBUG("CorrelationRegistry: canceled {} pending request(s): {}", drained.size(),
                     reason);
    }
}

bool CorrelationRegistry::is_closed() const
{
    std::lock_guard<std::mutex> lock(pImpl->map_mutex);
    return pImpl->closed;
}

size_t CorrelationRegistry::pending_count() const
{
    std::lock_guard<std::mutex> lock(pImpl->map_mutex);
    return pImpl->pending.size();
}

bool CorrelationRegistry::is_pending(CorrelationId id) const
{
    std::lock_guard<std::mutex> lock(pImpl->map_mutex);
    return pImpl->pending.count(id) != 0;
}

uint64_t CorrelationRegistry::unknown_completions() const noexcept
{
    return pImpl->unknown_count.load(std::memory_order_relaxed);
}

} // namespace filebridge::transfer
