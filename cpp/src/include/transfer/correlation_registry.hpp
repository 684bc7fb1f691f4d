#pragma once
/**
 * @file correlation_registry.hpp
 * @brief CorrelationRegistry: pairs shared-buffer dispatches with their out-of-band completions.
 *
 * A caller issues an id with `begin()`, hands it to the producer and blocks in
 * `await_result()`. The producer's thread calls `complete()` or `fail()` with the same id. A
 * slot is erased from the map the instant it is fulfilled, so a second fulfillment (or one
 * arriving after the waiter gave up) finds nothing and resolves as an unknown-id no-op.
 *
 * ```cpp
 * auto handle = registry.begin();
 * boundary.read_unmarshalled(params_with(handle.id), shared);
 * CompletionOutcome outcome = registry.await_result(handle, stop);
 * ```
 */
#include "filebridge_utils_export.h"
#include "transfer/transfer_types.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace filebridge::transfer
{

struct PendingCompletion;

/**
 * @brief What `begin()` hands back: the id to dispatch with and the slot to wait on.
 */
struct PendingHandle
{
    CorrelationId id{0};
    std::shared_ptr<PendingCompletion> completion;
};

class FILEBRIDGE_UTILS_EXPORT CorrelationRegistry
{
  public:
    CorrelationRegistry();
    ~CorrelationRegistry();

    CorrelationRegistry(const CorrelationRegistry &) = delete;
    CorrelationRegistry &operator=(const CorrelationRegistry &) = delete;

    /**
     * @brief Issues a fresh id and stores a pending slot for it.
     * @throws TransferCanceled once cancel_all() has closed the registry; the message is the
     *         reason given there.
     */
    [[nodiscard]] PendingHandle begin();

    /**
     * @brief Fulfills `id` with success.
     * @return false if `id` is not pending; one WARN line is logged. Never throws.
     */
    bool complete(CorrelationId id, uint32_t bytes_read) noexcept;

    /// @brief Fulfills `id` with failure. Same unknown-id tolerance as complete().
    bool fail(CorrelationId id, std::string_view message) noexcept;

    /**
     * @brief Blocks until the slot is fulfilled or `stop` is requested.
     *
     * On stop the slot is marked canceled and erased; a late completion from the producer is
     * then an unknown-id no-op. `on_cancel` runs under the map lock in the same step as the
     * erase, only when this call is the one that canceled the slot, so any complete() or fail()
     * that then misses the slot already observes its effect. It must not call back into the
     * registry.
     */
    CompletionOutcome await_result(const PendingHandle &handle, std::stop_token stop,
                                   const std::function<void()> &on_cancel = {});

    /// @brief Erases a slot without fulfilling it. Used when the dispatch itself threw.
    void abandon(CorrelationId id) noexcept;

    /**
     * @brief Marks every pending slot canceled with `reason`, empties the map and closes the
     *        registry: later begin() calls throw TransferCanceled(reason).
     */
    void cancel_all(std::string_view reason) noexcept;

    [[nodiscard]] bool is_closed() const;

    [[nodiscard]] size_t pending_count() const;
    [[nodiscard]] bool is_pending(CorrelationId id) const;

    /// @brief Number of complete()/fail() calls that named an id that was not pending.
    [[nodiscard]] uint64_t unknown_completions() const noexcept;

  private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace filebridge::transfer

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
