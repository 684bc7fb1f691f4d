#pragma once
/**
 * @file backoff_strategy.hpp
 * @brief Header-only wait strategies for polling loops.
 *
 * A strategy is a callable taking the 0-based iteration of the loop that calls it:
 *
 * - ConstantBackoff: the coordinator's readiness polling, one `init_poll_interval` per poll.
 * - ExponentialBackoff: short waits on a condition that usually holds within microseconds,
 *   such as a test waiting for a log line or a callback.
 */
#include <chrono>
#include <thread>

namespace filebridge::utils
{

/**
 * @brief Yields, then sleeps 1us, then sleeps `iteration * 10us`.
 *
 * Iterations 0-3 yield, 4-9 sleep 1us, and from 10 on the sleep grows linearly
 * (iteration 100 sleeps 1ms).
 *
 * @example
 * const ExponentialBackoff backoff;
 * int iteration = 0;
 * while (!done() && iteration < 1000)
 *     backoff(iteration++);
 */
struct ExponentialBackoff
{
    void operator()(int iteration) const noexcept
    {
        if (iteration < 4)
        {
            std::this_thread::yield();
        }
        else if (iteration < 10)
        {
            std::this_thread::sleep_for(std::chrono::microseconds(1));
        }
        else
        {
            std::this_thread::sleep_for(
                std::chrono::microseconds(static_cast<long>(iteration) * 10));
        }
    }
};

/**
 * @brief Sleeps the same `delay` on every iteration. A zero delay returns at once.
 *
 * @example
 * const ConstantBackoff wait_between_polls(std::chrono::milliseconds(100));
 * for (int poll = 1; poll <= attempts; ++poll) {
 *     wait_between_polls(poll);
 *     if (boundary.is_ready()) break;
 * }
 */
struct ConstantBackoff
{
    std::chrono::microseconds delay;

    explicit ConstantBackoff(std::chrono::microseconds d = std::chrono::microseconds(100))
        : delay(d)
    {
    }

    void operator()(int /*iteration*/) const noexcept
    {
        if (delay.count() > 0)
        {
            std::this_thread::sleep_for(delay);
        }
    }
};

} // namespace filebridge::utils
