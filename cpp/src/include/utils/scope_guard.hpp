#pragma once
/**
 * @file scope_guard.hpp
 * @brief A generic RAII helper that runs a callable when the enclosing scope exits.
 *
 * Used for cleanup that has no owning object of its own: abandoning a correlation
 * entry when a dispatch throws, restoring logger state in tests, and similar.
 *
 * ```cpp
 * auto [id, completion] = registry.begin();
 * auto abandon = filebridge::basics::make_scope_guard([&] { registry.abandon(id); });
 * boundary.read_unmarshalled(params, shared);
 * abandon.dismiss(); // dispatch went out; the completion path owns the entry now
 * ```
 */

#include <concepts>
#include <cstdio>
#include <exception>
#include <functional>
#include <type_traits>
#include <utility>

namespace filebridge::basics
{

// The guard stores the callable as a member and invokes it as an lvalue, hence
// the `std::invocable<Callable &>` constraint.
template <typename Callable>
requires std::invocable<Callable &>
class ScopeGuard
{
  public:
    static_assert(!std::is_reference_v<Callable>, "ScopeGuard cannot hold a reference to a callable.");
    static_assert(std::is_move_constructible_v<Callable> || std::is_copy_constructible_v<Callable>,
                  "ScopeGuard's callable must be move- or copy-constructible.");

    /**
     * @brief Constructs a guard that runs `fn` on scope exit.
     */
    explicit ScopeGuard(Callable fn) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(fn))
    {
    }

    /**
     * @brief Transfers the cleanup action. The source guard is dismissed.
     */
    ScopeGuard(ScopeGuard &&other) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(other.m_func)), m_active(other.m_active)
    {
        other.dismiss();
    }

    /**
     * @brief Runs the callable if the guard is still active.
     *
     * A std::exception escaping the callable is reported on stderr and dropped, since a
     * destructor cannot propagate it.
     */
    ~ScopeGuard() noexcept
    {
        if (m_active)
        {
            try
            {
                std::invoke(m_func);
            }
            catch (const std::exception &e)
            {
                std::fprintf(stderr, "[ScopeGuard] cleanup action threw: %s\n", e.what());
            }
        }
    }

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;
    ScopeGuard &operator=(ScopeGuard &&) = delete;

    /// @return `true` if the guard will still run on scope exit.
    [[nodiscard]] explicit operator bool() const noexcept { return m_active; }

    /// @brief Deactivates the guard.
    constexpr void dismiss() noexcept { m_active = false; }

    /**
     * @brief Runs the callable now (if active) and dismisses the guard.
     *
     * Unlike the destructor, exceptions from the callable propagate to the caller.
     */
    void invoke()
    {
        if (m_active)
        {
            m_active = false; // dismiss first so a throwing callable never runs twice
            std::invoke(m_func);
        }
    }

  private:
    Callable m_func;
    bool m_active{true};
};

/**
 * @brief Creates a ScopeGuard with the callable's type deduced and decayed.
 */
template <typename F> [[nodiscard]] auto make_scope_guard(F &&f) -> ScopeGuard<std::decay_t<F>>
{
    return ScopeGuard<std::decay_t<F>>(std::forward<F>(f));
}

} // namespace filebridge::basics
