#pragma once

/*******************************************************************************
 * @file lifecycle.hpp
 * @brief Manages application startup and shutdown with dependency-aware modules.
 *
 * **Design**
 *
 * 1.  **Dependency Management**: Modules declare their dependencies by name and the
 *     `LifecycleManager` performs a topological sort to determine the startup
 *     order. Shutdown runs in reverse. Cycles and undefined dependencies are fatal.
 *
 * 2.  **Pimpl**: Both `LifecycleManager` and `ModuleDef` keep their containers in
 *     private `Impl` classes so the exported headers only expose ABI-stable types.
 *
 * 3.  **Singleton**: One manager per process. Components register through it
 *     without being handed a manager instance.
 *
 * 4.  **Bounded shutdown**: every shutdown callback runs with its own timeout so a
 *     hanging module cannot block process exit.
 *
 * **Usage**
 *
 * ```cpp
 * int main(int argc, char* argv[]) {
 *     filebridge::utils::LifecycleGuard app_lifecycle(filebridge::utils::MakeModDefList(
 *         filebridge::utils::Logger::GetLifecycleModule(),
 *         filebridge::crypto::GetLifecycleModule(),
 *         filebridge::utils::TransferConfig::GetLifecycleModule()));
 *
 *     LOGGER_INFO("Application started successfully.");
 *     // ... transfer work ...
 *     return 0; // the guard's destructor finalizes every module in reverse order
 * }
 * ```
 ******************************************************************************/
#include "fbr_base.hpp"
#include "filebridge_utils_export.h"

#include <atomic>
#include <memory>
#include <source_location>
#include <type_traits>
#include <utility>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace filebridge::utils
{

class LifecycleManagerImpl;

/// @brief Builds a vector<ModuleDef> by moving the supplied ModuleDef arguments.
// Call-site: MakeModDefList(Logger::GetLifecycleModule(), crypto::GetLifecycleModule())
template <typename... Mods> inline std::vector<ModuleDef> MakeModDefList(Mods &&...mods)
{
    static_assert((std::is_same_v<std::decay_t<Mods>, ModuleDef> && ...),
                  "MakeModDefList: all arguments must be ModuleDef (rvalues or prvalues)");

    std::vector<ModuleDef> modules;
    modules.reserve(sizeof...(mods));
    (modules.emplace_back(std::forward<Mods>(mods)), ...);
    return modules;
}

/**
 * @class LifecycleManager
 * @brief The singleton manager for the application lifecycle.
 */
class FILEBRIDGE_UTILS_EXPORT LifecycleManager
{
  public:
    static LifecycleManager &instance();

    /**
     * @brief Registers a module. Must happen before `initialize()`; registering
     *        afterwards is a fatal error.
     */
    void register_module(ModuleDef &&module_def);

    /**
     * @brief Starts every registered module in dependency order. Idempotent.
     *
     * A dependency cycle, an undefined dependency, or a startup callback that throws
     * aborts the process with a module status report.
     */
    void initialize(std::source_location loc);

    /**
     * @brief Stops every started module in reverse order, each bounded by its
     *        shutdown timeout. Idempotent.
     */
    void finalize(std::source_location loc);

    [[nodiscard]] bool is_initialized();
    [[nodiscard]] bool is_finalized();

    /**
     * @brief Checks whether a module with this name was started and not yet shut down.
     */
    [[nodiscard]] bool is_module_started(std::string_view name);

    LifecycleManager(const LifecycleManager &) = delete;
    LifecycleManager &operator=(const LifecycleManager &) = delete;

  private:
    LifecycleManager();
    ~LifecycleManager();

    std::unique_ptr<LifecycleManagerImpl> pImpl;
};

inline void RegisterModule(ModuleDef &&module_def)
{
    LifecycleManager::instance().register_module(std::move(module_def));
}

inline bool IsAppInitialized()
{
    return LifecycleManager::instance().is_initialized();
}

inline bool IsAppFinalized()
{
    return LifecycleManager::instance().is_finalized();
}

inline void InitializeApp(std::source_location loc = std::source_location::current())
{
    LifecycleManager::instance().initialize(loc);
}

inline void FinalizeApp(std::source_location loc = std::source_location::current())
{
    LifecycleManager::instance().finalize(loc);
}

/**
 * @class LifecycleGuard
 * @brief RAII owner of the application lifecycle.
 *
 * The first guard constructed in a process registers its modules, initializes the
 * application and finalizes it on destruction. Any later guard is a no-op and its
 * modules are ignored (a debug warning is printed).
 */
class LifecycleGuard
{
  public:
    explicit LifecycleGuard(std::vector<ModuleDef> &&modules,
                            std::source_location loc = std::source_location::current())
        : m_loc(loc)
    {
        FBR_DEBUG("[FBR_LifeCycle] LifecycleGuard constructed in function {}. ({}:{})",
                  m_loc.function_name(), filebridge::format_tools::filename_only(m_loc.file_name()),
                  m_loc.line());
        init_owner_if_first(std::move(modules));
    }

    explicit LifecycleGuard(ModuleDef &&module,
                            std::source_location loc = std::source_location::current())
        : LifecycleGuard(MakeModDefList(std::move(module)), loc)
    {
    }

    LifecycleGuard(const LifecycleGuard &) = delete;
    LifecycleGuard &operator=(const LifecycleGuard &) = delete;
    LifecycleGuard(LifecycleGuard &&) = delete;
    LifecycleGuard &operator=(LifecycleGuard &&) = delete;

    /**
     * @brief Finalizes the application if this guard is the owner.
     *
     * @warning Objects with static storage whose destructors use lifecycle services
     *          (the Logger in particular) may run after this point. Tear such objects
     *          down explicitly before the guard goes out of scope.
     */
    ~LifecycleGuard() noexcept
    {
        if (m_is_owner)
        {
            filebridge::utils::FinalizeApp(m_loc);
        }
    }

  private:
    static std::atomic_bool &owner_flag()
    {
        static std::atomic_bool flag{false};
        return flag;
    }

    void init_owner_if_first(std::vector<ModuleDef> &&modules)
    {
        bool expected = false;
        if (owner_flag().compare_exchange_strong(expected, true, std::memory_order_acq_rel))
        {
            m_is_owner = true;
            for (auto &m : modules)
            {
                filebridge::utils::RegisterModule(std::move(m));
            }
            filebridge::utils::InitializeApp(m_loc);
        }
        else
        {
            m_is_owner = false;
            FBR_DEBUG("[FBR_LifeCycle] WARNING: LifecycleGuard constructed but an owner already "
                      "exists. This guard is a no-op; provided modules were ignored. ({}:{})",
                      filebridge::format_tools::filename_only(m_loc.file_name()), m_loc.line());
        }
    }

    std::source_location m_loc;
    bool m_is_owner{false};
};

} // namespace filebridge::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
