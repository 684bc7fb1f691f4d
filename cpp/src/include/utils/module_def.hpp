#pragma once
/**
 * @file module_def.hpp
 * @brief ABI-safe module definition for LifecycleManager registration.
 */
#include "filebridge_utils_export.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string_view>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace filebridge::utils
{

class ModuleDefImpl;
class LifecycleManager;

/**
 * @brief A function pointer type for module startup and shutdown callbacks.
 *
 * A plain C function pointer keeps the callback ABI independent of the standard
 * library in use. `arg` is the string given to set_startup/set_shutdown, or
 * `nullptr` when none was given.
 */
using LifecycleCallback = void (*)(const char *arg);

/**
 * @class ModuleDef
 * @brief A builder for a lifecycle module definition.
 *
 * Movable, not copyable. Ownership passes to the LifecycleManager on registration.
 * Names longer than `MAX_MODULE_NAME_LEN` are rejected with `std::length_error`.
 */
class FILEBRIDGE_UTILS_EXPORT ModuleDef
{
  public:
    static constexpr size_t MAX_MODULE_NAME_LEN = 256;
    static constexpr size_t MAX_CALLBACK_PARAM_STRLEN = 1024;

    /**
     * @param name Unique module name (e.g. `"Logger"`, `"CryptoUtils"`).
     * @throws std::invalid_argument if `name` is empty.
     * @throws std::length_error     if `name.size() > MAX_MODULE_NAME_LEN`.
     */
    explicit ModuleDef(std::string_view name);
    ~ModuleDef();

    ModuleDef(ModuleDef &&other) noexcept;
    ModuleDef &operator=(ModuleDef &&other) noexcept;
    ModuleDef(const ModuleDef &) = delete;
    ModuleDef &operator=(const ModuleDef &) = delete;

    /**
     * @brief Declares that this module must start after (and stop before) `dependency_name`.
     * An empty name is ignored.
     */
    void add_dependency(std::string_view dependency_name);

    void set_startup(LifecycleCallback startup_func);
    /// @throws std::length_error if `arg.size() > MAX_CALLBACK_PARAM_STRLEN`.
    void set_startup(LifecycleCallback startup_func, std::string_view arg);

    /**
     * @brief Sets the shutdown callback.
     * @param timeout Maximum time the callback may run before it is abandoned.
     */
    void set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout);
    /// @throws std::length_error if `arg.size() > MAX_CALLBACK_PARAM_STRLEN`.
    void set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout,
                      std::string_view arg);

  private:
    friend class LifecycleManager;
    std::unique_ptr<ModuleDefImpl> pImpl;
};

} // namespace filebridge::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
