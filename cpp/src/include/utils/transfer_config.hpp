#pragma once

/**
 * @file transfer_config.hpp
 * @brief TransferConfig: transfer-layer settings and the lifecycle module that loads them.
 *
 * ## JSON format
 *
 * @code{.json}
 * {
 *   "transfer":    { "use_shared_buffer": false, "initialize_on_first_call": true,
 *                    "init_poll_attempts": 25, "init_poll_interval_ms": 100 },
 *   "pool":        { "max_outstanding": 0, "max_retained": 16 },
 *   "diagnostics": { "dump_bytes": 64 },
 *   "retry":       { "report_recovered_as_failure": true },
 *   "logging":     { "level": "info", "file": "" }
 * }
 * @endcode
 *
 * Every key is optional; missing keys keep their current value.
 *
 * ## Config loading: layered (priority low to high)
 *
 *  1. Built-in C++ defaults (the member initializers below)
 *  2. `config/filebridge.default.json`: canonical defaults staged by the build
 *  3. `config/filebridge.user.json`: user customisations merged on top
 *  4. `FILEBRIDGE_CONFIG_FILE` env var, or `set_config_path()`: one more file merged
 *     on top of the layers above
 *  5. Environment overrides:
 *     - `FILEBRIDGE_USE_SHARED_BUFFER`     (1/0, true/false, yes/no, on/off)
 *     - `FILEBRIDGE_INIT_POLL_ATTEMPTS`
 *     - `FILEBRIDGE_INIT_POLL_INTERVAL_MS`
 *     - `FILEBRIDGE_LOG_LEVEL`
 *
 * The config directory is `<binary_dir>/../config/` or `<binary_dir>/config/`, whichever
 * exists first. Files are merged with json_merge (objects merge key by key, anything
 * else replaces).
 *
 * ## Lifecycle
 *
 * @code
 *   LifecycleGuard lifecycle(MakeModDefList(
 *       Logger::GetLifecycleModule(),
 *       TransferConfig::GetLifecycleModule()));
 *   TransferCoordinator coordinator(boundary, TransferConfig::current());
 * @endcode
 *
 * On startup the module loads the layers, applies `logging.level` and `logging.file` to
 * the Logger and publishes the result through `current()`. An invalid value aborts
 * startup.
 */

#include "filebridge_utils_export.h"
#include "utils/module_def.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace filebridge::utils
{

/**
 * @brief Recursively merges `overrides` into `base` (object keys override, arrays replace).
 */
FILEBRIDGE_UTILS_EXPORT void json_merge(nlohmann::json &base, const nlohmann::json &overrides);

/**
 * @brief Reads and parses a JSON file.
 * @throws std::runtime_error if the file cannot be opened or does not parse.
 */
FILEBRIDGE_UTILS_EXPORT nlohmann::json read_json_file(const std::filesystem::path &path);

struct FILEBRIDGE_UTILS_EXPORT TransferConfig
{
    // transfer.*
    bool use_shared_buffer{false};
    bool initialize_on_first_call{true};
    int init_poll_attempts{25};
    std::chrono::milliseconds init_poll_interval{100};

    // pool.*
    size_t pool_max_outstanding{0}; ///< 0 = unlimited
    size_t pool_max_retained{16};

    // diagnostics.*
    size_t diagnostics_dump_bytes{64};

    // retry.*
    bool report_recovered_as_failure{true};

    // logging.*
    std::string log_level{"info"};
    std::string log_file; ///< empty = console

    /**
     * @brief Applies the keys present in `j` on top of this config.
     * @param origin Used in error messages (a file path, "env", ...).
     * @throws std::runtime_error on a wrongly typed or out-of-range value.
     */
    void apply_json(const nlohmann::json &j, const std::string &origin);

    /**
     * @brief Applies the FILEBRIDGE_* environment overrides.
     * @throws std::runtime_error on an unparsable value.
     */
    void apply_env_overrides();

    /// @brief Serializes every field in the JSON format above.
    [[nodiscard]] nlohmann::json to_json() const;

    /**
     * @brief Built-in defaults overlaid with a single JSON file.
     * @throws std::runtime_error if the file is missing, malformed or holds invalid values.
     */
    static TransferConfig from_json_file(const std::string &path);

    /**
     * @brief Runs layers 1 to 5.
     *
     * @param config_dir  Directory holding `filebridge.default.json` and
     *                    `filebridge.user.json`. May be empty (no directory layer).
     * @param extra_file  Layer 4 file. When empty, `FILEBRIDGE_CONFIG_FILE` is used if set.
     * @throws std::runtime_error if a file that exists cannot be parsed, if `extra_file`
     *         does not exist, or if a value is invalid.
     */
    static TransferConfig load_layered(const std::filesystem::path &config_dir,
                                       const std::filesystem::path &extra_file = {});

    /**
     * @brief Optional: call before the lifecycle module starts to set the layer 4 file.
     */
    static void set_config_path(const std::filesystem::path &path);

    /**
     * @brief Optional: call before the lifecycle module starts to set the config directory
     *        instead of discovering it next to the binary.
     */
    static void set_config_dir(const std::filesystem::path &dir);

    /**
     * @brief The configuration loaded by the lifecycle module. Built-in defaults if the
     *        module has not started.
     */
    static TransferConfig current();

    /**
     * @brief Module "TransferConfig", depending on the Logger.
     */
    static ModuleDef GetLifecycleModule();
};

} // namespace filebridge::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
