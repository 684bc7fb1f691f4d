/**
 * @file transfer_config.cpp
 * @brief TransferConfig: layered JSON loading, environment overrides and the
 *        lifecycle module.
 */
#include "utils/transfer_config.hpp"

#include "fbr_service.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace fs = std::filesystem;

namespace filebridge::utils
{

namespace
{

std::mutex g_config_mu;
TransferConfig g_current;                    // guarded by g_config_mu
fs::path g_config_path_override;             // guarded by g_config_mu
std::optional<fs::path> g_config_dir_override; // guarded by g_config_mu

constexpr const char *kDefaultFileName = "filebridge.default.json";
constexpr const char *kUserFileName = "filebridge.user.json";

/// Returns the directory containing the running binary, or empty on failure.
fs::path get_binary_dir()
{
    const std::string exe = filebridge::platform::get_executable_name(true);
    if (exe.empty())
        return {};
    return fs::path(exe).parent_path();
}

/// Finds the config directory next to the binary, or returns empty.
fs::path discover_config_dir()
{
    const fs::path bin = get_binary_dir();
    if (bin.empty())
        return {};

    std::error_code ec;
    // Standard staged layout: <root>/bin/ + <root>/config/
    fs::path candidate = bin / ".." / "config";
    if (fs::is_directory(candidate, ec))
        return fs::weakly_canonical(candidate, ec);

    // Flat layout: config/ next to binary
    candidate = bin / "config";
    if (fs::is_directory(candidate, ec))
        return fs::weakly_canonical(candidate, ec);
    return {};
}

std::string lowercase(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool parse_env_bool(const char *name, const std::string &raw)
{
    const std::string v = lowercase(raw);
    if (v == "1" || v == "true" || v == "yes" || v == "on")
        return true;
    if (v == "0" || v == "false" || v == "no" || v == "off")
        return false;
    throw std::runtime_error(fmt::format(
        "TransferConfig: invalid {} = '{}' (expected 1/0, true/false, yes/no, on/off)", name,
        raw));
}

int parse_env_int(const char *name, const std::string &raw)
{
    size_t consumed = 0;
    int value = 0;
    try
    {
        value = std::stoi(raw, &consumed);
    }
    catch (const std::logic_error &)
    {
        consumed = 0;
    }
    if (consumed == 0 || consumed != raw.size())
    {
        throw std::runtime_error(
            fmt::format("TransferConfig: invalid {} = '{}' (expected an integer)", name, raw));
    }
    return value;
}

template <typename T>
T get_field(const nlohmann::json &section, const char *section_name, const char *key,
            const std::string &origin)
{
    try
    {
        return section.at(key).get<T>();
    }
    catch (const nlohmann::json::exception &e)
    {
        throw std::runtime_error(fmt::format("TransferConfig: invalid '{}.{}' in '{}': {}",
                                             section_name, key, origin, e.what()));
    }
}

int get_non_negative(const nlohmann::json &section, const char *section_name, const char *key,
                     const std::string &origin)
{
    const int v = get_field<int>(section, section_name, key, origin);
    if (v < 0)
    {
        throw std::runtime_error(fmt::format(
            "TransferConfig: '{}.{}' in '{}' must be >= 0 (got {})", section_name, key, origin, v));
    }
    return v;
}

void validate_log_level(const std::string &level, const std::string &origin)
{
    if (!Logger::parse_level(level).has_value())
    {
        throw std::runtime_error(fmt::format(
            "TransferConfig: invalid logging level '{}' in '{}' (expected trace, debug, info, "
            "warn, error or system)",
            level, origin));
    }
}

} // namespace

// ============================================================================
// JSON helpers
// ============================================================================

void json_merge(nlohmann::json &base, const nlohmann::json &overrides)
{
    if (!overrides.is_object())
        return;
    for (auto it = overrides.begin(); it != overrides.end(); ++it)
    {
        if (it.value().is_object() && base.contains(it.key()) && base.at(it.key()).is_object())
        {
            json_merge(base[it.key()], it.value());
        }
        else
        {
            base[it.key()] = it.value();
        }
    }
}

nlohmann::json read_json_file(const fs::path &path)
{
    std::ifstream f(path);
    if (!f.is_open())
        throw std::runtime_error("TransferConfig: cannot open file: " + path.string());
    try
    {
        return nlohmann::json::parse(f);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw std::runtime_error("TransferConfig: JSON parse error in '" + path.string() +
                                 "': " + e.what());
    }
}

// ============================================================================
// TransferConfig
// ============================================================================

void TransferConfig::apply_json(const nlohmann::json &j, const std::string &origin)
{
    if (!j.is_object())
    {
        throw std::runtime_error("TransferConfig: top-level value in '" + origin +
                                 "' must be an object");
    }
    if (j.contains("transfer"))
    {
        const auto &t = j.at("transfer");
        if (t.contains("use_shared_buffer"))
            use_shared_buffer = get_field<bool>(t, "transfer", "use_shared_buffer", origin);
        if (t.contains("initialize_on_first_call"))
            initialize_on_first_call =
                get_field<bool>(t, "transfer", "initialize_on_first_call", origin);
        if (t.contains("init_poll_attempts"))
            init_poll_attempts = get_non_negative(t, "transfer", "init_poll_attempts", origin);
        if (t.contains("init_poll_interval_ms"))
            init_poll_interval = std::chrono::milliseconds(
                get_non_negative(t, "transfer", "init_poll_interval_ms", origin));
    }
    if (j.contains("pool"))
    {
        const auto &p = j.at("pool");
        if (p.contains("max_outstanding"))
            pool_max_outstanding =
                static_cast<size_t>(get_non_negative(p, "pool", "max_outstanding", origin));
        if (p.contains("max_retained"))
            pool_max_retained =
                static_cast<size_t>(get_non_negative(p, "pool", "max_retained", origin));
    }
    if (j.contains("diagnostics"))
    {
        const auto &d = j.at("diagnostics");
        if (d.contains("dump_bytes"))
            diagnostics_dump_bytes =
                static_cast<size_t>(get_non_negative(d, "diagnostics", "dump_bytes", origin));
    }
    if (j.contains("retry"))
    {
        const auto &r = j.at("retry");
        if (r.contains("report_recovered_as_failure"))
            report_recovered_as_failure =
                get_field<bool>(r, "retry", "report_recovered_as_failure", origin);
    }
    if (j.contains("logging"))
    {
        const auto &l = j.at("logging");
        if (l.contains("level"))
        {
            const auto level = get_field<std::string>(l, "logging", "level", origin);
            validate_log_level(level, origin);
            log_level = level;
        }
        if (l.contains("file"))
            log_file = get_field<std::string>(l, "logging", "file", origin);
    }
}

void TransferConfig::apply_env_overrides()
{
    if (const char *env = std::getenv("FILEBRIDGE_USE_SHARED_BUFFER"))
        use_shared_buffer = parse_env_bool("FILEBRIDGE_USE_SHARED_BUFFER", env);
    if (const char *env = std::getenv("FILEBRIDGE_INIT_POLL_ATTEMPTS"))
    {
        const int v = parse_env_int("FILEBRIDGE_INIT_POLL_ATTEMPTS", env);
        if (v < 0)
            throw std::runtime_error("TransferConfig: FILEBRIDGE_INIT_POLL_ATTEMPTS must be >= 0");
        init_poll_attempts = v;
    }
    if (const char *env = std::getenv("FILEBRIDGE_INIT_POLL_INTERVAL_MS"))
    {
        const int v = parse_env_int("FILEBRIDGE_INIT_POLL_INTERVAL_MS", env);
        if (v < 0)
            throw std::runtime_error(
                "TransferConfig: FILEBRIDGE_INIT_POLL_INTERVAL_MS must be >= 0");
        init_poll_interval = std::chrono::milliseconds(v);
    }
    if (const char *env = std::getenv("FILEBRIDGE_LOG_LEVEL"))
    {
        validate_log_level(env, "FILEBRIDGE_LOG_LEVEL");
        log_level = env;
    }
}

nlohmann::json TransferConfig::to_json() const
{
    return nlohmann::json{
        {"transfer",
         {{"use_shared_buffer", use_shared_buffer},
          {"initialize_on_first_call", initialize_on_first_call},
          {"init_poll_attempts", init_poll_attempts},
          {"init_poll_interval_ms", init_poll_interval.count()}}},
        {"pool", {{"max_outstanding", pool_max_outstanding}, {"max_retained", pool_max_retained}}},
        {"diagnostics", {{"dump_bytes", diagnostics_dump_bytes}}},
        {"retry", {{"report_recovered_as_failure", report_recovered_as_failure}}},
        {"logging", {{"level", log_level}, {"file", log_file}}},
    };
}

TransferConfig TransferConfig::from_json_file(const std::string &path)
{
    TransferConfig cfg;
    cfg.apply_json(read_json_file(path), path);
    return cfg;
}

TransferConfig TransferConfig::load_layered(const fs::path &config_dir, const fs::path &extra_file)
{
    nlohmann::json merged = nlohmann::json::object();

    if (!config_dir.empty())
    {
        const fs::path def_file = config_dir / kDefaultFileName;
        if (fs::exists(def_file))
        {
            LOGGER_INFO("TransferConfig: loading defaults from '{}'", def_file.string());
            json_merge(merged, read_json_file(def_file));
        }
        else
        {
            LOGGER_INFO("TransferConfig: {} not found, using built-in defaults", kDefaultFileName);
        }

        const fs::path user_file = config_dir / kUserFileName;
        if (fs::exists(user_file))
        {
            LOGGER_INFO("TransferConfig: merging user overrides from '{}'", user_file.string());
            json_merge(merged, read_json_file(user_file));
        }
    }

    fs::path extra = extra_file;
    if (extra.empty())
    {
        if (const char *env = std::getenv("FILEBRIDGE_CONFIG_FILE"))
            extra = env;
    }
    if (!extra.empty())
    {
        // An explicitly named file must exist; read_json_file throws otherwise.
        LOGGER_INFO("TransferConfig: merging '{}'", extra.string());
        json_merge(merged, read_json_file(extra));
    }

    TransferConfig cfg;
    cfg.apply_json(merged, config_dir.empty() ? extra.string() : config_dir.string());
    cfg.apply_env_overrides();
    return cfg;
}

void TransferConfig::set_config_path(const fs::path &path)
{
    std::lock_guard lock(g_config_mu);
    g_config_path_override = path;
}

void TransferConfig::set_config_dir(const fs::path &dir)
{
    std::lock_guard lock(g_config_mu);
    g_config_dir_override = dir;
}

TransferConfig TransferConfig::current()
{
    std::lock_guard lock(g_config_mu);
    return g_current;
}

// ---------------------------------------------------------------------------
// Lifecycle startup / shutdown
// ---------------------------------------------------------------------------

namespace
{
void do_transfer_config_startup(const char * /*arg*/)
{
    fs::path override_path;
    std::optional<fs::path> dir_override;
    {
        std::lock_guard lock(g_config_mu);
        override_path = g_config_path_override;
        dir_override = g_config_dir_override;
    }
    const fs::path config_dir = dir_override.has_value() ? *dir_override : discover_config_dir();

    TransferConfig cfg = TransferConfig::load_layered(config_dir, override_path);

    auto &logger = Logger::instance();
    if (auto level = Logger::parse_level(cfg.log_level))
        logger.set_level(*level);
    if (!cfg.log_file.empty() && !logger.set_logfile(cfg.log_file))
    {
        LOGGER_ERROR("TransferConfig: cannot log to '{}', staying on the current sink",
                     cfg.log_file);
    }

    LOGGER_INFO("TransferConfig: use_shared_buffer = {}", cfg.use_shared_buffer);
    LOGGER_INFO("TransferConfig: init_poll         = {} x {}ms", cfg.init_poll_attempts,
                cfg.init_poll_interval.count());
    LOGGER_INFO("TransferConfig: pool              = max_outstanding {} max_retained {}",
                cfg.pool_max_outstanding, cfg.pool_max_retained);

    std::lock_guard lock(g_config_mu);
    g_current = std::move(cfg);
}

void do_transfer_config_shutdown(const char * /*arg*/)
{
    std::lock_guard lock(g_config_mu);
    g_current = TransferConfig{};
}
} // namespace

ModuleDef TransferConfig::GetLifecycleModule()
{
    ModuleDef module("TransferConfig");
    module.add_dependency("filebridge::utils::Logger");
    module.set_startup(&do_transfer_config_startup);
    module.set_shutdown(&do_transfer_config_shutdown, std::chrono::milliseconds(1000));
    return module;
}

} // namespace filebridge::utils
