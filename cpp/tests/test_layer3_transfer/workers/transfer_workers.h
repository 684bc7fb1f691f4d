// tests/test_layer3_transfer/workers/transfer_workers.h
#pragma once
/**
 * @file transfer_workers.h
 * @brief Worker functions for transfer tests that need the Logger or the TransferConfig
 *        lifecycle module, or a controlled environment.
 */
#include <string>

namespace filebridge::tests::worker::transfer
{

/// Env overrides (set by the parent) win over the directory layers.
int config_env_overrides(const std::string &config_dir);
/// An unparsable env override fails load_layered.
int config_bad_env(const std::string &config_dir);
/// FILEBRIDGE_CONFIG_FILE names the extra layer when no explicit file is given.
int config_file_from_env();
/// The lifecycle module loads the directory and applies logging.level / logging.file.
int config_module_applies_logging(const std::string &config_dir, const std::string &log_path);
/// A completion for an id nobody waits on is logged once and counted.
int unknown_correlation_logged(const std::string &log_path);
/// A verification failure logs the report and both hex dumps.
int integrity_failure_logged(const std::string &log_path);

} // namespace filebridge::tests::worker::transfer
