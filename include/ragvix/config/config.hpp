#pragma once

#include "ragvix/common/result.hpp"
#include "ragvix/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace ragvix::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
/// `--config`. Takes precedence over RAGVIX_CONFIG_PATH; a directory holds config.toml.
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
/// The value set by set_config_path_override(), ignoring the environment.
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// Loads the config at config_path(), applies environment overrides and validates it.
/// A missing file yields the defaults.
[[nodiscard]] common::Result<Config> load_config();
/// Parses a TOML document. Unknown sections/keys and malformed values are rejected.
[[nodiscard]] common::Result<Config> parse_config(const std::string &content);
[[nodiscard]] common::Status save_config(const Config &config);

/// Range and enumeration checks. Returns warnings on success.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace ragvix::config
