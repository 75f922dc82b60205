#pragma once

#include "shellgate/common/result.hpp"
#include "shellgate/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace shellgate::config {

/// Config file location: the `--config` override, then `SHELLGATE_CONFIG_PATH`, then
/// `~/.shellgate/config.toml`. An override naming a directory gets `config.toml`
/// appended.
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();

/// Missing file yields the built-in defaults; env overrides are applied on top.
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> parse_config(const std::string &content);
// Writes through a temporary file, creating the parent directory.
[[nodiscard]] common::Status save_config(const Config &config);

/// Fails on settings that would make the gate unusable or unsafe; returns
/// warnings for ones that are merely suspicious.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace shellgate::config
