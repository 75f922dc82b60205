#pragma once

#include "shellgate/common/result.hpp"
#include <filesystem>
#include <string>

namespace shellgate::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] bool ends_with(const std::string &value, const std::string &suffix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::string basename_of(const std::string &value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);

/// Replaces a leading `~` or `~/` with $HOME. Other `~` forms (`~user`, `~+`)
/// and variable references are not expanded and are reported as failures.
[[nodiscard]] Result<std::string> expand_home(const std::string &value);

/// Resolves symlinks and `..` for paths that may not exist yet. Fails on
/// loops and permission errors rather than guessing.
[[nodiscard]] Result<std::filesystem::path> resolve_path(const std::filesystem::path &path);

[[nodiscard]] bool is_subpath(const std::filesystem::path &candidate,
                             const std::filesystem::path &parent);

} // namespace shellgate::common
