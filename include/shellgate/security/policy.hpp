#pragma once

#include "shellgate/common/result.hpp"
#include "shellgate/config/schema.hpp"
#include "shellgate/shell/analyzer.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace shellgate::security {

/// Immutable command policy. Built once from configuration and shared by
/// every evaluation; nothing mutates it after construction.
class CommandPolicy {
public:
  CommandPolicy();

  [[nodiscard]] static common::Result<CommandPolicy>
  from_config(const config::PolicyConfig &config);

  [[nodiscard]] bool is_command_allowed(const std::string &name) const;
  [[nodiscard]] bool needs_extra_validation(const std::string &name) const;
  [[nodiscard]] bool is_terminable_process(const std::string &name) const;

  /// First privileged command name appearing as a whole word anywhere in
  /// `command`, quoted or not.
  [[nodiscard]] std::optional<std::string> find_privileged(const std::string &command) const;

  [[nodiscard]] const std::unordered_set<std::string> &allowed_commands() const {
    return allowed_;
  }
  [[nodiscard]] const std::unordered_set<std::string> &extra_validation_commands() const {
    return extra_validation_;
  }
  [[nodiscard]] const std::vector<std::string> &sensitive_paths() const {
    return sensitive_paths_;
  }
  [[nodiscard]] const std::unordered_set<std::string> &terminable_processes() const {
    return terminable_processes_;
  }
  [[nodiscard]] const std::vector<std::string> &protected_mount_sources() const {
    return protected_mount_sources_;
  }
  [[nodiscard]] const std::filesystem::path &temp_root() const { return temp_root_; }
  [[nodiscard]] const std::vector<std::string> &additional_read_dirs() const {
    return read_dirs_;
  }
  [[nodiscard]] const std::vector<std::string> &additional_write_dirs() const {
    return write_dirs_;
  }

  [[nodiscard]] shell::AnalyzerOptions analyzer_options() const;

  /// SHA-256 over a canonical, sorted dump of every list in the policy.
  [[nodiscard]] std::string fingerprint() const;
  [[nodiscard]] std::string describe() const;

private:
  void load(const config::PolicyConfig &config);

  std::unordered_set<std::string> allowed_;
  std::unordered_set<std::string> extra_validation_;
  std::unordered_set<std::string> privileged_;
  std::unordered_set<std::string> wrappers_;
  std::unordered_set<std::string> interpreters_;
  std::unordered_set<std::string> terminable_processes_;
  std::vector<std::string> sensitive_paths_;
  std::vector<std::string> protected_mount_sources_;
  std::filesystem::path temp_root_ = "/tmp";
  std::vector<std::string> read_dirs_;
  std::vector<std::string> write_dirs_;
  std::size_t max_depth_ = 32;
};

using PolicyPtr = std::shared_ptr<const CommandPolicy>;

[[nodiscard]] PolicyPtr default_policy();

} // namespace shellgate::security
