#pragma once

#include "shellgate/common/result.hpp"
#include "shellgate/security/decision.hpp"
#include "shellgate/security/path_extractor.hpp"
#include "shellgate/security/policy.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace shellgate::security {

enum class PathOutcome { Allowed, Escapes, Unresolvable };

struct PathCheck {
  PathOutcome outcome = PathOutcome::Allowed;
  std::filesystem::path resolved;
  std::string message;

  [[nodiscard]] bool allowed() const { return outcome == PathOutcome::Allowed; }
};

/// Confines paths to a project root plus the policy's temp root and
/// additional directories. Every root is canonicalised once at creation.
class PathSandbox {
public:
  [[nodiscard]] static common::Result<PathSandbox> create(const std::string &project_root,
                                                          const CommandPolicy &policy);

  /// Expands `~`, anchors relative paths at the project root and follows
  /// symlinks. Expansions the shell would perform later cannot be checked
  /// here and are reported as Unresolvable.
  [[nodiscard]] common::Result<std::filesystem::path> resolve(const std::string &path,
                                                              bool has_expansion = false) const;

  [[nodiscard]] PathCheck check(const std::string &path, bool has_expansion = false,
                                FileAccess access = FileAccess::Write) const;
  /// Same as above for an extracted candidate. A glob that could match `.`
  /// or `..` makes the path Unresolvable.
  [[nodiscard]] PathCheck check(const PathCandidate &candidate) const;

  /// Project root or temp root.
  [[nodiscard]] bool contains(const std::filesystem::path &resolved) const;
  /// `contains`, or one of the additional directories `access` may reach.
  [[nodiscard]] bool permits(const std::filesystem::path &resolved, FileAccess access) const;

  /// Deny-list match for `cp` sources that escape the sandbox. Returns the
  /// block reason, or nothing when the source is not sensitive.
  [[nodiscard]] std::optional<std::string>
  sensitive_source_reason(const std::string &path, const std::filesystem::path &resolved) const;

  /// Runs every candidate of `invocation` through the sandbox and blocks on
  /// the first offending one. `full_command` is quoted in the reason.
  [[nodiscard]] Decision check_invocation(const shell::CommandInvocation &invocation,
                                          const std::string &full_command) const;

  [[nodiscard]] const std::filesystem::path &project_root() const { return project_root_; }
  [[nodiscard]] const std::filesystem::path &temp_root() const { return temp_root_; }
  [[nodiscard]] const std::vector<std::filesystem::path> &read_dirs() const { return read_dirs_; }
  [[nodiscard]] const std::vector<std::filesystem::path> &write_dirs() const {
    return write_dirs_;
  }

private:
  PathSandbox(std::filesystem::path project_root, std::filesystem::path temp_root,
              std::vector<std::filesystem::path> read_dirs,
              std::vector<std::filesystem::path> write_dirs,
              std::vector<std::string> sensitive_paths)
      : project_root_(std::move(project_root)), temp_root_(std::move(temp_root)),
        read_dirs_(std::move(read_dirs)), write_dirs_(std::move(write_dirs)),
        sensitive_paths_(std::move(sensitive_paths)) {}

  std::filesystem::path project_root_;
  std::filesystem::path temp_root_;
  std::vector<std::filesystem::path> read_dirs_;
  std::vector<std::filesystem::path> write_dirs_;
  std::vector<std::string> sensitive_paths_;
};

/// True when some `/`-separated component of `pattern` is a glob the shell
/// could expand to `.` or `..`, such as `.*` or `.?`.
[[nodiscard]] bool glob_may_match_dot_entries(const std::string &pattern);

[[nodiscard]] bool is_device_path(const std::string &path);

} // namespace shellgate::security
