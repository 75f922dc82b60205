#include "shellgate/security/path_sandbox.hpp"

#include "shellgate/common/fs.hpp"

#include <array>
#include <sstream>

#include <fnmatch.h>

namespace shellgate::security {

namespace {

namespace fs = std::filesystem;

constexpr std::array<const char *, 8> kDevicePaths = {
    "/dev/null", "/dev/stdout", "/dev/stderr", "/dev/stdin",
    "/dev/tty",  "/dev/zero",   "/dev/urandom", "/dev/random"};

bool is_under_or_equal(const fs::path &candidate, const fs::path &root) {
  return !root.empty() && common::is_subpath(candidate, root);
}

bool is_under_any(const fs::path &candidate, const std::vector<fs::path> &roots) {
  for (const auto &root : roots) {
    if (is_under_or_equal(candidate, root)) {
      return true;
    }
  }
  return false;
}

// Directories that cannot be resolved contribute nothing.
std::vector<fs::path> resolve_dirs(const std::vector<std::string> &dirs) {
  std::vector<fs::path> out;
  for (const auto &dir : dirs) {
    auto expanded = common::expand_home(dir);
    if (!expanded.ok()) {
      continue;
    }
    auto resolved = common::resolve_path(expanded.value());
    if (resolved.ok() && resolved.value() != fs::path("/")) {
      out.push_back(resolved.value());
    }
  }
  return out;
}

// Display form used in block reasons: `operation` names the check that failed.
std::string escape_reason(const std::string &prefix, const std::string &path,
                          const fs::path &resolved, const fs::path &project,
                          const std::string &operation, const std::string &command) {
  return "Bash command blocked: " + prefix + "Path escapes project directory: '" + path +
         "' resolves to '" + resolved.string() + "' which is outside '" + project.string() +
         "'. " + operation + " denied for security.\nCommand: " + command;
}

} // namespace

bool glob_may_match_dot_entries(const std::string &pattern) {
  std::stringstream components(pattern);
  std::string component;
  while (std::getline(components, component, '/')) {
    if (component.find_first_of("*?[") == std::string::npos) {
      continue;
    }
    // Bracket expressions are checked without FNM_PERIOD since shells
    // disagree on whether `[.]` may match a leading dot.
    const int flags = component.front() == '[' ? 0 : FNM_PERIOD;
    if (::fnmatch(component.c_str(), ".", flags) == 0 ||
        ::fnmatch(component.c_str(), "..", flags) == 0) {
      return true;
    }
  }
  return false;
}

bool is_device_path(const std::string &path) {
  for (const char *device : kDevicePaths) {
    if (path == device) {
      return true;
    }
  }
  return false;
}

common::Result<PathSandbox> PathSandbox::create(const std::string &project_root,
                                                const CommandPolicy &policy) {
  if (project_root.empty()) {
    return common::Result<PathSandbox>::failure("project directory is empty");
  }
  const fs::path root(project_root);
  if (!root.is_absolute()) {
    return common::Result<PathSandbox>::failure("project directory is not absolute: " +
                                                project_root);
  }
  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    return common::Result<PathSandbox>::failure("project directory does not exist: " +
                                                project_root);
  }
  auto canonical_root = common::resolve_path(root);
  if (!canonical_root.ok()) {
    return common::Result<PathSandbox>::failure("cannot resolve project directory '" +
                                                project_root + "': " + canonical_root.error());
  }

  // A temp root that cannot be resolved simply contributes nothing.
  fs::path temp_root;
  if (!policy.temp_root().empty()) {
    temp_root = common::resolve_path(policy.temp_root()).value_or(fs::path{});
  }

  return common::Result<PathSandbox>::success(
      PathSandbox(canonical_root.value(), temp_root, resolve_dirs(policy.additional_read_dirs()),
                  resolve_dirs(policy.additional_write_dirs()), policy.sensitive_paths()));
}

common::Result<fs::path> PathSandbox::resolve(const std::string &path, bool has_expansion) const {
  if (path.empty()) {
    return common::Result<fs::path>::failure("empty path");
  }
  if (path.find('\0') != std::string::npos) {
    return common::Result<fs::path>::failure("path contains a NUL byte");
  }
  if (has_expansion) {
    return common::Result<fs::path>::failure("path depends on a shell expansion");
  }

  auto expanded = common::expand_home(path);
  if (!expanded.ok()) {
    return common::Result<fs::path>::failure(expanded.error());
  }

  fs::path candidate(expanded.value());
  if (candidate.is_relative()) {
    candidate = project_root_ / candidate;
  }
  return common::resolve_path(candidate);
}

bool PathSandbox::contains(const fs::path &resolved) const {
  return is_under_or_equal(resolved, project_root_) || is_under_or_equal(resolved, temp_root_);
}

bool PathSandbox::permits(const fs::path &resolved, FileAccess access) const {
  if (contains(resolved) || is_under_any(resolved, write_dirs_)) {
    return true;
  }
  return access == FileAccess::Read && is_under_any(resolved, read_dirs_);
}

PathCheck PathSandbox::check(const PathCandidate &candidate) const {
  if (candidate.has_glob && !candidate.has_expansion &&
      glob_may_match_dot_entries(candidate.path)) {
    return PathCheck{.outcome = PathOutcome::Unresolvable,
                     .resolved = {},
                     .message = "glob may expand to '..'"};
  }
  return check(candidate.path, candidate.has_expansion, candidate.access);
}

PathCheck PathSandbox::check(const std::string &path, bool has_expansion,
                             FileAccess access) const {
  if (is_device_path(path)) {
    return PathCheck{.outcome = PathOutcome::Allowed, .resolved = path, .message = {}};
  }
  auto resolved = resolve(path, has_expansion);
  if (!resolved.ok()) {
    return PathCheck{
        .outcome = PathOutcome::Unresolvable, .resolved = {}, .message = resolved.error()};
  }
  if (permits(resolved.value(), access)) {
    return PathCheck{.outcome = PathOutcome::Allowed, .resolved = resolved.value(), .message = {}};
  }
  return PathCheck{.outcome = PathOutcome::Escapes,
                   .resolved = resolved.value(),
                   .message = "outside project directory"};
}

std::optional<std::string> PathSandbox::sensitive_source_reason(const std::string &path,
                                                                const fs::path &resolved) const {
  fs::path literal(common::expand_home(path).value_or(path));
  if (literal.is_relative()) {
    literal = project_root_ / literal;
  }
  literal = literal.lexically_normal();
  const std::string lowered = common::to_lower(path);
  const bool absolute_form = common::starts_with(path, "/") || common::starts_with(path, "~");

  for (const auto &entry : sensitive_paths_) {
    if (common::starts_with(entry, "/") || common::starts_with(entry, "~")) {
      auto expanded = common::expand_home(entry);
      if (!expanded.ok()) {
        continue;
      }
      const fs::path literal_entry = fs::path(expanded.value()).lexically_normal();
      const fs::path canonical_entry =
          common::resolve_path(literal_entry).value_or(literal_entry);

      if (literal == literal_entry || resolved == canonical_entry) {
        return "cp blocked: cannot copy from sensitive path '" + path + "'";
      }
      if (is_under_or_equal(literal, literal_entry) ||
          is_under_or_equal(resolved, canonical_entry)) {
        return "cp blocked: cannot copy from sensitive directory '" + entry + "'";
      }
      continue;
    }

    if (absolute_form && lowered.find(common::to_lower(entry)) != std::string::npos) {
      return "cp blocked: cannot copy sensitive file pattern '" + path + "'";
    }
  }
  return std::nullopt;
}

Decision PathSandbox::check_invocation(const shell::CommandInvocation &invocation,
                                       const std::string &full_command) const {
  for (const auto &candidate : extract_path_candidates(invocation)) {
    const PathCheck result = check(candidate);
    if (result.outcome == PathOutcome::Unresolvable) {
      return Decision::block(BlockKind::ResolutionError, Stage::PathCheck,
                             "Bash command blocked: Cannot validate path '" + candidate.path +
                                 "': " + result.message + "\nCommand: " + full_command);
    }
    if (result.allowed()) {
      continue;
    }

    const bool copy_source = candidate.command == "cp" && candidate.role == PathRole::Source;
    if (copy_source) {
      if (auto reason = sensitive_source_reason(candidate.path, result.resolved)) {
        return Decision::block(BlockKind::PathEscape, Stage::PathCheck,
                               "Bash command blocked: " + *reason + "\nCommand: " + full_command);
      }
      continue;
    }

    std::string prefix;
    std::string operation = "File operation";
    if (candidate.role == PathRole::Destination) {
      operation = "Destination path";
    } else if (candidate.role == PathRole::Source) {
      prefix = candidate.command + " source ";
      operation = "Source path (" + candidate.command + ")";
    }
    return Decision::block(BlockKind::PathEscape, Stage::PathCheck,
                           escape_reason(prefix, candidate.path, result.resolved, project_root_,
                                         operation, full_command));
  }
  return Decision::allow();
}

} // namespace shellgate::security
