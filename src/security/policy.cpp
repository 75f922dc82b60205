#include "shellgate/security/policy.hpp"

#include "shellgate/common/fs.hpp"
#include "shellgate/common/hash.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace shellgate::security {

namespace {

std::unordered_set<std::string> to_set(const std::vector<std::string> &values) {
  std::unordered_set<std::string> out;
  for (const auto &value : values) {
    const std::string trimmed = common::trim(value);
    if (!trimmed.empty()) {
      out.insert(trimmed);
    }
  }
  return out;
}

std::vector<std::string> sorted(const std::unordered_set<std::string> &values) {
  std::vector<std::string> out(values.begin(), values.end());
  std::sort(out.begin(), out.end());
  return out;
}

std::string join(const std::vector<std::string> &values, const char *separator) {
  std::string out;
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out += separator;
    }
    out += values[i];
  }
  return out;
}

bool is_word_char(char ch) {
  return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_';
}

} // namespace

CommandPolicy::CommandPolicy() { load(config::PolicyConfig{}); }

void CommandPolicy::load(const config::PolicyConfig &config) {
  allowed_ = to_set(config.allowed_commands);
  extra_validation_ = to_set(config.extra_validation_commands);
  privileged_ = to_set(config.privileged_commands);
  wrappers_ = to_set(config.wrapper_commands);
  interpreters_ = to_set(config.shell_interpreters);
  terminable_processes_ = to_set(config.terminable_processes);
  sensitive_paths_ = config.sensitive_paths;
  protected_mount_sources_ = config.protected_mount_sources;
  temp_root_ = std::filesystem::path(config.temp_root).lexically_normal();
  read_dirs_ = config.additional_read_dirs;
  write_dirs_ = config.additional_write_dirs;
  max_depth_ = config.max_nesting_depth;
}

common::Result<CommandPolicy> CommandPolicy::from_config(const config::PolicyConfig &config) {
  if (config.temp_root.empty() || config.temp_root.front() != '/') {
    return common::Result<CommandPolicy>::failure("temp root must be an absolute path: '" +
                                                  config.temp_root + "'");
  }
  for (const auto *dirs : {&config.additional_read_dirs, &config.additional_write_dirs}) {
    for (const auto &dir : *dirs) {
      if (!common::starts_with(dir, "/") && !common::starts_with(dir, "~")) {
        return common::Result<CommandPolicy>::failure(
            "additional directory must be an absolute path: '" + dir + "'");
      }
    }
  }
  if (config.max_nesting_depth == 0) {
    return common::Result<CommandPolicy>::failure("max nesting depth must be positive");
  }

  CommandPolicy policy;
  policy.load(config);
  return common::Result<CommandPolicy>::success(std::move(policy));
}

bool CommandPolicy::is_command_allowed(const std::string &name) const {
  return allowed_.contains(name);
}

bool CommandPolicy::needs_extra_validation(const std::string &name) const {
  return extra_validation_.contains(name);
}

bool CommandPolicy::is_terminable_process(const std::string &name) const {
  return terminable_processes_.contains(name);
}

std::optional<std::string> CommandPolicy::find_privileged(const std::string &command) const {
  for (const auto &name : sorted(privileged_)) {
    std::size_t pos = command.find(name);
    while (pos != std::string::npos) {
      const bool start_ok = pos == 0 || !is_word_char(command[pos - 1]);
      const std::size_t after = pos + name.size();
      const bool end_ok = after >= command.size() || !is_word_char(command[after]);
      if (start_ok && end_ok) {
        return name;
      }
      pos = command.find(name, pos + 1);
    }
  }
  return std::nullopt;
}

shell::AnalyzerOptions CommandPolicy::analyzer_options() const {
  return shell::AnalyzerOptions{
      .extractor = shell::ExtractorOptions{.wrapper_commands = wrappers_,
                                           .shell_interpreters = interpreters_},
      .max_depth = max_depth_,
  };
}

std::string CommandPolicy::fingerprint() const {
  std::ostringstream canonical;
  canonical << "allowed=" << join(sorted(allowed_), ",") << "\n";
  canonical << "extra_validation=" << join(sorted(extra_validation_), ",") << "\n";
  canonical << "privileged=" << join(sorted(privileged_), ",") << "\n";
  canonical << "wrappers=" << join(sorted(wrappers_), ",") << "\n";
  canonical << "interpreters=" << join(sorted(interpreters_), ",") << "\n";
  canonical << "terminable=" << join(sorted(terminable_processes_), ",") << "\n";

  auto sensitive = sensitive_paths_;
  std::sort(sensitive.begin(), sensitive.end());
  canonical << "sensitive=" << join(sensitive, ",") << "\n";
  auto mounts = protected_mount_sources_;
  std::sort(mounts.begin(), mounts.end());
  canonical << "mounts=" << join(mounts, ",") << "\n";
  canonical << "temp_root=" << temp_root_.string() << "\n";
  auto read_dirs = read_dirs_;
  std::sort(read_dirs.begin(), read_dirs.end());
  canonical << "read_dirs=" << join(read_dirs, ",") << "\n";
  auto write_dirs = write_dirs_;
  std::sort(write_dirs.begin(), write_dirs.end());
  canonical << "write_dirs=" << join(write_dirs, ",") << "\n";
  canonical << "max_depth=" << max_depth_ << "\n";
  return common::sha256_hex(canonical.str());
}

std::string CommandPolicy::describe() const {
  std::ostringstream out;
  out << "allowed commands (" << allowed_.size() << "): " << join(sorted(allowed_), " ") << "\n";
  out << "extra validation (" << extra_validation_.size()
      << "): " << join(sorted(extra_validation_), " ") << "\n";
  out << "privileged: " << join(sorted(privileged_), " ") << "\n";
  out << "wrappers: " << join(sorted(wrappers_), " ") << "\n";
  out << "shell interpreters: " << join(sorted(interpreters_), " ") << "\n";
  out << "terminable processes: " << join(sorted(terminable_processes_), " ") << "\n";
  out << "sensitive paths: " << join(sensitive_paths_, " ") << "\n";
  out << "protected mount sources: " << join(protected_mount_sources_, " ") << "\n";
  out << "temp root: " << temp_root_.string() << "\n";
  out << "additional read dirs: " << join(read_dirs_, " ") << "\n";
  out << "additional write dirs: " << join(write_dirs_, " ") << "\n";
  out << "max nesting depth: " << max_depth_ << "\n";
  out << "fingerprint: " << fingerprint() << "\n";
  return out.str();
}

PolicyPtr default_policy() {
  static const PolicyPtr policy = std::make_shared<const CommandPolicy>();
  return policy;
}

} // namespace shellgate::security
