#include "shellgate/config/config.hpp"

#include "shellgate/common/fs.hpp"
#include "shellgate/common/toml.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unordered_set>

namespace shellgate::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".shellgate";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::filesystem::path expand_or_keep(const std::string &value) {
  auto expanded = common::expand_home(value);
  return std::filesystem::path(expanded.ok() ? expanded.value() : value);
}

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = std::getenv("SHELLGATE_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return expand_or_keep(env);
  }
  return std::nullopt;
}

void load_string_list(const common::TomlDocument &doc, const std::string &key,
                      std::vector<std::string> &target) {
  if (doc.is_array(key)) {
    target = doc.get_string_array(key);
  }
}

void append_unique(std::vector<std::string> &target, const std::vector<std::string> &extra) {
  for (const auto &value : extra) {
    if (std::find(target.begin(), target.end(), value) == target.end()) {
      target.push_back(value);
    }
  }
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

std::string string_array_to_toml(const std::vector<std::string> &values) {
  std::ostringstream stream;
  stream << "[\n";
  for (const auto &value : values) {
    stream << "  " << common::quote_toml_string(value) << ",\n";
  }
  stream << ']';
  return stream.str();
}

bool is_known_backend(const std::string &backend) {
  return backend == "log" || backend == "none" || backend == "noop";
}

bool is_known_log_level(const std::string &level) {
  return level == "debug" || level == "info" || level == "warn" || level == "error";
}

} // namespace

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER /
                                                        CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = expand_or_keep(path->string());
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

void apply_env_overrides(Config &config) {
  if (const char *backend = std::getenv("SHELLGATE_OBSERVABILITY");
      backend != nullptr && *backend) {
    config.observability.backend = backend;
  }
  if (const char *db = std::getenv("SHELLGATE_AUDIT_DB"); db != nullptr && *db) {
    config.audit.enabled = true;
    config.audit.database = db;
  }
  if (const char *temp_root = std::getenv("SHELLGATE_TEMP_ROOT");
      temp_root != nullptr && *temp_root) {
    config.policy.temp_root = temp_root;
  }
}

common::Result<Config> parse_config(const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;
  auto &policy = config.policy;
  load_string_list(doc, "policy.allowed_commands", policy.allowed_commands);
  append_unique(policy.allowed_commands,
                doc.get_string_array("policy.additional_allowed_commands"));
  load_string_list(doc, "policy.extra_validation_commands", policy.extra_validation_commands);
  load_string_list(doc, "policy.sensitive_paths", policy.sensitive_paths);
  load_string_list(doc, "policy.privileged_commands", policy.privileged_commands);
  load_string_list(doc, "policy.wrapper_commands", policy.wrapper_commands);
  load_string_list(doc, "policy.shell_interpreters", policy.shell_interpreters);
  load_string_list(doc, "policy.terminable_processes", policy.terminable_processes);
  load_string_list(doc, "policy.protected_mount_sources", policy.protected_mount_sources);
  policy.temp_root = doc.get_string("policy.temp_root", policy.temp_root);
  load_string_list(doc, "policy.additional_read_dirs", policy.additional_read_dirs);
  load_string_list(doc, "policy.additional_write_dirs", policy.additional_write_dirs);
  if (doc.has("policy.max_nesting_depth")) {
    const int depth = doc.get_int("policy.max_nesting_depth", -1);
    if (depth <= 0) {
      return common::Result<Config>::failure("policy.max_nesting_depth must be a positive integer");
    }
    policy.max_nesting_depth = static_cast<std::size_t>(depth);
  }

  load_string_list(doc, "hook.shell_tools", config.hook.shell_tools);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
  config.observability.log_level =
      doc.get_string("observability.log_level", config.observability.log_level);

  config.audit.enabled = doc.get_bool("audit.enabled", config.audit.enabled);
  config.audit.database = doc.get_string("audit.database", config.audit.database);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  auto config = parse_config(buffer.str());
  if (!config.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + config.error());
  }
  apply_env_overrides(config.value());
  return config;
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Status::error(cfg_path_result.error());
  }

  const std::filesystem::path path = cfg_path_result.value();
  if (!path.parent_path().empty()) {
    if (auto dir = common::ensure_dir(path.parent_path()); !dir.ok()) {
      return common::Status::error(dir.error());
    }
  }
  const std::filesystem::path tmp_path = path.string() + ".tmp";

  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file) {
    return common::Status::error("Unable to write temporary config file");
  }

  const auto &policy = config.policy;
  file << "[policy]\n";
  file << "allowed_commands = " << string_array_to_toml(policy.allowed_commands) << "\n";
  file << "extra_validation_commands = "
       << string_array_to_toml(policy.extra_validation_commands) << "\n";
  file << "sensitive_paths = " << string_array_to_toml(policy.sensitive_paths) << "\n";
  file << "privileged_commands = " << string_array_to_toml(policy.privileged_commands) << "\n";
  file << "wrapper_commands = " << string_array_to_toml(policy.wrapper_commands) << "\n";
  file << "shell_interpreters = " << string_array_to_toml(policy.shell_interpreters) << "\n";
  file << "terminable_processes = " << string_array_to_toml(policy.terminable_processes)
       << "\n";
  file << "protected_mount_sources = " << string_array_to_toml(policy.protected_mount_sources)
       << "\n";
  file << "temp_root = " << common::quote_toml_string(policy.temp_root) << "\n";
  file << "additional_read_dirs = " << string_array_to_toml(policy.additional_read_dirs) << "\n";
  file << "additional_write_dirs = " << string_array_to_toml(policy.additional_write_dirs)
       << "\n";
  file << "max_nesting_depth = " << policy.max_nesting_depth << "\n";

  file << "\n[hook]\n";
  file << "shell_tools = " << string_array_to_toml(config.hook.shell_tools) << "\n";

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  file << "log_level = " << common::quote_toml_string(config.observability.log_level) << "\n";

  file << "\n[audit]\n";
  file << "enabled = " << bool_to_toml(config.audit.enabled) << "\n";
  file << "database = " << common::quote_toml_string(config.audit.database) << "\n";

  file.close();
  if (!file) {
    return common::Status::error("Failed to write config file: " + tmp_path.string());
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    return common::Status::error("Failed to replace config file: " + ec.message());
  }
  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;
  const auto &policy = config.policy;

  if (policy.allowed_commands.empty()) {
    return common::Result<std::vector<std::string>>::failure(
        "policy.allowed_commands must not be empty");
  }

  const std::unordered_set<std::string> allowed(policy.allowed_commands.begin(),
                                                policy.allowed_commands.end());
  for (const auto &name : policy.allowed_commands) {
    if (name.find('/') != std::string::npos || common::trim(name) != name || name.empty()) {
      return common::Result<std::vector<std::string>>::failure(
          "policy.allowed_commands entries must be bare command names: '" + name + "'");
    }
  }
  for (const auto &name : policy.extra_validation_commands) {
    if (!allowed.contains(name)) {
      warnings.push_back("policy.extra_validation_commands entry '" + name +
                         "' is not in allowed_commands and will always be blocked");
    }
  }
  for (const auto &name : policy.privileged_commands) {
    if (allowed.contains(name)) {
      warnings.push_back("privileged command '" + name +
                         "' is also allowlisted; the privilege check still blocks it");
    }
  }

  if (policy.temp_root.empty() || policy.temp_root.front() != '/') {
    return common::Result<std::vector<std::string>>::failure(
        "policy.temp_root must be an absolute path: '" + policy.temp_root + "'");
  }
  if (policy.temp_root == "/") {
    return common::Result<std::vector<std::string>>::failure(
        "policy.temp_root must not be the filesystem root");
  }
  for (const auto *list : {&policy.additional_read_dirs, &policy.additional_write_dirs}) {
    for (const auto &dir : *list) {
      if (!common::starts_with(dir, "/") && !common::starts_with(dir, "~")) {
        return common::Result<std::vector<std::string>>::failure(
            "policy.additional_read_dirs and additional_write_dirs entries must be absolute: '" +
            dir + "'");
      }
      if (dir == "/") {
        return common::Result<std::vector<std::string>>::failure(
            "additional directories must not be the filesystem root");
      }
    }
  }

  if (config.hook.shell_tools.empty()) {
    warnings.push_back("hook.shell_tools is empty; no tool calls will be evaluated");
  }

  std::stringstream backends(config.observability.backend);
  std::string backend;
  while (std::getline(backends, backend, ',')) {
    backend = common::to_lower(common::trim(backend));
    if (!backend.empty() && !is_known_backend(backend)) {
      return common::Result<std::vector<std::string>>::failure(
          "Invalid observability.backend: " + config.observability.backend);
    }
  }

  if (!is_known_log_level(common::to_lower(common::trim(config.observability.log_level)))) {
    return common::Result<std::vector<std::string>>::failure(
        "Invalid observability.log_level: " + config.observability.log_level);
  }

  if (config.audit.enabled && common::trim(config.audit.database).empty()) {
    return common::Result<std::vector<std::string>>::failure(
        "audit.database must be set when audit.enabled is true");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace shellgate::config
