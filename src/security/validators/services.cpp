#include "shellgate/security/validators/services.hpp"

#include "shellgate/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <optional>
#include <sstream>
#include <unordered_set>

namespace shellgate::security::validators {

namespace {

const std::unordered_set<std::string> &read_only_operations() {
  static const std::unordered_set<std::string> operations = {
      "status", "show", "list-units", "list-unit-files", "is-active", "is-enabled"};
  return operations;
}

std::string normalize_host_path(const std::string &path) {
  if (path.empty() || path[0] != '/') {
    return path;
  }
  std::string normalized = std::filesystem::path(path).lexically_normal().string();
  while (normalized.size() > 1 && normalized.back() == '/') {
    normalized.pop_back();
  }
  return normalized;
}

// `--mount type=bind,source=/etc,target=/x`
std::optional<std::string> mount_source(const std::string &spec) {
  std::stringstream stream(spec);
  std::string field;
  while (std::getline(stream, field, ',')) {
    const auto eq = field.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    const std::string key = common::to_lower(common::trim(field.substr(0, eq)));
    if (key == "source" || key == "src") {
      return common::trim(field.substr(eq + 1));
    }
  }
  return std::nullopt;
}

// Short option cluster whose last letter consumes the next argument (`-itv /:/x`).
bool cluster_ends_with(const std::string &flag, char option) {
  return flag.size() > 2 && flag[0] == '-' && flag[1] != '-' && flag.back() == option &&
         std::all_of(flag.begin() + 1, flag.end(),
                     [](unsigned char c) { return std::isalpha(c) != 0; });
}

} // namespace

ContainerRuntimeValidator::ContainerRuntimeValidator(std::vector<std::string> protected_sources)
    : protected_sources_(std::move(protected_sources)) {}

common::Status ContainerRuntimeValidator::check_host_path(const std::string &host_path) const {
  const std::string normalized = normalize_host_path(host_path);
  for (const auto &source : protected_sources_) {
    if (normalized == normalize_host_path(source)) {
      return common::Status::error("Docker volume mount of system directory not allowed: " +
                                   host_path);
    }
  }
  return common::Status::success();
}

common::Status
ContainerRuntimeValidator::validate(const shell::CommandInvocation &invocation) const {
  const auto args = shell::argument_tokens(invocation);
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string &text = args[i].text;
    std::optional<std::string> volume;
    std::optional<std::string> mount;

    if (text == "-v" || text == "--volume" || cluster_ends_with(text, 'v')) {
      if (i + 1 < args.size()) {
        volume = args[++i].text;
      }
    } else if (common::starts_with(text, "--volume=")) {
      volume = text.substr(9);
    } else if (common::starts_with(text, "-v") && text.size() > 2 && text[1] == 'v') {
      volume = text[2] == '=' ? text.substr(3) : text.substr(2);
    } else if (text == "--mount") {
      if (i + 1 < args.size()) {
        mount = args[++i].text;
      }
    } else if (common::starts_with(text, "--mount=")) {
      mount = text.substr(8);
    }

    std::optional<std::string> host;
    if (volume.has_value()) {
      const auto colon = volume->find(':');
      if (colon != std::string::npos) {
        host = volume->substr(0, colon);
      }
    } else if (mount.has_value()) {
      host = mount_source(*mount);
    }
    if (host.has_value()) {
      if (auto status = check_host_path(*host); !status.ok()) {
        return status;
      }
    }
  }
  return common::Status::success();
}

common::Status
ServiceManagerValidator::validate(const shell::CommandInvocation &invocation) const {
  std::optional<std::string> operation;
  for (const auto &token : shell::argument_tokens(invocation)) {
    if (token.kind != shell::TokenKind::Flag) {
      operation = token.text;
      break;
    }
  }
  if (!operation.has_value()) {
    return common::Status::error("systemctl requires an operation");
  }
  if (!read_only_operations().contains(*operation)) {
    return common::Status::error("systemctl operation '" + *operation +
                                 "' not allowed (only is-active, is-enabled, list-unit-files, "
                                 "list-units, show, status permitted)");
  }
  return common::Status::success();
}

common::Status
LifecycleScriptValidator::validate(const shell::CommandInvocation &invocation) const {
  const std::string &script = invocation.command.text;
  for (const auto &name : commands()) {
    if (script == "./" + name || common::ends_with(script, "/" + name)) {
      return common::Status::success();
    }
  }
  return common::Status::error("Only ./start.sh, ./restart.sh, ./stop.sh is allowed, got: " +
                               script);
}

} // namespace shellgate::security::validators
