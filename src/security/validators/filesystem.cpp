#include "shellgate/security/validators/filesystem.hpp"

#include "shellgate/common/fs.hpp"

#include <array>
#include <optional>
#include <string_view>

namespace shellgate::security::validators {

namespace {

constexpr std::array<std::string_view, 19> kDangerousDeletePatterns = {
    "/*",   "../*", "/..",  "/.",   ".*",   "**/",  "~/*",   "/home", "/etc", "/usr",
    "/var", "/bin", "/sbin", "/lib", "/boot", "/dev", "/proc", "/sys",  "/root"};

constexpr std::array<std::string_view, 5> kDeleteRoots = {"/", "~", "*", ".", ".."};

constexpr std::array<std::string_view, 7> kDangerousRmdirTargets = {"/",  "/*", "../*", "~",
                                                                    "~/*", ".", "*"};

bool is_recursive_flag(const std::string &flag) {
  if (flag == "--recursive") {
    return true;
  }
  if (flag.size() < 2 || flag[0] != '-' || flag[1] == '-') {
    return false;
  }
  return flag.find('r') != std::string::npos || flag.find('R') != std::string::npos;
}

} // namespace

bool is_executable_mode(const std::string &mode) {
  if (!common::ends_with(mode, "+x")) {
    return false;
  }
  for (std::size_t i = 0; i + 2 < mode.size(); ++i) {
    const char ch = mode[i];
    if (ch != 'u' && ch != 'g' && ch != 'o' && ch != 'a') {
      return false;
    }
  }
  return true;
}

common::Status
PermissionChangeValidator::validate(const shell::CommandInvocation &invocation) const {
  std::optional<std::string> mode;
  std::vector<std::string> files;
  for (const auto &token : shell::argument_tokens(invocation)) {
    if (token.kind == shell::TokenKind::Flag) {
      return common::Status::error("chmod flags are not allowed");
    }
    if (!mode.has_value()) {
      mode = token.text;
    } else {
      files.push_back(token.text);
    }
  }

  if (!mode.has_value()) {
    return common::Status::error("chmod requires a mode");
  }
  if (files.empty()) {
    return common::Status::error("chmod requires at least one file");
  }
  if (!is_executable_mode(*mode)) {
    return common::Status::error("chmod only allowed with +x mode, got: " + *mode);
  }
  return common::Status::success();
}

common::Status
RecursiveDeleteValidator::validate(const shell::CommandInvocation &invocation) const {
  std::vector<std::string> targets;
  bool recursive = false;
  bool options_done = false;
  for (const auto &token : shell::argument_tokens(invocation)) {
    if (!options_done && token.kind == shell::TokenKind::Flag) {
      if (token.text == "--") {
        options_done = true;
      } else if (is_recursive_flag(token.text)) {
        recursive = true;
      }
      continue;
    }
    targets.push_back(token.text);
  }

  if (targets.empty()) {
    return common::Status::error("rm requires at least one target");
  }

  for (const auto &target : targets) {
    for (const auto root : kDeleteRoots) {
      if (target == root) {
        return common::Status::error("rm blocked: dangerous pattern '" + target + "'");
      }
    }
    for (const auto pattern : kDangerousDeletePatterns) {
      const std::string p(pattern);
      if (target == p || common::starts_with(target, p) || common::ends_with(target, p)) {
        return common::Status::error("rm blocked: dangerous pattern '" + target + "'");
      }
    }
    if (recursive && (common::starts_with(target, ".*") || target.find("/..") != std::string::npos)) {
      return common::Status::error(
          "rm blocked: recursive deletion of hidden files/directories not allowed: " + target);
    }
  }

  if (recursive) {
    for (const auto &target : targets) {
      if (target.find('*') != std::string::npos) {
        return common::Status::error(
            "rm blocked: recursive deletion with wildcard not allowed: " + target);
      }
    }
  }
  return common::Status::success();
}

common::Status
DirectoryRemovalValidator::validate(const shell::CommandInvocation &invocation) const {
  std::vector<std::string> targets;
  bool options_done = false;
  for (const auto &token : shell::argument_tokens(invocation)) {
    if (!options_done && token.kind == shell::TokenKind::Flag) {
      options_done = token.text == "--";
      continue;
    }
    targets.push_back(token.text);
  }

  if (targets.empty()) {
    return common::Status::error("rmdir requires at least one target");
  }

  for (const auto &target : targets) {
    for (const auto pattern : kDangerousRmdirTargets) {
      if (target == pattern) {
        return common::Status::error("rmdir blocked: dangerous pattern '" + target + "'");
      }
    }
    if (target.find("..") != std::string::npos && !common::starts_with(target, "./")) {
      return common::Status::error("rmdir blocked: path traversal not allowed: " + target);
    }
  }
  return common::Status::success();
}

} // namespace shellgate::security::validators
