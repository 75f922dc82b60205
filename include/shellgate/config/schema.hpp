#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace shellgate::config {

struct PolicyConfig {
  std::vector<std::string> allowed_commands = {
      // Files and text
      "ls", "cat", "find", "head", "tail", "wc", "grep", "awk", "tee", "stat", "tree", "touch",
      "cp", "mkdir", "chmod", "rm", "rmdir", "mv", "pwd", "sort", "tr", "cut", "sed", "diff",
      "realpath", "readlink", "mktemp", "basename", "dirname", "jq", "unzip", "jar",
      // Shell utilities
      "echo", "printf", "date", "id", "seq", "which", "read", "test", "true", "false", "sleep",
      "source", "nohup",
      // JavaScript
      "npm", "node", "pnpm", "npx", "vite", "next", "tsc", "eslint", "jest", "vitest",
      // JVM
      "gradle", "gradlew", "java", "mvn", "mvnw",
      // Python
      "python", "pip", "uv", "uvx", "ruff", "mypy", "uvicorn", "pylint", "flake8", "pytest",
      // Other toolchains
      "cargo", "rustc", "clippy", "go", "golangci-lint", "swift", "swiftlint", "xcodebuild",
      "sonar-scanner",
      // Services and processes
      "docker", "kubectl", "psql", "mysql", "curl", "git", "ps", "lsof", "netstat", "pkill",
      "kill", "systemctl", "journalctl", "ac", "ac-msg",
      // Lifecycle scripts
      "start.sh", "stop.sh", "restart.sh", "shutdown.sh", "startup.sh", "build.sh", "kcadm.sh",
      "kc.sh"};

  std::vector<std::string> extra_validation_commands = {
      "pkill", "chmod", "start.sh", "restart.sh", "stop.sh", "docker", "systemctl", "rm", "rmdir",
      "kill"};

  std::vector<std::string> sensitive_paths = {
      "/etc/passwd", "/etc/shadow", "/etc/sudoers", "/etc/ssh", "/etc/ssl", "/etc/pki",
      "/etc/security", "/root", "/home", "/var/log", "/var/run", "/var/spool", "/proc", "/sys",
      "/dev", "/boot", "/lib/firmware", "~/.ssh", "~/.gnupg", "~/.aws", "~/.config", ".env",
      ".git/config", "credentials", "secrets"};

  std::vector<std::string> privileged_commands = {"sudo"};

  std::vector<std::string> wrapper_commands = {"nohup", "env",  "xargs", "timeout",
                                               "nice",  "time", "exec",  "command",
                                               "builtin", "stdbuf"};

  std::vector<std::string> shell_interpreters = {"sh", "bash", "zsh", "dash"};

  std::vector<std::string> terminable_processes = {"node", "npm",  "npx",     "vite",
                                                   "next", "pnpm", "uvicorn", "java"};

  std::vector<std::string> protected_mount_sources = {"/",     "/home", "/etc", "/usr",
                                                      "/var",  "/root", "/proc", "/sys",
                                                      "/dev",  "/boot"};

  std::string temp_root = "/tmp";
  // Directories outside the project that stay reachable. Reads accept both
  // lists; writes accept only additional_write_dirs.
  std::vector<std::string> additional_read_dirs;
  std::vector<std::string> additional_write_dirs;
  std::size_t max_nesting_depth = 32;
};

struct HookConfig {
  std::vector<std::string> shell_tools = {"Bash"};
};

struct ObservabilityConfig {
  std::string backend = "log";
  // debug, info, warn or error. Allowed decisions are logged at debug.
  std::string log_level = "info";
};

struct AuditConfig {
  bool enabled = false;
  std::string database = "~/.shellgate/audit.db";
};

struct Config {
  PolicyConfig policy;
  HookConfig hook;
  ObservabilityConfig observability;
  AuditConfig audit;
};

} // namespace shellgate::config
