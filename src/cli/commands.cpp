#include "shellgate/cli/commands.hpp"

#include "shellgate/audit/journal.hpp"
#include "shellgate/common/fs.hpp"
#include "shellgate/config/config.hpp"
#include "shellgate/hooks/protocol.hpp"
#include "shellgate/observability/observers.hpp"
#include "shellgate/observability/global.hpp"
#include "shellgate/security/bash_hook.hpp"
#include "shellgate/security/file_tool_hook.hpp"

#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace shellgate::cli {

namespace {

constexpr int kExitBlocked = 2;

std::string version_string() {
#ifdef SHELLGATE_VERSION
  std::string version = SHELLGATE_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "shellgate " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--") {
      return false;
    }
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--") {
      return false;
    }
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--") {
      break;
    }
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

std::string read_stdin_all() {
  std::ostringstream out;
  out << std::cin.rdbuf();
  return out.str();
}

// Everything a subcommand needs: validated config, the policy built from it
// and the observer installed globally.
struct Runtime {
  config::Config config;
  security::PolicyPtr policy;
  std::vector<std::string> warnings;
};

common::Result<Runtime> load_runtime() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return common::Result<Runtime>::failure(cfg.error());
  }
  auto validated = config::validate_config(cfg.value());
  if (!validated.ok()) {
    return common::Result<Runtime>::failure(validated.error());
  }
  auto policy = security::CommandPolicy::from_config(cfg.value().policy);
  if (!policy.ok()) {
    return common::Result<Runtime>::failure(policy.error());
  }

  observability::set_global_observer(observability::create_observer(cfg.value()));
  Runtime runtime{
      .config = std::move(cfg.value()),
      .policy = std::make_shared<const security::CommandPolicy>(std::move(policy.value())),
      .warnings = std::move(validated.value()),
  };
  for (const auto &warning : runtime.warnings) {
    observability::record_error("config", "warning: " + warning);
  }

  const auto source = config::config_path();
  observability::record_policy_loaded(
      config::config_exists() && source.ok() ? source.value().string() : "defaults",
      runtime.policy->fingerprint(), runtime.policy->allowed_commands().size());
  return common::Result<Runtime>::success(std::move(runtime));
}

// Journal failures are reported but never change a decision.
void journal_decision(const Runtime &runtime, const hooks::HookExchange &exchange) {
  if (!runtime.config.audit.enabled || !exchange.request.has_value()) {
    return;
  }
  const auto db_path = common::expand_home(runtime.config.audit.database);
  if (!db_path.ok()) {
    observability::record_error("audit", db_path.error());
    return;
  }
  auto journal = audit::DecisionJournal::open(db_path.value());
  if (!journal.ok()) {
    observability::record_error("audit", journal.error());
    return;
  }

  const auto &request = *exchange.request;
  std::string subject = request.input_string("command").value_or("");
  if (subject.empty()) {
    const std::string path = request.input_string("path").value_or("");
    subject = request.input_string("file_path").value_or(path);
  }
  auto recorded = journal.value()->record(request.tool_name, subject,
                                          request.project_dir.value_or(""), exchange.decision,
                                          runtime.policy->fingerprint());
  if (!recorded.ok()) {
    observability::record_error("audit", recorded.error());
  }
}

int run_hook(std::vector<std::string> args, bool file_tools_only) {
  std::optional<std::string> project;
  std::string value;
  if (take_option(args, "--project", "-p", value)) {
    project = value;
  }
  const std::string input = read_stdin_all();

  auto runtime = load_runtime();
  if (!runtime.ok()) {
    // Fail closed: a broken configuration must not let commands through.
    const auto decision = security::Decision::block(
        security::BlockKind::PolicyViolation, security::Stage::Parse,
        "shellgate configuration error: " + runtime.error());
    std::cerr << "[ERROR] config: " << runtime.error() << "\n";
    std::cout << hooks::encode_hook_response(decision) << "\n";
    return 0;
  }

  const security::BashSecurityHook bash_hook(runtime.value().policy,
                                             runtime.value().config.hook.shell_tools);
  const security::FileToolHook file_hook(runtime.value().policy);
  const auto exchange = hooks::handle_hook_json(input, file_tools_only ? nullptr : &bash_hook,
                                                &file_hook, project);
  journal_decision(runtime.value(), exchange);

  std::cout << exchange.response << "\n";
  observability::flush_global_observer();
  return 0;
}

int run_check(std::vector<std::string> args) {
  std::optional<std::string> project;
  std::string value;
  if (take_option(args, "--project", "-p", value)) {
    project = value;
  }
  const bool as_json = take_flag(args, "--json");
  if (!args.empty() && args.front() == "--") {
    args.erase(args.begin());
  }
  if (args.empty()) {
    std::cerr << "usage: shellgate check [--project DIR] [--json] -- <command...>\n";
    return 1;
  }
  const std::string command = join_tokens(args);

  auto runtime = load_runtime();
  if (!runtime.ok()) {
    std::cerr << runtime.error() << "\n";
    return 1;
  }
  const security::BashSecurityHook hook(runtime.value().policy,
                                        runtime.value().config.hook.shell_tools);
  const auto decision = hook.evaluate_command(command, project);

  if (as_json) {
    std::cout << hooks::encode_decision_report(decision, command) << "\n";
  } else if (decision.allowed) {
    std::cout << "allow\n";
  } else {
    std::cout << "block [" << security::block_kind_name(decision.kind) << " at "
              << security::stage_name(decision.stage) << "]: " << decision.reason << "\n";
  }
  return decision.allowed ? 0 : kExitBlocked;
}

int run_policy(std::vector<std::string> args) {
  auto runtime = load_runtime();
  if (!runtime.ok()) {
    std::cerr << runtime.error() << "\n";
    return 1;
  }
  const auto &policy = *runtime.value().policy;
  if (args.empty() || args[0] == "show") {
    std::cout << policy.describe();
    return 0;
  }
  if (args[0] == "fingerprint") {
    std::cout << policy.fingerprint() << "\n";
    return 0;
  }
  std::cerr << "unknown policy command: " << args[0] << "\n";
  return 1;
}

int run_config(std::vector<std::string> args) {
  if (args.empty() || args[0] == "path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }

  if (args[0] == "validate") {
    auto cfg = config::load_config();
    if (!cfg.ok()) {
      std::cerr << cfg.error() << "\n";
      return 1;
    }
    auto validated = config::validate_config(cfg.value());
    if (!validated.ok()) {
      std::cerr << "invalid: " << validated.error() << "\n";
      return 1;
    }
    for (const auto &warning : validated.value()) {
      std::cout << "warning: " << warning << "\n";
    }
    std::cout << "ok\n";
    return 0;
  }

  if (args[0] == "init") {
    const bool force = take_flag(args, "--force");
    if (config::config_exists() && !force) {
      std::cerr << "config already exists; pass --force to overwrite\n";
      return 1;
    }
    auto saved = config::save_config(config::Config{});
    if (!saved.ok()) {
      std::cerr << saved.error() << "\n";
      return 1;
    }
    if (auto path = config::config_path(); path.ok()) {
      std::cout << "wrote " << path.value().string() << "\n";
    }
    return 0;
  }

  std::cerr << "unknown config command: " << args[0] << "\n";
  return 1;
}

int run_audit(std::vector<std::string> args) {
  std::size_t limit = 20;
  std::string value;
  if (take_option(args, "--limit", "-n", value)) {
    try {
      limit = static_cast<std::size_t>(std::stoul(value));
    } catch (const std::exception &) {
      std::cerr << "invalid --limit: " << value << "\n";
      return 1;
    }
  }
  const bool stats_only = take_flag(args, "--stats");

  auto runtime = load_runtime();
  if (!runtime.ok()) {
    std::cerr << runtime.error() << "\n";
    return 1;
  }
  const auto db_path = common::expand_home(runtime.value().config.audit.database);
  if (!db_path.ok()) {
    std::cerr << db_path.error() << "\n";
    return 1;
  }
  auto journal = audit::DecisionJournal::open(db_path.value());
  if (!journal.ok()) {
    std::cerr << journal.error() << "\n";
    return 1;
  }

  if (stats_only) {
    auto stats = journal.value()->stats();
    if (!stats.ok()) {
      std::cerr << stats.error() << "\n";
      return 1;
    }
    std::cout << "decisions: " << stats.value().total << "\n";
    std::cout << "blocked:   " << stats.value().blocked << "\n";
    return 0;
  }

  auto entries = journal.value()->recent(limit);
  if (!entries.ok()) {
    std::cerr << entries.error() << "\n";
    return 1;
  }
  for (const auto &entry : entries.value()) {
    std::cout << entry.created_at << "  " << (entry.allowed ? "allow" : "block") << "  "
              << entry.tool << "  " << entry.command;
    if (!entry.allowed) {
      std::cout << "\n    " << entry.kind << ": " << entry.reason;
    }
    std::cout << "\n";
  }
  return 0;
}

} // namespace

void print_help() {
  std::cout << version_string() << " - pre-execution gate for agent shell commands\n\n";
  std::cout << "usage: shellgate [--config PATH] <command> [options]\n\n";
  std::cout << "hook commands (JSON on stdin, JSON decision on stdout):\n";
  std::cout << "  hook [--project DIR]         evaluate a shell or file tool call\n";
  std::cout << "  file-hook [--project DIR]    evaluate a file tool call only\n\n";
  std::cout << "operator commands:\n";
  std::cout << "  check [--project DIR] [--json] -- <command...>\n";
  std::cout << "                               evaluate a command; exit 0 allow, 2 block\n";
  std::cout << "  policy [show|fingerprint]    print the effective policy\n";
  std::cout << "  config [path|validate|init]  inspect or create the config file\n";
  std::cout << "  audit [--limit N] [--stats]  show recent journal entries\n";
  std::cout << "  version                      show version\n";
}

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help();
    return 0;
  }

  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }
  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "hook") {
    return run_hook(std::move(args), false);
  }
  if (subcommand == "file-hook") {
    return run_hook(std::move(args), true);
  }
  if (subcommand == "check") {
    return run_check(std::move(args));
  }
  if (subcommand == "policy") {
    return run_policy(std::move(args));
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }
  if (subcommand == "audit") {
    return run_audit(std::move(args));
  }

  std::cerr << "unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace shellgate::cli
