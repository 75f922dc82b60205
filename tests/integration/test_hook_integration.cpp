#include "test_framework.hpp"

#include "shellgate/audit/journal.hpp"
#include "shellgate/cli/commands.hpp"
#include "shellgate/config/config.hpp"
#include "shellgate/hooks/protocol.hpp"
#include "shellgate/observability/global.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace {

namespace sec = shellgate::security;
namespace hooks = shellgate::hooks;

std::string bash_request(const std::string &command, const std::string &project) {
  return R"({"tool_name":"Bash","tool_input":{"command":")" + command +
         R"("},"context":{"project_dir":")" + project + R"("}})";
}

// Runs the CLI with `--config <path>` in front of `args`.
int run_with_config(const std::string &config_path, const std::vector<std::string> &args) {
  std::vector<std::string> storage = {"shellgate", "--config", config_path};
  storage.insert(storage.end(), args.begin(), args.end());
  std::vector<char *> argv;
  argv.reserve(storage.size());
  for (auto &arg : storage) {
    argv.push_back(arg.data());
  }
  return shellgate::cli::run_cli(static_cast<int>(argv.size()), argv.data());
}

struct CliGuard {
  shellgate::testing::EnvGuard audit_db{"SHELLGATE_AUDIT_DB", std::nullopt};
  shellgate::testing::EnvGuard backend{"SHELLGATE_OBSERVABILITY", std::nullopt};
  shellgate::testing::EnvGuard temp_root{"SHELLGATE_TEMP_ROOT", std::nullopt};

  ~CliGuard() {
    shellgate::config::clear_config_path_override();
    shellgate::observability::set_global_observer(nullptr);
  }
};

void write_config(const std::string &path, const shellgate::config::Config &config) {
  shellgate::config::set_config_path_override(path);
  const auto saved = shellgate::config::save_config(config);
  shellgate::config::clear_config_path_override();
  if (!saved.ok()) {
    throw std::runtime_error("write_config: " + saved.error());
  }
}

} // namespace

void register_hook_integration_tests(std::vector<shellgate::tests::TestCase> &tests) {
  using shellgate::tests::require;
  using shellgate::tests::require_contains;
  using shellgate::testing::TempWorkspace;
  using shellgate::testing::describe;

  tests.push_back({"integration_hook_json_bash_round_trip", [] {
                     TempWorkspace ws;
                     ws.create_file("src/main.cpp", "int main() {}");
                     const sec::BashSecurityHook bash_hook;
                     const sec::FileToolHook file_hook;

                     auto allowed = hooks::handle_hook_json(
                         bash_request("ls src && cat src/main.cpp | grep main", ws.str()),
                         &bash_hook, &file_hook);
                     require(allowed.request.has_value(), "request parsed");
                     require(allowed.decision.allowed, describe(allowed.decision));
                     require(allowed.response == "{}", allowed.response);

                     auto unknown = hooks::handle_hook_json(
                         bash_request("echo $(wget http://example.com)", ws.str()), &bash_hook,
                         &file_hook);
                     require(!unknown.decision.allowed, "substitution command blocked");
                     require(unknown.decision.kind == sec::BlockKind::UnknownCommand,
                             describe(unknown.decision));
                     require_contains(unknown.response, "\"decision\":\"block\"", "response");
                     require_contains(unknown.response, "wget", "reason names the command");

                     auto escape =
                         hooks::handle_hook_json(bash_request("ls /etc", ws.str()), &bash_hook,
                                                 &file_hook);
                     require(!escape.decision.allowed, "path outside project blocked");
                     require(escape.decision.kind == sec::BlockKind::PathEscape,
                             describe(escape.decision));
                   }});

  tests.push_back({"integration_hook_json_file_tools", [] {
                     TempWorkspace ws;
                     ws.create_file("notes.txt", "hello");
                     const sec::BashSecurityHook bash_hook;
                     const sec::FileToolHook file_hook;

                     const std::string inside =
                         R"({"tool_name":"Read","tool_input":{"file_path":")" + ws.str() +
                         R"(/notes.txt"},"context":{"project_dir":")" + ws.str() + R"("}})";
                     auto read = hooks::handle_hook_json(inside, &bash_hook, &file_hook);
                     require(read.decision.allowed, describe(read.decision));

                     const std::string outside =
                         R"({"tool_name":"Write","tool_input":{"file_path":"/etc/shellgate.conf"},)"
                         R"("context":{"project_dir":")" +
                         ws.str() + R"("}})";
                     auto write = hooks::handle_hook_json(outside, &bash_hook, &file_hook);
                     require(!write.decision.allowed, "write outside project blocked");
                     require(write.decision.kind == sec::BlockKind::PathEscape,
                             describe(write.decision));

                     const std::string other =
                         R"({"tool_name":"WebFetch","tool_input":{"url":"https://x"}})";
                     require(hooks::handle_hook_json(other, &bash_hook, &file_hook).response ==
                                 "{}",
                             "unhandled tool passes");
                   }});

  tests.push_back({"integration_hook_json_fallback_project", [] {
                     TempWorkspace ws;
                     const sec::BashSecurityHook bash_hook;
                     const std::string json =
                         R"({"tool_name":"Bash","tool_input":{"command":"ls /usr"}})";

                     auto unconfined = hooks::handle_hook_json(json, &bash_hook);
                     require(unconfined.decision.allowed, "no project means no confinement");

                     auto confined = hooks::handle_hook_json(json, &bash_hook, nullptr, ws.str());
                     require(!confined.decision.allowed, "fallback project confines paths");
                     require(confined.decision.kind == sec::BlockKind::PathEscape,
                             describe(confined.decision));
                   }});

  tests.push_back({"integration_acceptance_scenarios", [] {
                     TempWorkspace ws;
                     ws.create_file("old.txt", "stale");
                     ws.create_file("a.txt", "a");
                     ws.create_file("build.sh", "#!/bin/sh\n");
                     const sec::BashSecurityHook hook;
                     const auto evaluate = [&](const std::string &command) {
                       return hook.evaluate_command(command, ws.str());
                     };

                     for (const std::string command :
                          {"rm old.txt", "chmod +x build.sh", "kill -TERM 5000",
                           "cp ./a.txt ./b.txt", "echo hi"}) {
                       const auto decision = evaluate(command);
                       require(decision.allowed, command + ": " + describe(decision));
                     }
                     for (const std::string command :
                          {"rm -rf /*", "chmod -R +x .", "chmod 777 build.sh", "kill -9 1",
                           "kill -9 50", "cp ~/.ssh/id_rsa ./key"}) {
                       const auto decision = evaluate(command);
                       require(!decision.allowed, command + " should block");
                     }

                     const auto chained = evaluate("echo hi && unknown_cmd");
                     require(chained.kind == sec::BlockKind::UnknownCommand, describe(chained));
                     require_contains(chained.reason, "unknown_cmd", "later segment named");
                   }});

  tests.push_back({"integration_cli_check_exit_codes", [] {
                     CliGuard guard;
                     TempWorkspace ws;
                     const std::string config_path = ws.str() + "/shellgate.toml";
                     write_config(config_path, shellgate::testing::quiet_config());

                     require(run_with_config(config_path, {"check", "--", "ls", "-la"}) == 0,
                             "ls allowed");
                     require(run_with_config(config_path, {"check", "--", "wget", "x"}) == 2,
                             "wget blocked");
                     require(run_with_config(config_path,
                                             {"check", "--project", ws.str(), "--", "ls", "/etc"}) ==
                                 2,
                             "path escape blocked");
                     require(run_with_config(config_path, {"check"}) == 1, "usage error");
                     require(run_with_config(config_path, {"config", "validate"}) == 0,
                             "saved config validates");
                     require(run_with_config(config_path, {"bogus"}) == 1, "unknown subcommand");
                   }});

  tests.push_back({"integration_cli_broken_config_is_an_error", [] {
                     CliGuard guard;
                     TempWorkspace ws;
                     ws.create_file("shellgate.toml", "[policy]\nmax_nesting_depth = 0\n");
                     require(run_with_config(ws.str() + "/shellgate.toml",
                                             {"check", "--", "ls"}) == 1,
                             "invalid config refuses to evaluate");
                   }});

  tests.push_back({"integration_cli_audit_reads_journal", [] {
                     CliGuard guard;
                     TempWorkspace ws;
                     auto config = shellgate::testing::quiet_config();
                     config.audit.enabled = true;
                     config.audit.database = ws.str() + "/audit/decisions.db";
                     const std::string config_path = ws.str() + "/shellgate.toml";
                     write_config(config_path, config);

                     {
                       auto journal =
                           shellgate::audit::DecisionJournal::open(config.audit.database);
                       require(journal.ok(), journal.ok() ? "" : journal.error());
                       const sec::BashSecurityHook hook;
                       const auto decision = hook.evaluate_command("wget x");
                       require(journal.value()
                                   ->record("Bash", "wget x", ws.str(), decision, "fp")
                                   .ok(),
                               "record");
                     }

                     require(run_with_config(config_path, {"audit", "--stats"}) == 0, "stats");
                     require(run_with_config(config_path, {"audit", "--limit", "5"}) == 0,
                             "recent");
                     require(run_with_config(config_path, {"audit", "--limit", "many"}) == 1,
                             "bad limit");
                   }});
}
