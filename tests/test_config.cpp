#include "test_framework.hpp"

#include "shellgate/config/config.hpp"
#include "shellgate/security/policy.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <algorithm>
#include <fstream>

namespace {

bool contains(const std::vector<std::string> &values, const std::string &value) {
  return std::find(values.begin(), values.end(), value) != values.end();
}

// Clears the process-wide override when a test finishes.
struct OverrideGuard {
  ~OverrideGuard() { shellgate::config::clear_config_path_override(); }
};

} // namespace

void register_config_tests(std::vector<shellgate::tests::TestCase> &tests) {
  using shellgate::tests::require;
  namespace cfg = shellgate::config;
  namespace sec = shellgate::security;
  using shellgate::testing::EnvGuard;
  using shellgate::testing::TempWorkspace;

  tests.push_back({"config_defaults_are_valid", [] {
                     cfg::Config config;
                     auto validated = cfg::validate_config(config);
                     require(validated.ok(), validated.ok() ? "" : validated.error());
                     require(validated.value().empty(), "defaults produce no warnings");
                     require(contains(config.policy.allowed_commands, "ls"), "ls allowed");
                     require(!contains(config.policy.allowed_commands, "cd"), "cd not allowed");
                     require(contains(config.policy.privileged_commands, "sudo"), "sudo");
                     require(config.policy.temp_root == "/tmp", "temp root");
                   }});

  tests.push_back({"config_parse_overrides_lists_and_appends", [] {
                     auto parsed = cfg::parse_config(R"(
[policy]
allowed_commands = ["ls", "cat", "rm"]
additional_allowed_commands = ["make", "ls"]
extra_validation_commands = ["rm"]
temp_root = "/var/tmp"
additional_read_dirs = ["/usr/share/doc", "~/reference"]
additional_write_dirs = [
  "/srv/build-output",
]
max_nesting_depth = 4

[hook]
shell_tools = ["Bash", "Shell"]

[observability]
backend = "none"
log_level = "debug"

[audit]
enabled = true
database = "/tmp/shellgate-audit.db"
)");
                     require(parsed.ok(), parsed.ok() ? "" : parsed.error());
                     const auto &config = parsed.value();
                     require(config.policy.allowed_commands.size() == 4,
                             "ls, cat, rm plus make without duplicates");
                     require(contains(config.policy.allowed_commands, "make"), "appended");
                     require(config.policy.extra_validation_commands.size() == 1, "replaced");
                     require(config.policy.temp_root == "/var/tmp", "temp root");
                     require(config.policy.additional_read_dirs ==
                                 std::vector<std::string>{"/usr/share/doc", "~/reference"},
                             "read dirs");
                     require(config.policy.additional_write_dirs ==
                                 std::vector<std::string>{"/srv/build-output"},
                             "write dirs");
                     require(config.policy.max_nesting_depth == 4, "depth");
                     require(config.hook.shell_tools.size() == 2, "shell tools");
                     require(config.observability.backend == "none", "backend");
                     require(config.observability.log_level == "debug", "log level");
                     require(config.audit.enabled, "audit enabled");
                     require(!config.policy.sensitive_paths.empty(), "untouched list kept");
                   }});

  tests.push_back({"config_parse_rejects_bad_depth", [] {
                     require(!cfg::parse_config("[policy]\nmax_nesting_depth = 0\n").ok(),
                             "zero depth rejected");
                     require(!cfg::parse_config("[policy]\nmax_nesting_depth = \"x\"\n").ok(),
                             "non-integer depth rejected");
                   }});

  tests.push_back({"config_validate_failures", [] {
                     cfg::Config empty;
                     empty.policy.allowed_commands.clear();
                     require(!cfg::validate_config(empty).ok(), "empty allowlist");

                     cfg::Config slash;
                     slash.policy.allowed_commands.push_back("/bin/ls");
                     require(!cfg::validate_config(slash).ok(), "path in allowlist");

                     cfg::Config relative_temp;
                     relative_temp.policy.temp_root = "tmp";
                     require(!cfg::validate_config(relative_temp).ok(), "relative temp root");

                     cfg::Config root_temp;
                     root_temp.policy.temp_root = "/";
                     require(!cfg::validate_config(root_temp).ok(), "root temp root");

                     cfg::Config relative_dir;
                     relative_dir.policy.additional_read_dirs = {"docs"};
                     require(!cfg::validate_config(relative_dir).ok(), "relative read dir");

                     cfg::Config root_dir;
                     root_dir.policy.additional_write_dirs = {"/"};
                     require(!cfg::validate_config(root_dir).ok(), "root write dir");

                     cfg::Config backend;
                     backend.observability.backend = "log,prometheus";
                     require(!cfg::validate_config(backend).ok(), "unknown backend");

                     cfg::Config level;
                     level.observability.log_level = "loud";
                     require(!cfg::validate_config(level).ok(), "unknown log level");

                     cfg::Config audit;
                     audit.audit.enabled = true;
                     audit.audit.database = " ";
                     require(!cfg::validate_config(audit).ok(), "audit without database");
                   }});

  tests.push_back({"config_validate_warnings", [] {
                     cfg::Config config;
                     config.policy.extra_validation_commands.push_back("shred");
                     config.policy.allowed_commands.push_back("sudo");
                     config.hook.shell_tools.clear();
                     auto validated = cfg::validate_config(config);
                     require(validated.ok(), "warnings do not fail validation");
                     require(validated.value().size() == 3,
                             "three warnings, got " + std::to_string(validated.value().size()));
                   }});

  tests.push_back({"config_save_and_load_round_trip", [] {
                     TempWorkspace ws;
                     OverrideGuard guard;
                     EnvGuard observability("SHELLGATE_OBSERVABILITY", std::nullopt);
                     EnvGuard audit_db("SHELLGATE_AUDIT_DB", std::nullopt);
                     EnvGuard temp_root("SHELLGATE_TEMP_ROOT", std::nullopt);
                     cfg::set_config_path_override(ws.path() / "nested" / "shellgate.toml");
                     require(!cfg::config_exists(), "nothing written yet");

                     cfg::Config config;
                     config.policy.allowed_commands = {"ls", "it's \"quoted\""};
                     config.policy.temp_root = "/var/tmp";
                     config.policy.additional_write_dirs = {"/srv/out"};
                     config.audit.enabled = true;
                     require(cfg::save_config(config).ok(), "save");
                     require(cfg::config_exists(), "file exists after save");

                     auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.ok() ? "" : loaded.error());
                     require(loaded.value().policy.allowed_commands ==
                                 config.policy.allowed_commands,
                             "allowlist survives quoting");
                     require(loaded.value().policy.temp_root == "/var/tmp", "temp root");
                     require(loaded.value().policy.additional_read_dirs.empty(), "empty list");
                     require(loaded.value().policy.additional_write_dirs ==
                                 std::vector<std::string>{"/srv/out"},
                             "write dirs");
                     require(loaded.value().audit.enabled, "audit flag");
                   }});

  tests.push_back({"config_missing_file_uses_defaults", [] {
                     TempWorkspace ws;
                     OverrideGuard guard;
                     EnvGuard temp_root("SHELLGATE_TEMP_ROOT", std::nullopt);
                     cfg::set_config_path_override(ws.path() / "absent.toml");
                     auto loaded = cfg::load_config();
                     require(loaded.ok(), "missing file is not an error");
                     require(loaded.value().policy.allowed_commands ==
                                 cfg::PolicyConfig{}.allowed_commands,
                             "default allowlist");
                   }});

  tests.push_back({"config_path_from_environment", [] {
                     TempWorkspace ws;
                     OverrideGuard guard;
                     cfg::clear_config_path_override();
                     EnvGuard env("SHELLGATE_CONFIG_PATH", (ws.path() / "env.toml").string());
                     auto path = cfg::config_path();
                     require(path.ok() && path.value() == ws.path() / "env.toml",
                             "env var selects config file");
                   }});

  tests.push_back({"config_env_overrides", [] {
                     EnvGuard observability("SHELLGATE_OBSERVABILITY", "none");
                     EnvGuard audit_db("SHELLGATE_AUDIT_DB", "/tmp/journal.db");
                     EnvGuard temp_root("SHELLGATE_TEMP_ROOT", "/var/tmp");
                     cfg::Config config;
                     cfg::apply_env_overrides(config);
                     require(config.observability.backend == "none", "backend override");
                     require(config.audit.enabled && config.audit.database == "/tmp/journal.db",
                             "audit db override enables the journal");
                     require(config.policy.temp_root == "/var/tmp", "temp root override");
                   }});

  tests.push_back({"config_policy_from_config", [] {
                     cfg::PolicyConfig policy_config;
                     policy_config.allowed_commands = {"ls", "make"};
                     auto policy = sec::CommandPolicy::from_config(policy_config);
                     require(policy.ok(), "valid policy");
                     require(policy.value().is_command_allowed("make"), "make allowed");
                     require(!policy.value().is_command_allowed("cat"), "cat dropped");

                     policy_config.temp_root = "relative";
                     require(!sec::CommandPolicy::from_config(policy_config).ok(),
                             "relative temp root rejected");

                     cfg::PolicyConfig dirs;
                     dirs.additional_read_dirs = {"/usr/share/doc"};
                     auto with_dirs = sec::CommandPolicy::from_config(dirs);
                     require(with_dirs.ok() && with_dirs.value().additional_read_dirs().size() == 1,
                             "read dirs carried");
                     require(with_dirs.value().fingerprint() != sec::CommandPolicy().fingerprint(),
                             "dirs change the fingerprint");
                     dirs.additional_write_dirs = {"out"};
                     require(!sec::CommandPolicy::from_config(dirs).ok(),
                             "relative write dir rejected");
                   }});

  tests.push_back({"config_policy_fingerprint_tracks_content", [] {
                     const sec::CommandPolicy defaults;
                     auto same = sec::CommandPolicy::from_config(cfg::PolicyConfig{});
                     require(same.ok(), "default config");
                     require(defaults.fingerprint() == same.value().fingerprint(),
                             "same content, same fingerprint");
                     require(defaults.fingerprint().size() == 64, "sha256 hex");

                     cfg::PolicyConfig reordered;
                     std::reverse(reordered.allowed_commands.begin(),
                                  reordered.allowed_commands.end());
                     auto reversed = sec::CommandPolicy::from_config(reordered);
                     require(reversed.value().fingerprint() == defaults.fingerprint(),
                             "order does not matter");

                     cfg::PolicyConfig changed;
                     changed.allowed_commands.push_back("make");
                     auto extended = sec::CommandPolicy::from_config(changed);
                     require(extended.value().fingerprint() != defaults.fingerprint(),
                             "content change changes fingerprint");
                   }});

  tests.push_back({"config_policy_privileged_word_boundaries", [] {
                     const sec::CommandPolicy policy;
                     require(policy.find_privileged("sudo rm -rf /").value_or("") == "sudo",
                             "leading sudo");
                     require(policy.find_privileged("echo ok && sudo ls").has_value(),
                             "chained sudo");
                     require(policy.find_privileged("bash -c 'sudo ls'").has_value(),
                             "quoted sudo");
                     require(!policy.find_privileged("echo pseudocode").has_value(),
                             "substring is not a match");
                     require(!policy.find_privileged("cat sudo_notes.txt").has_value(),
                             "underscore continues the word");
                   }});
}
