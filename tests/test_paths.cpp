#include "test_framework.hpp"

#include "shellgate/security/path_extractor.hpp"
#include "shellgate/security/path_sandbox.hpp"
#include "shellgate/shell/analyzer.hpp"
#include "tests/helpers/test_helpers.hpp"

namespace {

namespace sec = shellgate::security;

shellgate::shell::CommandInvocation invocation_of(const std::string &command) {
  auto analysis = shellgate::shell::analyze(command);
  shellgate::tests::require(analysis.ok() && !analysis.value().commands.empty(),
                            "no invocation for: " + command);
  return analysis.value().commands.front();
}

std::vector<sec::PathCandidate> candidates_of(const std::string &command) {
  return sec::extract_path_candidates(invocation_of(command));
}

std::string summarize(const std::vector<sec::PathCandidate> &candidates) {
  std::string out;
  for (const auto &candidate : candidates) {
    if (!out.empty()) {
      out += ' ';
    }
    out += std::string(sec::path_role_name(candidate.role)) + ":" + candidate.path;
  }
  return out;
}

void expect_candidates(const std::string &command, const std::string &expected) {
  const std::string actual = summarize(candidates_of(command));
  shellgate::tests::require(actual == expected, "paths of '" + command + "' were [" + actual +
                                                    "], expected [" + expected + "]");
}

sec::PathSandbox sandbox_for(const shellgate::testing::TempWorkspace &ws,
                             const sec::CommandPolicy &policy) {
  auto sandbox = sec::PathSandbox::create(ws.str(), policy);
  shellgate::tests::require(sandbox.ok(), sandbox.ok() ? "" : sandbox.error());
  return sandbox.value();
}

sec::Decision check_command(const sec::PathSandbox &sandbox, const std::string &command) {
  return sandbox.check_invocation(invocation_of(command), command);
}

bool mentions(const std::string &text, const std::string &needle) {
  return text.find(needle) != std::string::npos;
}

} // namespace

void register_path_tests(std::vector<shellgate::tests::TestCase> &tests) {
  using shellgate::tests::require;
  using shellgate::testing::EnvGuard;
  using shellgate::testing::TempWorkspace;
  using shellgate::testing::describe;
  using shellgate::testing::policy_with_temp_root;

  tests.push_back({"paths_file_operands", [] {
                     expect_candidates("cat a.txt b.txt", "operand:a.txt operand:b.txt");
                     expect_candidates("ls -la src -- -odd", "operand:src operand:-odd");
                     expect_candidates("tail -f logs/app.log", "operand:logs/app.log");
                     expect_candidates("pwd", "");
                     expect_candidates("echo /etc/passwd", "operand:/etc/passwd");
                   }});

  tests.push_back({"paths_pattern_commands_skip_first_operand", [] {
                     expect_candidates("grep -r pattern src", "operand:src");
                     expect_candidates("grep -e pattern file", "operand:file");
                     expect_candidates("grep -ve skip src", "operand:src");
                     expect_candidates("grep --regexp=x file", "operand:file");
                     expect_candidates("sed -i 's/a/b/' file.txt", "operand:file.txt");
                     expect_candidates("awk '{print $1}' data.csv", "operand:data.csv");
                     expect_candidates("awk -f prog.awk data.csv",
                                       "operand:prog.awk operand:data.csv");
                   }});

  tests.push_back({"paths_file_flag_values", [] {
                     expect_candidates("sort --output=/etc/cron.d/x a.txt",
                                       "output:/etc/cron.d/x operand:a.txt");
                     expect_candidates("sort -o/etc/x a.txt", "output:/etc/x operand:a.txt");
                     expect_candidates("sort -uo out.txt in.txt", "output:out.txt operand:in.txt");
                     expect_candidates("grep --file=/etc/shadow a.txt",
                                       "operand:/etc/shadow operand:a.txt");
                     expect_candidates("grep -rf pats.txt src", "operand:pats.txt operand:src");
                     expect_candidates("diff --to-file=/etc/hosts a b",
                                       "operand:/etc/hosts operand:a operand:b");
                     expect_candidates("ln -st /usr/local/bin tool",
                                       "destination:/usr/local/bin operand:tool");
                     expect_candidates("cat --unknown=/etc/shadow", "operand:/etc/shadow");
                     expect_candidates("ls --color=auto src", "operand:src");
                     expect_candidates("sed --expression=/x/d f.txt", "operand:f.txt");
                   }});

  tests.push_back({"paths_absolute_arguments_of_other_commands", [] {
                     expect_candidates("cut -c1- /etc/shadow", "operand:/etc/shadow");
                     expect_candidates("jq . /root/.aws/credentials",
                                       "operand:/root/.aws/credentials");
                     expect_candidates("jq . data.json", "");
                     expect_candidates("echo ~/notes", "operand:~/notes");
                     expect_candidates("printf x --path=/srv/x", "operand:/srv/x");
                     expect_candidates("python3 /opt/run.py /etc/hosts",
                                       "script:/opt/run.py operand:/etc/hosts");
                     expect_candidates("bash -c '/bin/ls'", "");
                   }});

  tests.push_back({"paths_access_follows_the_command", [] {
                     const auto access_of = [](const std::string &command) {
                       std::string out;
                       for (const auto &candidate : candidates_of(command)) {
                         out += candidate.access == sec::FileAccess::Read ? 'r' : 'w';
                       }
                       return out;
                     };
                     require(access_of("cat a b") == "rr", "cat reads");
                     require(access_of("rm a") == "w", "rm writes");
                     require(access_of("cp a b") == "rw", "cp reads its source");
                     require(access_of("mv a b") == "ww", "mv removes its source");
                     require(access_of("tr a b < in.txt > out.txt") == "rw", "redirections");
                     require(access_of("python3 ./run.py") == "r", "script");
                     require(access_of("sort -o out.txt in.txt") == "ww", "sort output");
                     require(access_of("jq . /srv/data.json") == "w", "unknown commands write");
                   }});

  tests.push_back({"paths_copy_and_move_roles", [] {
                     expect_candidates("cp a b dest/", "source:a source:b destination:dest/");
                     expect_candidates("cp -r src", "source:src");
                     expect_candidates("cp -t out a b", "destination:out source:a source:b");
                     expect_candidates("mv --target-directory=out a", "destination:out source:a");
                     expect_candidates("mv -- -a b", "source:-a destination:b");
                   }});

  tests.push_back({"paths_output_flags", [] {
                     expect_candidates("curl -o out.bin https://example.com/x",
                                       "output:out.bin");
                     expect_candidates("curl --output=file https://example.com", "output:file");
                     expect_candidates("curl https://example.com", "");
                     expect_candidates("unzip pkg.zip -d vendor", "output:vendor");
                     expect_candidates("git clone https://example.com/r.git repo-dir",
                                       "output:repo-dir");
                     expect_candidates("git clone https://example.com/r.git", "");
                     expect_candidates("git -C ../other status", "output:../other");
                     expect_candidates("git --work-tree=/srv/site checkout -f",
                                       "output:/srv/site");
                   }});

  tests.push_back({"paths_interpreter_scripts", [] {
                     expect_candidates("python3 scripts/run.py --flag", "script:scripts/run.py");
                     expect_candidates("node ./server.js", "script:./server.js");
                     expect_candidates("python app.py", "");
                     expect_candidates("python -m pytest tests/", "");
                     expect_candidates("node -e 'console.log(1)'", "");
                     expect_candidates("bash -c 'cat /etc/passwd'", "");
                     expect_candidates("bash -ec 'ls'", "");
                     expect_candidates("bash ~/bin/tool.sh", "script:~/bin/tool.sh");
                   }});

  tests.push_back({"paths_redirections", [] {
                     expect_candidates("echo hi > out.txt 2>&1", "redirect:out.txt");
                     expect_candidates("tr a b < in.txt >> out.txt",
                                       "redirect:in.txt redirect:out.txt");
                     expect_candidates("cmd 2>&- 3<&0", "");
                     expect_candidates("cat <<EOF\nbody\nEOF", "");
                     expect_candidates("cat <<< 'inline'", "");
                     expect_candidates("ls &> all.log", "redirect:all.log");
                   }});

  tests.push_back({"paths_expansion_flag", [] {
                     const auto candidates = candidates_of("cat $HOME/x plain");
                     require(candidates.size() == 2, "two operands");
                     require(candidates[0].has_expansion && !candidates[1].has_expansion,
                             "expansion flag follows the token");
                     require(candidates[0].command == "cat", "command recorded");
                   }});

  tests.push_back({"paths_sandbox_create", [] {
                     const sec::CommandPolicy policy;
                     require(!sec::PathSandbox::create("", policy).ok(), "empty");
                     require(!sec::PathSandbox::create("relative/dir", policy).ok(), "relative");
                     require(!sec::PathSandbox::create("/nonexistent-shellgate-project", policy)
                                  .ok(),
                             "missing");
                     TempWorkspace ws;
                     ws.create_file("file.txt", "x");
                     require(!sec::PathSandbox::create((ws.path() / "file.txt").string(), policy)
                                  .ok(),
                             "file is not a directory");
                     const auto sandbox = sandbox_for(ws, policy);
                     require(sandbox.project_root() == ws.path(), "canonical project root");
                     require(sandbox.contains(ws.path()), "root contains itself");
                   }});

  tests.push_back({"paths_sandbox_resolution", [] {
                     TempWorkspace ws;
                     ws.create_dir("real");
                     ws.create_symlink("alias", ws.path() / "real");
                     ws.create_symlink("escape", "/etc");
                     const auto policy = policy_with_temp_root("/nonexistent-shellgate-temp");
                     const auto sandbox = sandbox_for(ws, *policy);

                     require(sandbox.check("src/new_file.cpp").allowed(), "new relative file");
                     require(sandbox.check((ws.path() / "a" / "b").string()).allowed(),
                             "absolute inside");
                     require(sandbox.check("alias/file").allowed(), "symlink inside project");
                     require(sandbox.check("alias/file").resolved ==
                                 ws.path() / "real" / "file",
                             "symlink followed");

                     const auto escaped = sandbox.check("escape/passwd");
                     require(escaped.outcome == sec::PathOutcome::Escapes, "symlink escape");
                     require(escaped.resolved == "/etc/passwd", "resolved through the link");
                     require(sandbox.check("../sibling").outcome == sec::PathOutcome::Escapes,
                             "parent traversal");
                     require(sandbox.check("/etc/passwd").outcome == sec::PathOutcome::Escapes,
                             "absolute outside");
                     require(sandbox.check("a/../../x").outcome == sec::PathOutcome::Escapes,
                             "traversal after a component");
                     require(sandbox.check("./a/../b").allowed(), "traversal that stays inside");
                   }});

  tests.push_back({"paths_sandbox_unresolvable_and_devices", [] {
                     TempWorkspace ws;
                     const sec::CommandPolicy policy;
                     const auto sandbox = sandbox_for(ws, policy);
                     require(sandbox.check("/dev/null").allowed(), "device path");
                     require(sandbox.check("/dev/stderr").allowed(), "stderr");
                     require(sandbox.check("$HOME/x", true).outcome ==
                                 sec::PathOutcome::Unresolvable,
                             "expansion");
                     require(sandbox.check("~other/x").outcome == sec::PathOutcome::Unresolvable,
                             "other user's home");
                     require(sandbox.check("").outcome == sec::PathOutcome::Unresolvable, "empty");
                     {
                       EnvGuard home("HOME", std::nullopt);
                       require(sandbox.check("~/x").outcome == sec::PathOutcome::Unresolvable,
                               "home without HOME");
                     }
                     require(sec::is_device_path("/dev/urandom"), "urandom");
                     require(!sec::is_device_path("/dev/sda"), "disk is not a device path");
                   }});

  tests.push_back({"paths_sandbox_temp_root", [] {
                     TempWorkspace ws;
                     const sec::CommandPolicy policy;
                     const auto sandbox = sandbox_for(ws, policy);
                     require(sandbox.check("/tmp/shellgate-scratch.txt").allowed(),
                             "temp root is writable");
                     require(check_command(sandbox, "echo x > /tmp/out.log").allowed,
                             "redirect into temp root");

                     const auto moved = policy_with_temp_root("/nonexistent-shellgate-temp");
                     const auto strict = sandbox_for(ws, *moved);
                     require(strict.temp_root() == "/nonexistent-shellgate-temp",
                             "unresolvable temp root kept lexically");
                     require(strict.check("/tmp/shellgate-scratch.txt").outcome ==
                                 sec::PathOutcome::Escapes,
                             "old temp root no longer allowed");
                   }});

  tests.push_back({"paths_escape_reason_format", [] {
                     TempWorkspace ws;
                     const sec::CommandPolicy policy;
                     const auto sandbox = sandbox_for(ws, policy);
                     const std::string command = "cat /etc/shellgate-missing.conf";
                     const auto decision = check_command(sandbox, command);
                     require(!decision.allowed, "blocked");
                     require(decision.kind == sec::BlockKind::PathEscape, describe(decision));
                     require(decision.stage == sec::Stage::PathCheck, "path stage");
                     const std::string expected =
                         "Bash command blocked: Path escapes project directory: "
                         "'/etc/shellgate-missing.conf' resolves to '/etc/shellgate-missing.conf' "
                         "which is outside '" +
                         ws.str() + "'. File operation denied for security.\nCommand: " + command;
                     require(decision.reason == expected, "reason was: " + decision.reason);
                   }});

  tests.push_back({"paths_check_invocation_roles", [] {
                     TempWorkspace ws;
                     const sec::CommandPolicy policy;
                     const auto sandbox = sandbox_for(ws, policy);

                     require(check_command(sandbox, "cat src/main.cpp").allowed, "inside");
                     require(check_command(sandbox, "echo hi > /dev/null").allowed, "device");

                     const auto destination = check_command(sandbox, "cp a.txt /etc/evil");
                     require(mentions(destination.reason, "Destination path denied"),
                             describe(destination));

                     const auto source = check_command(sandbox, "mv /etc/hosts ./hosts");
                     require(mentions(source.reason, "mv source Path escapes") &&
                                 mentions(source.reason, "Source path (mv) denied"),
                             describe(source));

                     const auto redirect = check_command(sandbox, "echo hi > /etc/motd");
                     require(redirect.kind == sec::BlockKind::PathEscape, describe(redirect));

                     const auto output = check_command(sandbox, "curl -o /usr/local/bin/x u");
                     require(output.kind == sec::BlockKind::PathEscape, describe(output));

                     const auto script = check_command(sandbox, "python3 /opt/tools/run.py");
                     require(script.kind == sec::BlockKind::PathEscape, describe(script));
                   }});

  tests.push_back({"paths_unverifiable_path_blocks", [] {
                     TempWorkspace ws;
                     const sec::CommandPolicy policy;
                     const auto sandbox = sandbox_for(ws, policy);
                     const auto decision = check_command(sandbox, "cat \"$HOME/.bashrc\"");
                     require(decision.kind == sec::BlockKind::ResolutionError, describe(decision));
                     require(mentions(decision.reason, "Cannot validate path '$HOME/.bashrc'"),
                             decision.reason);
                     const auto braces = check_command(sandbox, "touch {a,b}.txt");
                     require(braces.kind == sec::BlockKind::ResolutionError, describe(braces));
                   }});

  tests.push_back({"paths_dot_globs_are_unresolvable", [] {
                     require(sec::glob_may_match_dot_entries(".*"), ".*");
                     require(sec::glob_may_match_dot_entries("a/.?/b"), ".?");
                     require(sec::glob_may_match_dot_entries("[.]*"), "bracket");
                     require(!sec::glob_may_match_dot_entries("*"), "star skips dot entries");
                     require(!sec::glob_may_match_dot_entries("src/*.py"), "suffix");
                     require(!sec::glob_may_match_dot_entries(".[a-z]*"), "dotfiles only");

                     TempWorkspace ws;
                     const sec::CommandPolicy policy;
                     const auto sandbox = sandbox_for(ws, policy);
                     const auto climb = check_command(sandbox, "cat .*/.*/.*/etc/passwd");
                     require(climb.kind == sec::BlockKind::ResolutionError, describe(climb));
                     require(mentions(climb.reason, "Cannot validate path '.*/.*/.*/etc/passwd'"),
                             climb.reason);
                     require(check_command(sandbox, "ls *.cpp ./src/*.hpp").allowed, "plain globs");
                     require(check_command(sandbox, "cat '.*'/notes").allowed, "quoted");
                   }});

  tests.push_back({"paths_additional_dirs", [] {
                     TempWorkspace ws;
                     TempWorkspace reference("shellgate-test-reference");
                     TempWorkspace output("shellgate-test-output");
                     const auto policy = shellgate::testing::policy_with_extra_dirs(
                         {reference.str()}, {output.str()});
                     const auto sandbox = sandbox_for(ws, *policy);
                     require(sandbox.read_dirs() ==
                                 std::vector<std::filesystem::path>{reference.path()},
                             "read dir canonicalised");
                     require(sandbox.write_dirs().size() == 1, "write dir");

                     const std::string ref = reference.str();
                     const std::string out = output.str();
                     require(sandbox.permits(reference.path(), sec::FileAccess::Read), "read");
                     require(!sandbox.permits(reference.path(), sec::FileAccess::Write), "write");
                     require(sandbox.permits(output.path(), sec::FileAccess::Read), "read out");
                     require(!sandbox.contains(output.path()), "not part of the project");

                     require(check_command(sandbox, "cat " + ref + "/api.md").allowed, "cat");
                     require(check_command(sandbox, "cp " + ref + "/api.md ./api.md").allowed,
                             "copy in");
                     require(check_command(sandbox, "wc -l < " + ref + "/api.md").allowed,
                             "input redirect");
                     const auto touch = check_command(sandbox, "touch " + ref + "/x");
                     require(touch.kind == sec::BlockKind::PathEscape, describe(touch));
                     const auto redirect = check_command(sandbox, "echo hi > " + ref + "/x");
                     require(redirect.kind == sec::BlockKind::PathEscape, describe(redirect));

                     require(check_command(sandbox, "echo hi > " + out + "/x").allowed,
                             "write dir");
                     require(check_command(sandbox, "cp api.md " + out + "/").allowed, "copy out");
                     require(check_command(sandbox, "rm " + out + "/x").allowed, "rm");
                   }});

  tests.push_back({"paths_copy_from_outside_uses_deny_list", [] {
                     TempWorkspace ws;
                     EnvGuard home("HOME", "/nonexistent-home-xyz");
                     const sec::CommandPolicy policy;
                     const auto sandbox = sandbox_for(ws, policy);

                     require(check_command(sandbox, "cp /usr/share/dict/words .").allowed,
                             "non-sensitive outside source is allowed");

                     const auto passwd = check_command(sandbox, "cp /etc/passwd ./p");
                     require(passwd.kind == sec::BlockKind::PathEscape &&
                                 mentions(passwd.reason, "cannot copy from sensitive path"),
                             describe(passwd));

                     const auto ssh_dir = check_command(sandbox, "cp /etc/ssh/sshd_config .");
                     require(mentions(ssh_dir.reason, "sensitive directory '/etc/ssh'"),
                             describe(ssh_dir));

                     const auto key = check_command(sandbox, "cp ~/.ssh/id_rsa ./key");
                     require(mentions(key.reason, "sensitive directory '~/.ssh'"),
                             describe(key));

                     const auto creds = check_command(sandbox, "cp /opt/data/Credentials.json .");
                     require(mentions(creds.reason, "sensitive file pattern"), describe(creds));

                     const auto home_dir = check_command(sandbox, "cp /home/alex/notes.txt .");
                     require(mentions(home_dir.reason, "sensitive directory '/home'"),
                             describe(home_dir));

                     const auto dest = check_command(sandbox, "cp /usr/share/dict/words /etc/");
                     require(mentions(dest.reason, "Destination path"),
                             "destination still checked: " + describe(dest));
                   }});

  tests.push_back({"paths_sensitive_source_inside_project", [] {
                     TempWorkspace ws;
                     ws.create_file(".env", "SECRET=1");
                     const sec::CommandPolicy policy;
                     const auto sandbox = sandbox_for(ws, policy);
                     require(check_command(sandbox, "cp .env .env.backup").allowed,
                             "copies inside the project are not deny-listed");
                   }});
}
