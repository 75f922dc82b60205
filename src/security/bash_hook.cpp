#include "shellgate/security/bash_hook.hpp"

#include "shellgate/common/fs.hpp"
#include "shellgate/observability/global.hpp"
#include "shellgate/security/path_sandbox.hpp"
#include "shellgate/shell/analyzer.hpp"

#include <chrono>
#include <exception>

namespace shellgate::security {

namespace {

bool is_blank(const std::string &command) { return common::trim(command).empty(); }

} // namespace

BashSecurityHook::BashSecurityHook(PolicyPtr policy, std::vector<std::string> shell_tools)
    : policy_(policy != nullptr ? std::move(policy) : default_policy()),
      validators_(ValidatorRegistry::create_default(*policy_)),
      shell_tools_(shell_tools.begin(), shell_tools.end()) {}

bool BashSecurityHook::handles(const std::string &tool_name) const {
  return shell_tools_.contains(tool_name);
}

Decision BashSecurityHook::evaluate(const HookRequest &request) const {
  if (!handles(request.tool_name)) {
    return Decision::allow();
  }
  if (!request.has_input("command")) {
    return Decision::allow();
  }
  const auto command = request.input_string("command");
  if (!command.has_value()) {
    return Decision::block(BlockKind::ParseError, Stage::Parse,
                           "Could not parse command for security validation: command is not "
                           "a string");
  }

  const auto started = std::chrono::steady_clock::now();
  Decision decision = evaluate_command(*command, request.project_dir);
  const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - started);

  observability::record_decision(request.tool_name, *command, decision.allowed,
                                 block_kind_name(decision.kind), stage_name(decision.stage),
                                 decision.reason);
  observability::record_evaluation_latency(elapsed);
  return decision;
}

Decision BashSecurityHook::evaluate_command(const std::string &command,
                                            const std::optional<std::string> &project_dir) const {
  try {
    return run_stages(command, project_dir);
  } catch (const std::exception &e) {
    observability::record_error("bash_hook", e.what());
    return Decision::block(BlockKind::ParseError, Stage::Parse,
                           std::string("Command could not be validated: ") + e.what());
  }
}

Decision BashSecurityHook::run_stages(const std::string &command,
                                      const std::optional<std::string> &project_dir) const {
  if (is_blank(command)) {
    return Decision::allow();
  }

  if (const auto privileged = policy_->find_privileged(command); privileged.has_value()) {
    return Decision::block(BlockKind::PolicyViolation, Stage::Parse,
                           "Privileged command '" + *privileged + "' is not allowed.");
  }

  const auto analysis = shell::analyze(command, policy_->analyzer_options());
  if (!analysis.ok()) {
    return Decision::block(BlockKind::ParseError, Stage::Parse,
                           "Could not parse command for security validation: " +
                               analysis.error());
  }
  const auto &invocations = analysis.value().commands;
  if (invocations.empty()) {
    return Decision::block(BlockKind::ParseError, Stage::Extract,
                           "Could not parse command for security validation: " + command);
  }
  observability::record_commands_inspected(invocations.size());

  for (const auto &invocation : invocations) {
    if (!policy_->is_command_allowed(invocation.name)) {
      return Decision::block(BlockKind::UnknownCommand, Stage::Allowlist,
                             "Command '" + invocation.name +
                                 "' is not in the allowed commands list.");
    }
  }

  for (const auto &invocation : invocations) {
    if (!policy_->needs_extra_validation(invocation.name)) {
      continue;
    }
    const auto *validator = validators_.get_validator(invocation.name);
    if (validator == nullptr) {
      return Decision::block(BlockKind::PolicyViolation, Stage::ExtraValidation,
                             "Command '" + invocation.name +
                                 "' requires validation but no validator is registered.");
    }
    if (const auto status = validator->validate(invocation); !status.ok()) {
      return Decision::block(BlockKind::PolicyViolation, Stage::ExtraValidation, status.error());
    }
  }

  if (!project_dir.has_value()) {
    return Decision::allow();
  }
  auto sandbox = PathSandbox::create(*project_dir, *policy_);
  if (!sandbox.ok()) {
    return Decision::block(BlockKind::ResolutionError, Stage::PathCheck,
                           "Cannot validate paths: " + sandbox.error());
  }
  for (const auto &invocation : invocations) {
    Decision decision = sandbox.value().check_invocation(invocation, command);
    if (!decision.allowed) {
      return decision;
    }
  }
  return Decision::allow();
}

} // namespace shellgate::security
