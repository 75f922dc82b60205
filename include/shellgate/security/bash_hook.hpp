#pragma once

#include "shellgate/security/decision.hpp"
#include "shellgate/security/hook_request.hpp"
#include "shellgate/security/policy.hpp"
#include "shellgate/security/validator.hpp"

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace shellgate::security {

/// Pre-execution gate for shell tool calls. Runs, in order: privilege scan,
/// parse, allowlist, per-command validation, then path confinement when a
/// project root is known. The first failing stage decides.
class BashSecurityHook {
public:
  explicit BashSecurityHook(PolicyPtr policy = default_policy(),
                            std::vector<std::string> shell_tools = {"Bash"});

  [[nodiscard]] bool handles(const std::string &tool_name) const;

  /// Exactly one decision per call; never throws.
  [[nodiscard]] Decision evaluate(const HookRequest &request) const;

  [[nodiscard]] Decision
  evaluate_command(const std::string &command,
                   const std::optional<std::string> &project_dir = std::nullopt) const;

  [[nodiscard]] const CommandPolicy &policy() const { return *policy_; }
  [[nodiscard]] const ValidatorRegistry &validators() const { return validators_; }

private:
  Decision run_stages(const std::string &command,
                      const std::optional<std::string> &project_dir) const;

  PolicyPtr policy_;
  ValidatorRegistry validators_;
  std::unordered_set<std::string> shell_tools_;
};

} // namespace shellgate::security
