#pragma once

#include "shellgate/security/validator.hpp"

#include <string>
#include <unordered_set>
#include <vector>

namespace shellgate::security::validators {

// pkill: the target process must be a development server.
class TerminateByNameValidator final : public ICommandValidator {
public:
  explicit TerminateByNameValidator(std::vector<std::string> allowed_processes);

  [[nodiscard]] std::string_view name() const override { return "terminate-by-name"; }
  [[nodiscard]] std::vector<std::string> commands() const override { return {"pkill"}; }
  [[nodiscard]] common::Status
  validate(const shell::CommandInvocation &invocation) const override;

private:
  std::vector<std::string> allowed_processes_;
};

// kill: common signals only, never init, process groups or low PIDs.
class SignalSendValidator final : public ICommandValidator {
public:
  [[nodiscard]] std::string_view name() const override { return "signal-send"; }
  [[nodiscard]] std::vector<std::string> commands() const override { return {"kill"}; }
  [[nodiscard]] common::Status
  validate(const shell::CommandInvocation &invocation) const override;
};

[[nodiscard]] bool is_allowed_signal(const std::string &signal);

} // namespace shellgate::security::validators
