#pragma once

#include "shellgate/security/validator.hpp"

#include <string>
#include <vector>

namespace shellgate::security::validators {

// docker: bind mounts of system roots are refused.
class ContainerRuntimeValidator final : public ICommandValidator {
public:
  explicit ContainerRuntimeValidator(std::vector<std::string> protected_sources);

  [[nodiscard]] std::string_view name() const override { return "container-runtime"; }
  [[nodiscard]] std::vector<std::string> commands() const override { return {"docker"}; }
  [[nodiscard]] common::Status
  validate(const shell::CommandInvocation &invocation) const override;

private:
  [[nodiscard]] common::Status check_host_path(const std::string &host_path) const;

  std::vector<std::string> protected_sources_;
};

// systemctl: read-only operations.
class ServiceManagerValidator final : public ICommandValidator {
public:
  [[nodiscard]] std::string_view name() const override { return "service-manager"; }
  [[nodiscard]] std::vector<std::string> commands() const override { return {"systemctl"}; }
  [[nodiscard]] common::Status
  validate(const shell::CommandInvocation &invocation) const override;
};

// start.sh, restart.sh, stop.sh must be invoked by path, never through PATH lookup.
class LifecycleScriptValidator final : public ICommandValidator {
public:
  [[nodiscard]] std::string_view name() const override { return "lifecycle-script"; }
  [[nodiscard]] std::vector<std::string> commands() const override {
    return {"start.sh", "restart.sh", "stop.sh"};
  }
  [[nodiscard]] common::Status
  validate(const shell::CommandInvocation &invocation) const override;
};

} // namespace shellgate::security::validators
