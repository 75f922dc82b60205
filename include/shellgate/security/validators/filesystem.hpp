#pragma once

#include "shellgate/security/validator.hpp"

namespace shellgate::security::validators {

// chmod: only `[ugoa]*+x` on explicit files, no flags.
class PermissionChangeValidator final : public ICommandValidator {
public:
  [[nodiscard]] std::string_view name() const override { return "permission-change"; }
  [[nodiscard]] std::vector<std::string> commands() const override { return {"chmod"}; }
  [[nodiscard]] common::Status
  validate(const shell::CommandInvocation &invocation) const override;
};

// rm: explicit targets only; no system roots, no wildcards when recursive.
class RecursiveDeleteValidator final : public ICommandValidator {
public:
  [[nodiscard]] std::string_view name() const override { return "recursive-delete"; }
  [[nodiscard]] std::vector<std::string> commands() const override { return {"rm"}; }
  [[nodiscard]] common::Status
  validate(const shell::CommandInvocation &invocation) const override;
};

class DirectoryRemovalValidator final : public ICommandValidator {
public:
  [[nodiscard]] std::string_view name() const override { return "directory-removal"; }
  [[nodiscard]] std::vector<std::string> commands() const override { return {"rmdir"}; }
  [[nodiscard]] common::Status
  validate(const shell::CommandInvocation &invocation) const override;
};

[[nodiscard]] bool is_executable_mode(const std::string &mode);

} // namespace shellgate::security::validators
