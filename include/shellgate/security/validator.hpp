#pragma once

#include "shellgate/common/result.hpp"
#include "shellgate/shell/command_extractor.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace shellgate::security {

class CommandPolicy;

/// Structural check for one family of commands. `validate` sees a single
/// invocation (one pipe stage) and fails with the block reason.
class ICommandValidator {
public:
  virtual ~ICommandValidator() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual std::vector<std::string> commands() const = 0;
  [[nodiscard]] virtual common::Status
  validate(const shell::CommandInvocation &invocation) const = 0;
};

class ValidatorRegistry {
public:
  ValidatorRegistry() = default;

  void register_validator(std::unique_ptr<ICommandValidator> validator);
  [[nodiscard]] const ICommandValidator *get_validator(const std::string &command) const;
  [[nodiscard]] std::vector<std::string> registered_commands() const;

  [[nodiscard]] static ValidatorRegistry create_default(const CommandPolicy &policy);

private:
  std::vector<std::unique_ptr<ICommandValidator>> validators_;
  std::unordered_map<std::string, ICommandValidator *> by_command_;
};

} // namespace shellgate::security
