#include "shellgate/security/validator.hpp"

#include "shellgate/security/policy.hpp"
#include "shellgate/security/validators/filesystem.hpp"
#include "shellgate/security/validators/process.hpp"
#include "shellgate/security/validators/services.hpp"

#include <algorithm>

namespace shellgate::security {

void ValidatorRegistry::register_validator(std::unique_ptr<ICommandValidator> validator) {
  ICommandValidator *raw = validator.get();
  for (const auto &command : raw->commands()) {
    by_command_[command] = raw;
  }
  validators_.push_back(std::move(validator));
}

const ICommandValidator *ValidatorRegistry::get_validator(const std::string &command) const {
  const auto it = by_command_.find(command);
  if (it == by_command_.end()) {
    return nullptr;
  }
  return it->second;
}

std::vector<std::string> ValidatorRegistry::registered_commands() const {
  std::vector<std::string> out;
  out.reserve(by_command_.size());
  for (const auto &[command, validator] : by_command_) {
    out.push_back(command);
  }
  std::sort(out.begin(), out.end());
  return out;
}

ValidatorRegistry ValidatorRegistry::create_default(const CommandPolicy &policy) {
  ValidatorRegistry registry;
  registry.register_validator(std::make_unique<validators::TerminateByNameValidator>(
      std::vector<std::string>(policy.terminable_processes().begin(),
                               policy.terminable_processes().end())));
  registry.register_validator(std::make_unique<validators::SignalSendValidator>());
  registry.register_validator(std::make_unique<validators::PermissionChangeValidator>());
  registry.register_validator(std::make_unique<validators::RecursiveDeleteValidator>());
  registry.register_validator(std::make_unique<validators::DirectoryRemovalValidator>());
  registry.register_validator(
      std::make_unique<validators::ContainerRuntimeValidator>(policy.protected_mount_sources()));
  registry.register_validator(std::make_unique<validators::ServiceManagerValidator>());
  registry.register_validator(std::make_unique<validators::LifecycleScriptValidator>());
  return registry;
}

} // namespace shellgate::security
