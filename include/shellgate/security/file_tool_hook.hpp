#pragma once

#include "shellgate/security/decision.hpp"
#include "shellgate/security/hook_request.hpp"
#include "shellgate/security/path_extractor.hpp"
#include "shellgate/security/policy.hpp"

#include <string>

namespace shellgate::security {

/// Confines the path arguments of the runtime's own file tools (Read, Glob,
/// Grep, Write, Edit) to the project root and temp root. Reads may also
/// reach the additional read and write directories, writes only the latter.
class FileToolHook {
public:
  explicit FileToolHook(PolicyPtr policy = default_policy());

  [[nodiscard]] bool handles(const std::string &tool_name) const;
  [[nodiscard]] Decision evaluate(const HookRequest &request) const;

private:
  PolicyPtr policy_;
};

} // namespace shellgate::security
