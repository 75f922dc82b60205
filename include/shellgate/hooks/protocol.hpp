#pragma once

#include "shellgate/common/result.hpp"
#include "shellgate/security/bash_hook.hpp"
#include "shellgate/security/decision.hpp"
#include "shellgate/security/file_tool_hook.hpp"
#include "shellgate/security/hook_request.hpp"

#include <optional>
#include <string>

namespace shellgate::hooks {

/// Decodes `{"tool_name": ..., "tool_input": {...}, "context": {"project_dir": ...}}`.
/// String escapes are fully decoded so the command matches what will run.
[[nodiscard]] common::Result<security::HookRequest> parse_hook_request(const std::string &json);

/// `{}` to allow, `{"decision":"block","reason":"..."}` to block.
[[nodiscard]] std::string encode_hook_response(const security::Decision &decision);

/// Full decision record for operators: allowed, kind, stage and reason.
[[nodiscard]] std::string encode_decision_report(const security::Decision &decision,
                                                 const std::string &command);

struct HookExchange {
  std::optional<security::HookRequest> request;
  security::Decision decision;
  std::string response;
};

/// Parses `json`, routes it to whichever of the hooks handles the tool and
/// encodes the answer. Tools neither hook handles pass. Malformed input
/// produces a block. `fallback_project` is used when the request carries no
/// project directory.
[[nodiscard]] HookExchange
handle_hook_json(const std::string &json, const security::BashSecurityHook *bash_hook,
                 const security::FileToolHook *file_hook = nullptr,
                 const std::optional<std::string> &fallback_project = std::nullopt);

} // namespace shellgate::hooks
