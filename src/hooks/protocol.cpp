#include "shellgate/hooks/protocol.hpp"

#include "shellgate/common/json_util.hpp"

#include <sstream>

namespace shellgate::hooks {

namespace {

using RequestResult = common::Result<security::HookRequest>;

common::Result<common::JsonObject> nested_object(const common::JsonObject &object,
                                                 const std::string &key) {
  const auto it = object.find(key);
  if (it == object.end() || it->second.kind == common::JsonKind::Null) {
    return common::Result<common::JsonObject>::success({});
  }
  if (it->second.kind != common::JsonKind::Object) {
    return common::Result<common::JsonObject>::failure("'" + key + "' must be an object");
  }
  auto parsed = common::json_parse_object(it->second.text);
  if (!parsed.ok()) {
    return common::Result<common::JsonObject>::failure("'" + key + "': " + parsed.error());
  }
  return parsed;
}

} // namespace

RequestResult parse_hook_request(const std::string &json) {
  auto top = common::json_parse_object(json);
  if (!top.ok()) {
    return RequestResult::failure("malformed hook request: " + top.error());
  }

  security::HookRequest request;
  const auto tool = top.value().find("tool_name");
  if (tool == top.value().end() || tool->second.kind != common::JsonKind::String) {
    return RequestResult::failure("malformed hook request: 'tool_name' must be a string");
  }
  request.tool_name = tool->second.text;

  auto input = nested_object(top.value(), "tool_input");
  if (!input.ok()) {
    return RequestResult::failure("malformed hook request: " + input.error());
  }
  request.tool_input = std::move(input.value());

  auto context = nested_object(top.value(), "context");
  if (!context.ok()) {
    return RequestResult::failure("malformed hook request: " + context.error());
  }
  if (const auto it = context.value().find("project_dir"); it != context.value().end()) {
    if (it->second.kind == common::JsonKind::String) {
      request.project_dir = it->second.text;
    } else if (it->second.kind != common::JsonKind::Null) {
      return RequestResult::failure(
          "malformed hook request: 'context.project_dir' must be a string");
    }
  }
  return RequestResult::success(std::move(request));
}

std::string encode_hook_response(const security::Decision &decision) {
  if (decision.allowed) {
    return "{}";
  }
  return "{\"decision\":\"block\",\"reason\":\"" + common::json_escape(decision.reason) + "\"}";
}

std::string encode_decision_report(const security::Decision &decision,
                                   const std::string &command) {
  std::ostringstream out;
  out << "{\"allowed\":" << (decision.allowed ? "true" : "false") << ",\"kind\":\""
      << security::block_kind_name(decision.kind) << "\",\"stage\":\""
      << security::stage_name(decision.stage) << "\",\"reason\":\""
      << common::json_escape(decision.reason) << "\",\"command\":\""
      << common::json_escape(command) << "\"}";
  return out.str();
}

HookExchange handle_hook_json(const std::string &json,
                              const security::BashSecurityHook *bash_hook,
                              const security::FileToolHook *file_hook,
                              const std::optional<std::string> &fallback_project) {
  HookExchange exchange;
  auto request = parse_hook_request(json);
  if (!request.ok()) {
    exchange.decision = security::Decision::block(security::BlockKind::ParseError,
                                                  security::Stage::Parse, request.error());
    exchange.response = encode_hook_response(exchange.decision);
    return exchange;
  }

  security::HookRequest parsed = std::move(request.value());
  if (!parsed.project_dir.has_value()) {
    parsed.project_dir = fallback_project;
  }

  if (bash_hook != nullptr && bash_hook->handles(parsed.tool_name)) {
    exchange.decision = bash_hook->evaluate(parsed);
  } else if (file_hook != nullptr && file_hook->handles(parsed.tool_name)) {
    exchange.decision = file_hook->evaluate(parsed);
  } else {
    exchange.decision = security::Decision::allow();
  }
  exchange.response = encode_hook_response(exchange.decision);
  exchange.request = std::move(parsed);
  return exchange;
}

} // namespace shellgate::hooks
