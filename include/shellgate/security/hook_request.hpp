#pragma once

#include "shellgate/common/json_util.hpp"

#include <optional>
#include <string>

namespace shellgate::security {

/// One pre-execution tool call as the agent runtime reports it.
struct HookRequest {
  std::string tool_name;
  common::JsonObject tool_input;
  std::optional<std::string> project_dir;

  [[nodiscard]] bool has_input(const std::string &key) const {
    return tool_input.contains(key);
  }
  /// Value of a string member of `tool_input`; nothing when absent or not a string.
  [[nodiscard]] std::optional<std::string> input_string(const std::string &key) const {
    const auto it = tool_input.find(key);
    if (it == tool_input.end() || it->second.kind != common::JsonKind::String) {
      return std::nullopt;
    }
    return it->second.text;
  }

  [[nodiscard]] static HookRequest shell(std::string tool, std::string command,
                                         std::optional<std::string> project = std::nullopt) {
    HookRequest request;
    request.tool_name = std::move(tool);
    request.tool_input["command"] =
        common::JsonValue{.kind = common::JsonKind::String, .text = std::move(command)};
    request.project_dir = std::move(project);
    return request;
  }
};

} // namespace shellgate::security
