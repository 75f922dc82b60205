#include "shellgate/security/file_tool_hook.hpp"

#include "shellgate/observability/global.hpp"
#include "shellgate/security/path_sandbox.hpp"

#include <unordered_map>

namespace shellgate::security {

namespace {

struct FileToolSpec {
  FileAccess access;
  const char *path_key;
  // Glob and Grep default to the working directory when `path` is omitted.
  bool path_optional;
};

const std::unordered_map<std::string, FileToolSpec> &file_tools() {
  static const std::unordered_map<std::string, FileToolSpec> tools = {
      {"Read", {FileAccess::Read, "file_path", false}},
      {"Glob", {FileAccess::Read, "path", true}},
      {"Grep", {FileAccess::Read, "path", true}},
      {"Write", {FileAccess::Write, "file_path", false}},
      {"Edit", {FileAccess::Write, "file_path", false}},
  };
  return tools;
}

const char *access_name(FileAccess access) {
  return access == FileAccess::Read ? "Read" : "Write";
}

} // namespace

FileToolHook::FileToolHook(PolicyPtr policy)
    : policy_(policy != nullptr ? std::move(policy) : default_policy()) {}

bool FileToolHook::handles(const std::string &tool_name) const {
  return file_tools().contains(tool_name);
}

Decision FileToolHook::evaluate(const HookRequest &request) const {
  const auto it = file_tools().find(request.tool_name);
  if (it == file_tools().end() || !request.project_dir.has_value()) {
    return Decision::allow();
  }
  const FileToolSpec &spec = it->second;
  const std::string key = spec.path_key;

  Decision decision = Decision::allow();
  if (!request.has_input(key)) {
    if (!spec.path_optional) {
      decision = Decision::block(BlockKind::ParseError, Stage::Parse,
                                 request.tool_name + " blocked: missing '" + key + "'");
    }
  } else if (const auto path = request.input_string(key); !path.has_value()) {
    decision = Decision::block(BlockKind::ParseError, Stage::Parse,
                               request.tool_name + " blocked: '" + key + "' is not a string");
  } else {
    auto sandbox = PathSandbox::create(*request.project_dir, *policy_);
    if (!sandbox.ok()) {
      decision = Decision::block(BlockKind::ResolutionError, Stage::PathCheck,
                                 "Cannot validate paths: " + sandbox.error());
    } else {
      const PathCheck check = sandbox.value().check(*path, false, spec.access);
      if (check.outcome == PathOutcome::Unresolvable) {
        decision = Decision::block(BlockKind::ResolutionError, Stage::PathCheck,
                                   request.tool_name + " blocked: Cannot validate path '" +
                                       *path + "': " + check.message);
      } else if (check.outcome == PathOutcome::Escapes) {
        decision = Decision::block(
            BlockKind::PathEscape, Stage::PathCheck,
            request.tool_name + " blocked: Path escapes project directory: '" + *path +
                "' resolves to '" + check.resolved.string() + "' which is outside '" +
                sandbox.value().project_root().string() + "'. " + access_name(spec.access) +
                " access denied for security.");
      }
    }
  }

  observability::record_decision(request.tool_name, request.input_string(key).value_or(""),
                                 decision.allowed, block_kind_name(decision.kind),
                                 stage_name(decision.stage), decision.reason);
  return decision;
}

} // namespace shellgate::security
