#include "shellgate/security/decision.hpp"

namespace shellgate::security {

const char *block_kind_name(BlockKind kind) {
  switch (kind) {
  case BlockKind::None:
    return "none";
  case BlockKind::ParseError:
    return "parse_error";
  case BlockKind::UnknownCommand:
    return "unknown_command";
  case BlockKind::PolicyViolation:
    return "policy_violation";
  case BlockKind::PathEscape:
    return "path_escape";
  case BlockKind::ResolutionError:
    return "resolution_error";
  }
  return "unknown";
}

const char *stage_name(Stage stage) {
  switch (stage) {
  case Stage::Parse:
    return "parse";
  case Stage::Extract:
    return "extract";
  case Stage::Allowlist:
    return "allowlist";
  case Stage::ExtraValidation:
    return "extra_validation";
  case Stage::PathCheck:
    return "path_check";
  case Stage::Complete:
    return "complete";
  }
  return "unknown";
}

} // namespace shellgate::security
