#pragma once

#include <string>

namespace shellgate::security {

enum class BlockKind { None, ParseError, UnknownCommand, PolicyViolation, PathEscape, ResolutionError };

enum class Stage { Parse, Extract, Allowlist, ExtraValidation, PathCheck, Complete };

struct Decision {
  bool allowed = true;
  BlockKind kind = BlockKind::None;
  Stage stage = Stage::Complete;
  std::string reason;

  [[nodiscard]] static Decision allow() { return Decision{}; }
  [[nodiscard]] static Decision block(BlockKind kind, Stage stage, std::string reason) {
    return Decision{.allowed = false, .kind = kind, .stage = stage, .reason = std::move(reason)};
  }
};

[[nodiscard]] const char *block_kind_name(BlockKind kind);
[[nodiscard]] const char *stage_name(Stage stage);

} // namespace shellgate::security
