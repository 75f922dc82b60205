#pragma once

#include "shellgate/common/result.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace shellgate::shell {

enum class SubstitutionKind { Command, Backtick, ProcessInput, ProcessOutput, Arithmetic };

struct Substitution {
  SubstitutionKind kind = SubstitutionKind::Command;
  // Text between the delimiters. Backtick bodies have `\`` unescaped.
  std::string body;
  std::size_t offset = 0;
};

[[nodiscard]] const char *substitution_kind_name(SubstitutionKind kind);

/// Outermost `$(...)`, backtick, `<(...)`, `>(...)` and `$((...))` forms in
/// `text`, left to right. Quote context around an opener is ignored, so
/// substitutions inside single quotes are reported too. Nested forms are left
/// in the bodies for the caller to recurse into.
[[nodiscard]] common::Result<std::vector<Substitution>>
find_substitutions(const std::string &text);

} // namespace shellgate::shell
