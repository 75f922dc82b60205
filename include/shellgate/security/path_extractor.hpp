#pragma once

#include "shellgate/shell/command_extractor.hpp"

#include <string>
#include <vector>

namespace shellgate::security {

enum class PathRole { Operand, Source, Destination, Output, Script, Redirect };

enum class FileAccess { Read, Write };

struct PathCandidate {
  std::string path;
  std::string command;
  PathRole role = PathRole::Operand;
  // Write unless the command is known to only read this path.
  FileAccess access = FileAccess::Write;
  bool has_expansion = false;
  // Unquoted `*`, `?` or `[` somewhere in the word.
  bool has_glob = false;
};

[[nodiscard]] const char *path_role_name(PathRole role);

/// Filesystem paths `invocation` would touch: file operands of file
/// commands (including values glued to their file flags, `-o/x` and
/// `--output=/x`), output-flag values, interpreter scripts, cp/mv sources
/// and destination, and the target of every file redirection. Any other
/// command contributes its arguments that start with `/` or `~`.
[[nodiscard]] std::vector<PathCandidate>
extract_path_candidates(const shell::CommandInvocation &invocation);

[[nodiscard]] bool is_file_operation_command(const std::string &name);

} // namespace shellgate::security
