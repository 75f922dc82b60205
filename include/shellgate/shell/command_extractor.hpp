#pragma once

#include "shellgate/common/result.hpp"
#include "shellgate/shell/tokenizer.hpp"

#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

namespace shellgate::shell {

/// One executable reference inside a segment: the command word plus every
/// token up to the end of its pipe stage (redirections included).
struct CommandInvocation {
  // Basename of the command word, or the raw word when it is still dynamic.
  std::string name;
  Token command;
  std::vector<Token> args;
  std::string text;
  std::size_t depth = 0;
};

struct ExtractorOptions {
  // Commands that run their argument as another command (`nohup`, `xargs`).
  std::unordered_set<std::string> wrapper_commands;
  // Shells whose `-c` argument is a command string (`bash -c '...'`).
  std::unordered_set<std::string> shell_interpreters;
};

struct Extraction {
  std::vector<CommandInvocation> commands;
  // Command strings handed to a shell with `-c`; analysed by the caller.
  std::vector<std::string> inline_scripts;
};

[[nodiscard]] ExtractorOptions default_extractor_options();

/// Arguments of `invocation` as the command itself receives them: prefix
/// assignments, redirections and their targets are left out.
[[nodiscard]] std::vector<Token> argument_tokens(const CommandInvocation &invocation);

/// Walks the tokens with an expect-command flag. Separators inside the token
/// run (`;`, `&&`, newline) reset the walk, so a whole script can be passed as
/// one segment; `case` patterns are only recognised that way.
[[nodiscard]] common::Result<Extraction>
extract_commands(const Segment &segment, const ExtractorOptions &options, std::size_t depth = 0);

/// Command names in `segment`, in order of appearance.
[[nodiscard]] common::Result<std::vector<std::string>>
extract_command_names(const Segment &segment, const ExtractorOptions &options);

} // namespace shellgate::shell
