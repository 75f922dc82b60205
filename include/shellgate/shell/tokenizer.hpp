#pragma once

#include "shellgate/common/result.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace shellgate::shell {

enum class TokenKind { Word, Flag, Assignment, Operator, Redirection };

struct Token {
  TokenKind kind = TokenKind::Word;
  // Dequoted text for words, operator spelling for operators and redirections.
  std::string text;
  // Source spelling, quotes included.
  std::string raw;
  bool quoted = false;
  // Unresolved `$`, backtick, process substitution or brace expansion.
  bool has_expansion = false;
  // Unquoted glob metacharacter.
  bool has_glob = false;
  std::size_t begin = 0;
  std::size_t end = 0;
};

struct Segment {
  std::string text;
  // Offset of `text` in the tokenized input; token offsets share that origin.
  std::size_t offset = 0;
  std::vector<Token> tokens;
};

[[nodiscard]] const char *token_kind_name(TokenKind kind);

/// Splits a command string into tokens. Unterminated quotes or substitutions
/// and a trailing backslash are reported as failures.
[[nodiscard]] common::Result<std::vector<Token>> tokenize(const std::string &input);

/// Groups tokens into segments separated by `;`, `;;`, `&&`, `||`, `&` and
/// newlines. Pipe stages stay inside one segment.
[[nodiscard]] common::Result<std::vector<Segment>> split_segments(const std::string &input);

[[nodiscard]] bool is_segment_separator(const Token &token);
[[nodiscard]] bool is_pipe(const Token &token);

} // namespace shellgate::shell
