#include "shellgate/shell/scan.hpp"

namespace shellgate::shell {

namespace {

using IndexResult = common::Result<std::size_t>;

char closer_for(char open) { return open == '{' ? '}' : ')'; }

} // namespace

IndexResult match_single_quote(const std::string &text, std::size_t open_pos, bool ansi_c) {
  for (std::size_t i = open_pos + 1; i < text.size(); ++i) {
    if (ansi_c && text[i] == '\\') {
      ++i;
      continue;
    }
    if (text[i] == '\'') {
      return IndexResult::success(i);
    }
  }
  return IndexResult::failure("unterminated single quote");
}

IndexResult match_backtick(const std::string &text, std::size_t open_pos) {
  for (std::size_t i = open_pos + 1; i < text.size(); ++i) {
    if (text[i] == '\\') {
      ++i;
      continue;
    }
    if (text[i] == '`') {
      return IndexResult::success(i);
    }
  }
  return IndexResult::failure("unterminated backtick substitution");
}

IndexResult match_double_quote(const std::string &text, std::size_t open_pos) {
  for (std::size_t i = open_pos + 1; i < text.size(); ++i) {
    const char ch = text[i];
    if (ch == '\\') {
      ++i;
      continue;
    }
    if (ch == '"') {
      return IndexResult::success(i);
    }
    if (ch == '`') {
      auto end = match_backtick(text, i);
      if (!end.ok()) {
        return end;
      }
      i = end.value();
      continue;
    }
    if (ch == '$' && i + 1 < text.size() && (text[i + 1] == '(' || text[i + 1] == '{')) {
      auto end = match_group(text, i + 1);
      if (!end.ok()) {
        return end;
      }
      i = end.value();
    }
  }
  return IndexResult::failure("unterminated double quote");
}

IndexResult match_group(const std::string &text, std::size_t open_pos) {
  if (open_pos >= text.size() || (text[open_pos] != '(' && text[open_pos] != '{')) {
    return IndexResult::failure("no group opens at offset " + std::to_string(open_pos));
  }
  const char open = text[open_pos];
  const char close = closer_for(open);
  std::size_t depth = 1;

  for (std::size_t i = open_pos + 1; i < text.size(); ++i) {
    const char ch = text[i];
    if (ch == '\\') {
      ++i;
      continue;
    }
    if (ch == '\'') {
      const bool ansi_c = i > 0 && text[i - 1] == '$';
      auto end = match_single_quote(text, i, ansi_c);
      if (!end.ok()) {
        return end;
      }
      i = end.value();
      continue;
    }
    if (ch == '"') {
      auto end = match_double_quote(text, i);
      if (!end.ok()) {
        return end;
      }
      i = end.value();
      continue;
    }
    if (ch == '`') {
      auto end = match_backtick(text, i);
      if (!end.ok()) {
        return end;
      }
      i = end.value();
      continue;
    }
    if (ch == '$' && i + 1 < text.size() && (text[i + 1] == '(' || text[i + 1] == '{')) {
      auto end = match_group(text, i + 1);
      if (!end.ok()) {
        return end;
      }
      i = end.value();
      continue;
    }
    if (ch == open) {
      ++depth;
    } else if (ch == close) {
      --depth;
      if (depth == 0) {
        return IndexResult::success(i);
      }
    }
  }

  return IndexResult::failure(open == '{' ? "unterminated ${...} expansion"
                                          : "unterminated substitution");
}

} // namespace shellgate::shell
