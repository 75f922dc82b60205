#include "shellgate/shell/tokenizer.hpp"

#include "shellgate/shell/scan.hpp"

#include <array>
#include <cctype>
#include <string_view>

namespace shellgate::shell {

namespace {

using TokensResult = common::Result<std::vector<Token>>;

constexpr std::array<std::string_view, 10> kRedirections = {
    "<<<", "<<-", "&>>", "<<", "<>", "<&", ">>", ">|", ">&", "&>"};

bool is_name_start(char ch) {
  return std::isalpha(static_cast<unsigned char>(ch)) != 0 || ch == '_';
}

bool is_name_char(char ch) {
  return is_name_start(ch) || std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

bool is_special_parameter(char ch) {
  return std::isdigit(static_cast<unsigned char>(ch)) != 0 || ch == '@' || ch == '*' ||
         ch == '#' || ch == '?' || ch == '$' || ch == '!' || ch == '-';
}

bool is_assignment(const std::string &raw) {
  if (raw.empty() || !is_name_start(raw[0])) {
    return false;
  }
  std::size_t i = 1;
  while (i < raw.size() && is_name_char(raw[i])) {
    ++i;
  }
  if (i < raw.size() && raw[i] == '+') {
    ++i;
  }
  return i < raw.size() && raw[i] == '=';
}

// Brace expansion needs an unquoted `{`, a `,` or `..`, and an unquoted `}`.
bool has_brace_expansion(const std::string &unquoted_shadow) {
  const auto open = unquoted_shadow.find('{');
  if (open == std::string::npos) {
    return false;
  }
  const auto close = unquoted_shadow.find('}', open);
  if (close == std::string::npos) {
    return false;
  }
  const std::string inner = unquoted_shadow.substr(open + 1, close - open - 1);
  return inner.find(',') != std::string::npos || inner.find("..") != std::string::npos;
}

int hex_value(char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

std::string decode_ansi_c(const std::string &body) {
  std::string out;
  for (std::size_t i = 0; i < body.size(); ++i) {
    if (body[i] != '\\' || i + 1 >= body.size()) {
      out.push_back(body[i]);
      continue;
    }
    const char next = body[++i];
    switch (next) {
    case 'a':
      out.push_back('\a');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'e':
    case 'E':
      out.push_back('\x1b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'v':
      out.push_back('\v');
      break;
    case 'x': {
      int value = 0;
      std::size_t digits = 0;
      while (digits < 2 && i + 1 < body.size() && hex_value(body[i + 1]) >= 0) {
        value = value * 16 + hex_value(body[++i]);
        ++digits;
      }
      if (digits == 0) {
        out += "\\x";
      } else {
        out.push_back(static_cast<char>(value));
      }
      break;
    }
    default:
      if (next >= '0' && next <= '7') {
        int value = next - '0';
        std::size_t digits = 1;
        while (digits < 3 && i + 1 < body.size() && body[i + 1] >= '0' && body[i + 1] <= '7') {
          value = value * 8 + (body[++i] - '0');
          ++digits;
        }
        out.push_back(static_cast<char>(value & 0xFF));
      } else {
        out.push_back(next);
      }
      break;
    }
  }
  return out;
}

struct PendingHeredoc {
  std::string delimiter;
  bool strip_tabs = false;
};

class Lexer {
public:
  explicit Lexer(const std::string &input) : input_(input) {}

  TokensResult run() {
    std::size_t i = 0;
    while (i < input_.size()) {
      const char ch = input_[i];

      if (ch == ' ' || ch == '\t' || ch == '\r') {
        finish_word();
        ++i;
        continue;
      }

      if (ch == '\n') {
        finish_word();
        emit_operator("\n", i, i + 1);
        ++i;
        if (!heredocs_.empty()) {
          i = skip_heredoc_bodies(i);
        }
        continue;
      }

      if (ch == '\\') {
        if (i + 1 >= input_.size()) {
          return TokensResult::failure("trailing backslash");
        }
        if (input_[i + 1] != '\n') {
          start_word(i);
          word_.text.push_back(input_[i + 1]);
          word_.quoted = true;
          shadow_.push_back('_');
          word_end_ = i + 2;
        }
        i += 2;
        continue;
      }

      if (ch == '\'') {
        auto end = match_single_quote(input_, i, false);
        if (!end.ok()) {
          return TokensResult::failure(end.error());
        }
        start_word(i);
        word_.text += input_.substr(i + 1, end.value() - i - 1);
        word_.quoted = true;
        shadow_.append(end.value() - i + 1, '_');
        word_end_ = end.value() + 1;
        i = end.value() + 1;
        continue;
      }

      if (ch == '"') {
        auto next = consume_double_quoted(i);
        if (!next.ok()) {
          return TokensResult::failure(next.error());
        }
        i = next.value();
        continue;
      }

      if (ch == '$') {
        auto next = consume_dollar(i);
        if (!next.ok()) {
          return TokensResult::failure(next.error());
        }
        i = next.value();
        continue;
      }

      if (ch == '`') {
        auto end = match_backtick(input_, i);
        if (!end.ok()) {
          return TokensResult::failure(end.error());
        }
        append_expansion(i, end.value() + 1);
        i = end.value() + 1;
        continue;
      }

      if ((ch == '<' || ch == '>') && i + 1 < input_.size() && input_[i + 1] == '(') {
        auto end = match_group(input_, i + 1);
        if (!end.ok()) {
          return TokensResult::failure(end.error());
        }
        append_expansion(i, end.value() + 1);
        i = end.value() + 1;
        continue;
      }

      if (ch == '<' || ch == '>' || (ch == '&' && i + 1 < input_.size() && input_[i + 1] == '>')) {
        i = consume_redirection(i);
        continue;
      }

      if (ch == ';' || ch == '&' || ch == '|' || ch == '(' || ch == ')') {
        finish_word();
        i = consume_operator(i);
        continue;
      }

      if (ch == '#' && !in_word_) {
        // Comment to end of line; the newline still ends the command.
        while (i < input_.size() && input_[i] != '\n') {
          ++i;
        }
        continue;
      }

      start_word(i);
      word_.text.push_back(ch);
      shadow_.push_back(ch);
      word_end_ = i + 1;
      ++i;
    }

    finish_word();
    return TokensResult::success(std::move(tokens_));
  }

private:
  void start_word(std::size_t pos) {
    if (!in_word_) {
      in_word_ = true;
      word_ = Token{.kind = TokenKind::Word, .begin = pos};
      shadow_.clear();
    }
  }

  void finish_word() {
    if (!in_word_) {
      return;
    }
    in_word_ = false;
    word_.end = word_end_;
    word_.raw = input_.substr(word_.begin, word_.end - word_.begin);
    if (has_brace_expansion(shadow_)) {
      word_.has_expansion = true;
    }
    word_.has_glob = shadow_.find_first_of("*?[") != std::string::npos;

    if (is_assignment(word_.raw)) {
      word_.kind = TokenKind::Assignment;
    } else if (word_.text.size() > 1 && word_.text[0] == '-') {
      word_.kind = TokenKind::Flag;
    }

    if (heredoc_target_pending_) {
      heredoc_target_pending_ = false;
      heredocs_.push_back(PendingHeredoc{.delimiter = word_.text, .strip_tabs = heredoc_strip_});
    }
    tokens_.push_back(std::move(word_));
  }

  void append_expansion(std::size_t begin, std::size_t end) {
    start_word(begin);
    word_.text += input_.substr(begin, end - begin);
    word_.has_expansion = true;
    shadow_.append(end - begin, '_');
    word_end_ = end;
  }

  void emit_operator(const std::string &text, std::size_t begin, std::size_t end) {
    tokens_.push_back(Token{.kind = TokenKind::Operator,
                            .text = text,
                            .raw = input_.substr(begin, end - begin),
                            .begin = begin,
                            .end = end});
  }

  std::size_t consume_operator(std::size_t i) {
    const char ch = input_[i];
    const char next = i + 1 < input_.size() ? input_[i + 1] : '\0';
    std::string text(1, ch);
    if ((ch == '&' && next == '&') || (ch == '|' && next == '|') || (ch == ';' && next == ';') ||
        (ch == '|' && next == '&') || (ch == ';' && next == '&')) {
      text.push_back(next);
    }
    emit_operator(text, i, i + text.size());
    return i + text.size();
  }

  std::size_t consume_redirection(std::size_t i) {
    std::size_t begin = i;
    // A word made only of digits directly before the operator is a file descriptor.
    if (in_word_ && !word_.quoted && !word_.has_expansion && word_end_ == i &&
        !word_.text.empty() &&
        word_.text.find_first_not_of("0123456789") == std::string::npos) {
      begin = word_.begin;
      in_word_ = false;
    } else {
      finish_word();
    }

    std::string op(1, input_[i]);
    for (const auto candidate : kRedirections) {
      if (input_.compare(i, candidate.size(), candidate) == 0) {
        op = std::string(candidate);
        break;
      }
    }
    tokens_.push_back(Token{.kind = TokenKind::Redirection,
                            .text = op,
                            .raw = input_.substr(begin, i + op.size() - begin),
                            .begin = begin,
                            .end = i + op.size()});
    if (op == "<<" || op == "<<-") {
      heredoc_target_pending_ = true;
      heredoc_strip_ = op == "<<-";
    }
    return i + op.size();
  }

  std::size_t skip_heredoc_bodies(std::size_t i) {
    for (const auto &heredoc : heredocs_) {
      while (i < input_.size()) {
        auto line_end = input_.find('\n', i);
        const std::size_t next = line_end == std::string::npos ? input_.size() : line_end + 1;
        std::string line = input_.substr(i, (line_end == std::string::npos ? input_.size()
                                                                            : line_end) - i);
        i = next;
        if (heredoc.strip_tabs) {
          const auto first = line.find_first_not_of('\t');
          line = first == std::string::npos ? "" : line.substr(first);
        }
        if (line == heredoc.delimiter) {
          break;
        }
      }
    }
    heredocs_.clear();
    return i;
  }

  common::Result<std::size_t> consume_double_quoted(std::size_t i) {
    auto end = match_double_quote(input_, i);
    if (!end.ok()) {
      return end;
    }
    start_word(i);
    word_.quoted = true;
    std::size_t j = i + 1;
    while (j < end.value()) {
      const char ch = input_[j];
      if (ch == '\\' && j + 1 < end.value()) {
        const char next = input_[j + 1];
        if (next == '$' || next == '`' || next == '"' || next == '\\') {
          word_.text.push_back(next);
        } else if (next != '\n') {
          word_.text.push_back('\\');
          word_.text.push_back(next);
        }
        j += 2;
        continue;
      }
      if (ch == '`') {
        auto close = match_backtick(input_, j);
        if (!close.ok()) {
          return close;
        }
        word_.text += input_.substr(j, close.value() + 1 - j);
        word_.has_expansion = true;
        j = close.value() + 1;
        continue;
      }
      if (ch == '$' && j + 1 < end.value()) {
        const char next = input_[j + 1];
        if (next == '(' || next == '{') {
          auto close = match_group(input_, j + 1);
          if (!close.ok()) {
            return close;
          }
          word_.text += input_.substr(j, close.value() + 1 - j);
          word_.has_expansion = true;
          j = close.value() + 1;
          continue;
        }
        if (is_name_start(next) || is_special_parameter(next)) {
          word_.has_expansion = true;
        }
      }
      word_.text.push_back(ch);
      ++j;
    }
    shadow_.append(end.value() - i + 1, '_');
    word_end_ = end.value() + 1;
    return common::Result<std::size_t>::success(end.value() + 1);
  }

  common::Result<std::size_t> consume_dollar(std::size_t i) {
    const char next = i + 1 < input_.size() ? input_[i + 1] : '\0';
    if (next == '\'') {
      auto end = match_single_quote(input_, i + 1, true);
      if (!end.ok()) {
        return end;
      }
      start_word(i);
      word_.text += decode_ansi_c(input_.substr(i + 2, end.value() - i - 2));
      word_.quoted = true;
      shadow_.append(end.value() - i + 1, '_');
      word_end_ = end.value() + 1;
      return common::Result<std::size_t>::success(end.value() + 1);
    }
    if (next == '(' || next == '{') {
      auto end = match_group(input_, i + 1);
      if (!end.ok()) {
        return end;
      }
      append_expansion(i, end.value() + 1);
      return common::Result<std::size_t>::success(end.value() + 1);
    }
    start_word(i);
    word_.text.push_back('$');
    shadow_.push_back('$');
    if (is_name_start(next) || is_special_parameter(next)) {
      word_.has_expansion = true;
    }
    word_end_ = i + 1;
    return common::Result<std::size_t>::success(i + 1);
  }

  const std::string &input_;
  std::vector<Token> tokens_;
  Token word_;
  std::string shadow_;
  bool in_word_ = false;
  std::size_t word_end_ = 0;
  bool heredoc_target_pending_ = false;
  bool heredoc_strip_ = false;
  std::vector<PendingHeredoc> heredocs_;
};

} // namespace

const char *token_kind_name(TokenKind kind) {
  switch (kind) {
  case TokenKind::Word:
    return "word";
  case TokenKind::Flag:
    return "flag";
  case TokenKind::Assignment:
    return "assignment";
  case TokenKind::Operator:
    return "operator";
  case TokenKind::Redirection:
    return "redirection";
  }
  return "unknown";
}

TokensResult tokenize(const std::string &input) { return Lexer(input).run(); }

bool is_segment_separator(const Token &token) {
  if (token.kind != TokenKind::Operator) {
    return false;
  }
  return token.text == ";" || token.text == ";;" || token.text == ";&" || token.text == "&&" ||
         token.text == "||" || token.text == "&" || token.text == "\n";
}

bool is_pipe(const Token &token) {
  return token.kind == TokenKind::Operator && (token.text == "|" || token.text == "|&");
}

common::Result<std::vector<Segment>> split_segments(const std::string &input) {
  auto tokens = tokenize(input);
  if (!tokens.ok()) {
    return common::Result<std::vector<Segment>>::failure(tokens.error());
  }

  std::vector<Segment> segments;
  Segment current;
  auto flush = [&]() {
    if (!current.tokens.empty()) {
      const std::size_t begin = current.tokens.front().begin;
      const std::size_t end = current.tokens.back().end;
      current.text = input.substr(begin, end - begin);
      current.offset = begin;
      segments.push_back(std::move(current));
    }
    current = Segment{};
  };

  for (auto &token : tokens.value()) {
    if (is_segment_separator(token)) {
      flush();
      continue;
    }
    current.tokens.push_back(std::move(token));
  }
  flush();

  return common::Result<std::vector<Segment>>::success(std::move(segments));
}

} // namespace shellgate::shell
