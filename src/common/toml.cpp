#include "shellgate/common/toml.hpp"

#include "shellgate/common/fs.hpp"

#include <charconv>
#include <sstream>

namespace shellgate::common {

namespace {

// Walks a value while tracking "basic" and 'literal' string state.
struct QuoteScanner {
  bool in_basic = false;
  bool in_literal = false;
  bool escaped = false;

  void feed(char ch) {
    if (in_basic) {
      if (escaped) {
        escaped = false;
      } else if (ch == '\\') {
        escaped = true;
      } else if (ch == '"') {
        in_basic = false;
      }
      return;
    }
    if (in_literal) {
      if (ch == '\'') {
        in_literal = false;
      }
      return;
    }
    if (ch == '"') {
      in_basic = true;
    } else if (ch == '\'') {
      in_literal = true;
    }
  }

  [[nodiscard]] bool quoted() const { return in_basic || in_literal; }
};

std::string strip_comment(const std::string &line) {
  QuoteScanner scanner;
  std::string output;
  output.reserve(line.size());

  for (const char ch : line) {
    if (!scanner.quoted() && ch == '#') {
      break;
    }
    scanner.feed(ch);
    output.push_back(ch);
  }

  return output;
}

int bracket_balance(const std::string &value) {
  QuoteScanner scanner;
  int depth = 0;
  for (const char ch : value) {
    const bool was_quoted = scanner.quoted();
    scanner.feed(ch);
    if (was_quoted || scanner.quoted()) {
      continue;
    }
    if (ch == '[') {
      ++depth;
    } else if (ch == ']') {
      --depth;
    }
  }
  return depth;
}

std::vector<std::string> split_array_elements(const std::string &array_value) {
  std::vector<std::string> result;
  std::string current;
  QuoteScanner scanner;

  for (const char ch : array_value) {
    if (!scanner.quoted() && ch == ',') {
      result.push_back(trim(current));
      current.clear();
      continue;
    }
    scanner.feed(ch);
    current.push_back(ch);
  }

  if (!trim(current).empty()) {
    result.push_back(trim(current));
  }

  return result;
}

std::string unescape_basic(const std::string &body) {
  std::string out;
  out.reserve(body.size());
  for (std::size_t i = 0; i < body.size(); ++i) {
    if (body[i] != '\\' || i + 1 >= body.size()) {
      out.push_back(body[i]);
      continue;
    }
    const char next = body[++i];
    switch (next) {
    case 'n':
      out.push_back('\n');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'r':
      out.push_back('\r');
      break;
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

std::string unquote(std::string value) {
  value = trim(value);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    return unescape_basic(value.substr(1, value.size() - 2));
  }
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  return unquote(it->second);
}

bool TomlDocument::get_bool(const std::string &key, bool fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string normalized = to_lower(trim(it->second));
  if (normalized == "true") {
    return true;
  }
  if (normalized == "false") {
    return false;
  }
  return fallback;
}

int TomlDocument::get_int(const std::string &key, int fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }

  const std::string normalized = trim(it->second);
  int parsed = 0;
  const auto *first = normalized.data();
  const auto *last = first + normalized.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last) {
    return fallback;
  }

  return parsed;
}

bool TomlDocument::is_array(const std::string &key) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return false;
  }
  const std::string raw = trim(it->second);
  return raw.size() >= 2 && raw.front() == '[' && raw.back() == ']';
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &fallback) const {
  if (!is_array(key)) {
    return fallback;
  }

  const std::string raw = trim(values.at(key));
  const std::string body = raw.substr(1, raw.size() - 2);
  std::vector<std::string> values_out;
  for (const auto &element : split_array_elements(body)) {
    if (!element.empty()) {
      values_out.push_back(unquote(element));
    }
  }

  return values_out;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string current_section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean_line = trim(strip_comment(line));
    if (clean_line.empty()) {
      continue;
    }

    if (clean_line.front() == '[' && clean_line.back() == ']') {
      current_section = trim(clean_line.substr(1, clean_line.size() - 2));
      if (current_section.empty()) {
        return Result<TomlDocument>::failure("Invalid empty section at line " +
                                             std::to_string(line_number));
      }
      continue;
    }

    const std::size_t equals_index = clean_line.find('=');
    if (equals_index == std::string::npos) {
      return Result<TomlDocument>::failure("Invalid key/value at line " +
                                           std::to_string(line_number));
    }

    const std::string key = trim(clean_line.substr(0, equals_index));
    std::string value = trim(clean_line.substr(equals_index + 1));
    if (key.empty()) {
      return Result<TomlDocument>::failure("Missing key at line " +
                                           std::to_string(line_number));
    }

    const std::size_t start_line = line_number;
    while (bracket_balance(value) > 0) {
      if (!std::getline(stream, line)) {
        return Result<TomlDocument>::failure("Unterminated array starting at line " +
                                             std::to_string(start_line));
      }
      ++line_number;
      const std::string continuation = trim(strip_comment(line));
      if (!continuation.empty()) {
        value += " " + continuation;
      }
    }

    const std::string full_key = current_section.empty() ? key : current_section + "." + key;
    document.values[full_key] = value;
  }

  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 2);
  escaped.push_back('"');
  for (const char ch : value) {
    if (ch == '"' || ch == '\\') {
      escaped.push_back('\\');
    }
    escaped.push_back(ch);
  }
  escaped.push_back('"');
  return escaped;
}

} // namespace shellgate::common
