#include "shellgate/common/json_util.hpp"

#include <cctype>
#include <cstdint>
#include <cstdio>

namespace shellgate::common {

namespace {

bool parse_hex4(const std::string &raw, std::size_t pos, std::uint32_t &out) {
  if (pos + 4 > raw.size()) {
    return false;
  }
  out = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const char ch = raw[i];
    out <<= 4;
    if (ch >= '0' && ch <= '9') {
      out |= static_cast<std::uint32_t>(ch - '0');
    } else if (ch >= 'a' && ch <= 'f') {
      out |= static_cast<std::uint32_t>(ch - 'a' + 10);
    } else if (ch >= 'A' && ch <= 'F') {
      out |= static_cast<std::uint32_t>(ch - 'A' + 10);
    } else {
      return false;
    }
  }
  return true;
}

void append_utf8(std::string &out, std::uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

std::size_t scan_literal_end(const std::string &json, std::size_t pos) {
  while (pos < json.size() && json[pos] != ',' && json[pos] != '}' && json[pos] != ']' &&
         std::isspace(static_cast<unsigned char>(json[pos])) == 0) {
    ++pos;
  }
  return pos;
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned char>(ch));
        escaped += buffer;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

Result<std::string> json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\') {
      out.push_back(ch);
      continue;
    }
    if (i + 1 >= raw.size()) {
      return Result<std::string>::failure("dangling escape in JSON string");
    }
    const char next = raw[++i];
    switch (next) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case '"':
    case '\\':
    case '/':
      out.push_back(next);
      break;
    case 'u': {
      std::uint32_t cp = 0;
      if (!parse_hex4(raw, i + 1, cp)) {
        return Result<std::string>::failure("invalid \\u escape in JSON string");
      }
      i += 4;
      if (cp >= 0xD800 && cp <= 0xDBFF) {
        std::uint32_t low = 0;
        if (i + 2 >= raw.size() || raw[i + 1] != '\\' || raw[i + 2] != 'u' ||
            !parse_hex4(raw, i + 3, low) || low < 0xDC00 || low > 0xDFFF) {
          return Result<std::string>::failure("unpaired surrogate in JSON string");
        }
        i += 6;
        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
      } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
        return Result<std::string>::failure("unpaired surrogate in JSON string");
      }
      append_utf8(out, cp);
      break;
    }
    default:
      return Result<std::string>::failure(std::string("invalid escape \\") + next +
                                          " in JSON string");
    }
  }
  return Result<std::string>::success(std::move(out));
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (!escaped && ch == '"') {
      return i;
    }
    if (!escaped && ch == '\\') {
      escaped = true;
      continue;
    }
    escaped = false;
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                      const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  bool in_string = false;
  bool escaped = false;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      if (depth == 0) {
        return std::string::npos;
      }
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

Result<JsonObject> json_parse_object(const std::string &json) {
  JsonObject result;
  std::size_t pos = json_skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '{') {
    return Result<JsonObject>::failure("expected JSON object");
  }
  const auto object_end = json_find_matching_token(json, pos, '{', '}');
  if (object_end == std::string::npos) {
    return Result<JsonObject>::failure("unterminated JSON object");
  }
  if (json_skip_ws(json, object_end + 1) != json.size()) {
    return Result<JsonObject>::failure("trailing content after JSON object");
  }

  ++pos;
  bool expect_member = true;
  while (true) {
    pos = json_skip_ws(json, pos);
    if (pos >= object_end) {
      break;
    }
    if (!expect_member) {
      if (json[pos] != ',') {
        return Result<JsonObject>::failure("expected ',' between JSON members");
      }
      ++pos;
      expect_member = true;
      continue;
    }

    if (json[pos] != '"') {
      return Result<JsonObject>::failure("expected JSON member name");
    }
    const auto key_end = json_find_string_end(json, pos);
    if (key_end == std::string::npos || key_end >= object_end) {
      return Result<JsonObject>::failure("unterminated JSON member name");
    }
    auto key = json_unescape(json.substr(pos + 1, key_end - pos - 1));
    if (!key.ok()) {
      return Result<JsonObject>::failure(key.error());
    }

    pos = json_skip_ws(json, key_end + 1);
    if (pos >= object_end || json[pos] != ':') {
      return Result<JsonObject>::failure("expected ':' after \"" + key.value() + "\"");
    }
    pos = json_skip_ws(json, pos + 1);
    if (pos >= object_end) {
      return Result<JsonObject>::failure("missing value for \"" + key.value() + "\"");
    }

    JsonValue value;
    const char head = json[pos];
    if (head == '"') {
      const auto end = json_find_string_end(json, pos);
      if (end == std::string::npos || end >= object_end) {
        return Result<JsonObject>::failure("unterminated JSON string");
      }
      auto decoded = json_unescape(json.substr(pos + 1, end - pos - 1));
      if (!decoded.ok()) {
        return Result<JsonObject>::failure(decoded.error());
      }
      value = JsonValue{.kind = JsonKind::String, .text = std::move(decoded.value())};
      pos = end + 1;
    } else if (head == '{' || head == '[') {
      const char close = head == '{' ? '}' : ']';
      const auto end = json_find_matching_token(json, pos, head, close);
      if (end == std::string::npos || end >= object_end) {
        return Result<JsonObject>::failure("unterminated JSON container");
      }
      value = JsonValue{.kind = head == '{' ? JsonKind::Object : JsonKind::Array,
                        .text = json.substr(pos, end - pos + 1)};
      pos = end + 1;
    } else {
      const auto end = scan_literal_end(json, pos);
      const std::string literal = json.substr(pos, end - pos);
      if (literal == "true" || literal == "false") {
        value = JsonValue{.kind = JsonKind::Bool, .text = literal};
      } else if (literal == "null") {
        value = JsonValue{.kind = JsonKind::Null, .text = literal};
      } else if (!literal.empty() &&
                 (literal[0] == '-' || std::isdigit(static_cast<unsigned char>(literal[0])))) {
        value = JsonValue{.kind = JsonKind::Number, .text = literal};
      } else {
        return Result<JsonObject>::failure("invalid JSON value for \"" + key.value() + "\"");
      }
      pos = end;
    }

    result[key.value()] = std::move(value);
    expect_member = false;
  }

  return Result<JsonObject>::success(std::move(result));
}

} // namespace shellgate::common
