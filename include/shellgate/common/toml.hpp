#pragma once

#include "shellgate/common/result.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace shellgate::common {

/// Flat view over a TOML subset: `[section]` headers, `key = value` pairs,
/// basic and literal strings, booleans, integers and string arrays (which may
/// span several lines). Keys are stored as `section.key`.
struct TomlDocument {
  std::unordered_map<std::string, std::string> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] int get_int(const std::string &key, int fallback) const;
  [[nodiscard]] bool is_array(const std::string &key) const;
  [[nodiscard]] std::vector<std::string>
  get_string_array(const std::string &key, const std::vector<std::string> &fallback = {}) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);
[[nodiscard]] std::string quote_toml_string(const std::string &value);

} // namespace shellgate::common
