#include "shellgate/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace shellgate::common {

std::string trim(const std::string &input) {
  auto first = std::find_if_not(input.begin(), input.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  auto last = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char c) {
    return std::isspace(c) != 0;
  }).base();

  if (first >= last) {
    return "";
  }
  return std::string(first, last);
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.rfind(prefix, 0) == 0;
}

bool ends_with(const std::string &value, const std::string &suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

std::string basename_of(const std::string &value) {
  std::string trimmed = value;
  while (trimmed.size() > 1 && trimmed.back() == '/') {
    trimmed.pop_back();
  }
  const auto slash = trimmed.find_last_of('/');
  if (slash == std::string::npos || trimmed.size() == 1) {
    return trimmed;
  }
  return trimmed.substr(slash + 1);
}

Result<std::filesystem::path> home_dir() {
  if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(home));
  }
  return Result<std::filesystem::path>::failure("HOME is not set");
}

Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return Result<std::filesystem::path>::failure("Failed to create directory: " +
                                                  path.string() + ": " + ec.message());
  }
  return Result<std::filesystem::path>::success(path);
}

Result<std::string> expand_home(const std::string &value) {
  if (value.empty() || value[0] != '~') {
    return Result<std::string>::success(value);
  }
  if (value.size() > 1 && value[1] != '/') {
    return Result<std::string>::failure("unsupported home reference '" + value + "'");
  }
  auto home = home_dir();
  if (!home.ok()) {
    return Result<std::string>::failure("cannot expand '" + value + "': " + home.error());
  }
  std::string expanded = value;
  expanded.replace(0, 1, home.value().string());
  return Result<std::string>::success(expanded);
}

Result<std::filesystem::path> resolve_path(const std::filesystem::path &path) {
  std::error_code ec;
  auto resolved = std::filesystem::weakly_canonical(path, ec);
  if (ec) {
    return Result<std::filesystem::path>::failure(ec.message());
  }
  return Result<std::filesystem::path>::success(resolved.lexically_normal());
}

bool is_subpath(const std::filesystem::path &candidate, const std::filesystem::path &parent) {
  std::filesystem::path base = parent;
  if (!base.has_filename() && base.has_relative_path()) {
    base = base.parent_path();
  }

  auto c_it = candidate.begin();
  auto p_it = base.begin();

  for (; p_it != base.end(); ++p_it, ++c_it) {
    if (c_it == candidate.end() || *c_it != *p_it) {
      return false;
    }
  }

  return true;
}

} // namespace shellgate::common
