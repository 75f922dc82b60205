#pragma once

#include "shellgate/common/result.hpp"

#include <cstddef>
#include <string>

namespace shellgate::shell {

/// Index of the character closing the group opened at `open_pos`
/// (`(` or `{`). Quotes, backslash escapes, backticks and nested groups inside
/// the body are honored. Fails when the group is never closed.
[[nodiscard]] common::Result<std::size_t> match_group(const std::string &text,
                                                      std::size_t open_pos);

/// Index of the backtick closing the one at `open_pos`.
[[nodiscard]] common::Result<std::size_t> match_backtick(const std::string &text,
                                                         std::size_t open_pos);

/// Index of the quote closing the single-quoted string at `open_pos`. With
/// `ansi_c` set, backslash escapes the next character (`$'...'`).
[[nodiscard]] common::Result<std::size_t> match_single_quote(const std::string &text,
                                                             std::size_t open_pos, bool ansi_c);

/// Index of the quote closing the double-quoted string at `open_pos`.
[[nodiscard]] common::Result<std::size_t> match_double_quote(const std::string &text,
                                                             std::size_t open_pos);

} // namespace shellgate::shell
