#include "shellgate/shell/substitution.hpp"

#include "shellgate/shell/scan.hpp"

namespace shellgate::shell {

namespace {

std::string unescape_backticks(const std::string &body) {
  std::string out;
  out.reserve(body.size());
  for (std::size_t i = 0; i < body.size(); ++i) {
    if (body[i] == '\\' && i + 1 < body.size() &&
        (body[i + 1] == '`' || body[i + 1] == '\\' || body[i + 1] == '$')) {
      out.push_back(body[++i]);
      continue;
    }
    out.push_back(body[i]);
  }
  return out;
}

} // namespace

const char *substitution_kind_name(SubstitutionKind kind) {
  switch (kind) {
  case SubstitutionKind::Command:
    return "command";
  case SubstitutionKind::Backtick:
    return "backtick";
  case SubstitutionKind::ProcessInput:
    return "process-input";
  case SubstitutionKind::ProcessOutput:
    return "process-output";
  case SubstitutionKind::Arithmetic:
    return "arithmetic";
  }
  return "unknown";
}

common::Result<std::vector<Substitution>> find_substitutions(const std::string &text) {
  using SubResult = common::Result<std::vector<Substitution>>;
  std::vector<Substitution> found;

  std::size_t i = 0;
  while (i < text.size()) {
    const char ch = text[i];
    const char next = i + 1 < text.size() ? text[i + 1] : '\0';

    if (ch == '\\') {
      i += 2;
      continue;
    }

    if (ch == '`') {
      auto end = match_backtick(text, i);
      if (!end.ok()) {
        return SubResult::failure(end.error());
      }
      found.push_back(Substitution{.kind = SubstitutionKind::Backtick,
                                   .body = unescape_backticks(
                                       text.substr(i + 1, end.value() - i - 1)),
                                   .offset = i});
      i = end.value() + 1;
      continue;
    }

    const bool dollar_paren = ch == '$' && next == '(';
    const bool process = (ch == '<' || ch == '>') && next == '(';
    if (!dollar_paren && !process) {
      ++i;
      continue;
    }

    auto end = match_group(text, i + 1);
    if (!end.ok()) {
      return SubResult::failure(end.error());
    }
    const std::size_t close = end.value();

    SubstitutionKind kind = SubstitutionKind::Command;
    std::string body = text.substr(i + 2, close - i - 2);
    if (process) {
      kind = ch == '<' ? SubstitutionKind::ProcessInput : SubstitutionKind::ProcessOutput;
    } else if (i + 2 < text.size() && text[i + 2] == '(') {
      // `$((` is arithmetic only when the inner group closes right before the outer one.
      auto inner = match_group(text, i + 2);
      if (inner.ok() && inner.value() + 1 == close) {
        kind = SubstitutionKind::Arithmetic;
        body = text.substr(i + 3, inner.value() - (i + 3));
      }
    }

    found.push_back(Substitution{.kind = kind, .body = std::move(body), .offset = i});
    i = close + 1;
  }

  return SubResult::success(std::move(found));
}

} // namespace shellgate::shell
