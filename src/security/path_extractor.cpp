#include "shellgate/security/path_extractor.hpp"

#include "shellgate/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace shellgate::security {

namespace {

using shell::Token;
using shell::TokenKind;

const std::unordered_set<std::string> &file_operation_commands() {
  static const std::unordered_set<std::string> commands = {
      "cat",  "cp",   "mv",  "rm",   "rmdir", "mkdir", "chmod", "touch", "ls",   "find",
      "head", "tail", "tee", "stat", "grep",  "awk",   "wc",    "ln",    "less", "more",
      "sort", "uniq", "diff", "file", "sed",  "tree",  "realpath", "readlink"};
  return commands;
}

// Commands whose first operand is a pattern or program rather than a file,
// unless the flags named here supply it instead.
const std::unordered_map<std::string, std::unordered_set<std::string>> &pattern_commands() {
  static const std::unordered_map<std::string, std::unordered_set<std::string>> commands = {
      {"grep", {"-e", "-f", "--regexp", "--file"}},
      {"sed", {"-e", "-f", "--expression", "--file"}},
      {"awk", {"-f", "--file"}},
  };
  return commands;
}

// Commands that only read their file operands.
const std::unordered_set<std::string> &read_only_commands() {
  static const std::unordered_set<std::string> commands = {
      "cat", "head", "tail", "less", "more", "wc", "stat", "file", "diff", "ls", "tree",
      "realpath", "readlink", "grep"};
  return commands;
}

// Flags of file commands whose value names a file, and how it is used.
const std::unordered_map<std::string, std::unordered_map<std::string, PathRole>> &
file_value_flags() {
  static const std::unordered_map<std::string, std::unordered_map<std::string, PathRole>> flags =
      {
          {"sort",
           {{"-o", PathRole::Output},
            {"--output", PathRole::Output},
            {"-T", PathRole::Output},
            {"--temporary-directory", PathRole::Output},
            {"--files0-from", PathRole::Operand},
            {"--random-source", PathRole::Operand}}},
          {"grep",
           {{"-f", PathRole::Operand},
            {"--file", PathRole::Operand},
            {"--exclude-from", PathRole::Operand}}},
          {"sed", {{"-f", PathRole::Operand}, {"--file", PathRole::Operand}}},
          {"awk", {{"-f", PathRole::Operand}, {"--file", PathRole::Operand}}},
          {"diff",
           {{"--from-file", PathRole::Operand},
            {"--to-file", PathRole::Operand},
            {"-X", PathRole::Operand},
            {"--exclude-from", PathRole::Operand}}},
          {"ln", {{"-t", PathRole::Destination}, {"--target-directory", PathRole::Destination}}},
          {"touch", {{"-r", PathRole::Operand}, {"--reference", PathRole::Operand}}},
          {"chmod", {{"--reference", PathRole::Operand}}},
          {"wc", {{"--files0-from", PathRole::Operand}}},
      };
  return flags;
}

const std::unordered_map<std::string, std::unordered_set<std::string>> &output_flags() {
  static const std::unordered_map<std::string, std::unordered_set<std::string>> flags = {
      {"curl", {"-o", "--output"}},
      {"wget", {"-O", "--output-document", "-P", "--directory-prefix"}},
      {"unzip", {"-d"}},
      {"jar", {"-C"}},
      {"git", {"--work-tree", "--git-dir", "-C"}},
  };
  return flags;
}

const std::unordered_set<std::string> &script_commands() {
  static const std::unordered_set<std::string> commands = {
      "python", "python3", "node", "java", "bash", "sh", "zsh", "dash", "ruby", "perl"};
  return commands;
}

// Interpreter flags after which no script file follows.
const std::unordered_set<std::string> &inline_code_flags() {
  static const std::unordered_set<std::string> flags = {"-c", "-m", "-e", "-p", "--eval",
                                                        "--print", "-E"};
  return flags;
}

bool is_path_like(const std::string &text) {
  return text.find('/') != std::string::npos || common::starts_with(text, ".") ||
         common::starts_with(text, "~");
}

bool is_absolute_like(const std::string &text) {
  return common::starts_with(text, "/") || common::starts_with(text, "~");
}

bool is_fd_reference(const std::string &text) {
  return text == "-" || (!text.empty() && text.find_first_not_of("0123456789") == std::string::npos);
}

FileAccess access_for(const std::string &command, PathRole role) {
  switch (role) {
  case PathRole::Script:
    return FileAccess::Read;
  case PathRole::Source:
    return command == "cp" ? FileAccess::Read : FileAccess::Write;
  case PathRole::Operand:
    return read_only_commands().contains(command) ? FileAccess::Read : FileAccess::Write;
  default:
    return FileAccess::Write;
  }
}

PathCandidate make_candidate(const std::string &value, const Token &origin,
                             const std::string &command, PathRole role) {
  return PathCandidate{.path = value,
                       .command = command,
                       .role = role,
                       .access = access_for(command, role),
                       .has_expansion = origin.has_expansion,
                       .has_glob = origin.has_glob};
}

PathCandidate make_candidate(const Token &token, const std::string &command, PathRole role) {
  return make_candidate(token.text, token, command, role);
}

// Value-taking short flag inside a cluster (`-o/x`, `-sSo/x`, `-uo x`): the
// first letter found in `value_flags` and the text glued after it, which is
// empty when the value is the next argument.
std::optional<std::pair<std::string, std::string>>
attached_short_value(const std::string &text, const std::unordered_set<std::string> &value_flags) {
  if (text.size() < 3 || text[0] != '-' || text[1] == '-') {
    return std::nullopt;
  }
  for (std::size_t i = 1; i < text.size(); ++i) {
    if (std::isalpha(static_cast<unsigned char>(text[i])) == 0) {
      return std::nullopt;
    }
    std::string flag = {'-', text[i]};
    if (value_flags.contains(flag)) {
      return std::make_pair(std::move(flag), text.substr(i + 1));
    }
  }
  return std::nullopt;
}

bool already_listed(const std::vector<PathCandidate> &out, const std::string &path) {
  return std::any_of(out.begin(), out.end(),
                     [&](const PathCandidate &candidate) { return candidate.path == path; });
}

void collect_redirections(const shell::CommandInvocation &invocation,
                          std::vector<PathCandidate> &out) {
  const auto &args = invocation.args;
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i].kind != TokenKind::Redirection || i + 1 >= args.size()) {
      continue;
    }
    const std::string &op = args[i].text;
    const Token &target = args[i + 1];
    ++i;
    if (op == "<<" || op == "<<-" || op == "<<<") {
      continue;
    }
    if ((op == ">&" || op == "<&") && is_fd_reference(target.text)) {
      continue;
    }
    auto candidate = make_candidate(target, invocation.name, PathRole::Redirect);
    if (op.back() == '<' && op.find('>') == std::string::npos) {
      candidate.access = FileAccess::Read;
    }
    out.push_back(std::move(candidate));
  }
}

std::vector<Token> operands_of(const std::vector<Token> &args) {
  std::vector<Token> out;
  bool options_done = false;
  for (const auto &token : args) {
    if (!options_done && token.kind == TokenKind::Flag) {
      options_done = token.text == "--";
      continue;
    }
    out.push_back(token);
  }
  return out;
}

void collect_copy_move(const shell::CommandInvocation &invocation, const std::vector<Token> &args,
                       std::vector<PathCandidate> &out) {
  std::optional<Token> target_dir;
  std::vector<Token> operands;
  bool options_done = false;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const Token &token = args[i];
    if (!options_done && token.kind == TokenKind::Flag) {
      if (token.text == "--") {
        options_done = true;
      } else if ((token.text == "-t" || token.text == "--target-directory") &&
                 i + 1 < args.size()) {
        target_dir = args[++i];
      } else if (common::starts_with(token.text, "--target-directory=")) {
        Token value = token;
        value.text = token.text.substr(19);
        target_dir = value;
      }
      continue;
    }
    operands.push_back(token);
  }

  if (target_dir.has_value()) {
    out.push_back(make_candidate(*target_dir, invocation.name, PathRole::Destination));
    for (const auto &source : operands) {
      out.push_back(make_candidate(source, invocation.name, PathRole::Source));
    }
    return;
  }
  if (operands.empty()) {
    return;
  }
  if (operands.size() == 1) {
    out.push_back(make_candidate(operands.front(), invocation.name, PathRole::Source));
    return;
  }
  for (std::size_t i = 0; i + 1 < operands.size(); ++i) {
    out.push_back(make_candidate(operands[i], invocation.name, PathRole::Source));
  }
  out.push_back(make_candidate(operands.back(), invocation.name, PathRole::Destination));
}

void collect_file_operands(const shell::CommandInvocation &invocation,
                           const std::vector<Token> &args, std::vector<PathCandidate> &out) {
  const std::string &name = invocation.name;
  static const std::unordered_map<std::string, PathRole> no_flags;
  const auto flags_it = file_value_flags().find(name);
  const auto &value_flags = flags_it != file_value_flags().end() ? flags_it->second : no_flags;
  const auto pattern_it = pattern_commands().find(name);
  const bool pattern_command = pattern_it != pattern_commands().end();

  std::unordered_set<std::string> short_flags;
  for (const auto &entry : value_flags) {
    if (entry.first.size() == 2) {
      short_flags.insert(entry.first);
    }
  }
  if (pattern_command) {
    for (const auto &flag : pattern_it->second) {
      if (flag.size() == 2) {
        short_flags.insert(flag);
      }
    }
  }

  bool skip_pattern = pattern_command;
  bool options_done = false;
  std::vector<Token> operands;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const Token &token = args[i];
    if (options_done || token.kind != TokenKind::Flag) {
      operands.push_back(token);
      continue;
    }
    if (token.text == "--") {
      options_done = true;
      continue;
    }

    const bool pattern_flag = pattern_command && pattern_it->second.contains(token.text);
    if (pattern_flag) {
      skip_pattern = false;
    }
    if (const auto role = value_flags.find(token.text); role != value_flags.end()) {
      if (i + 1 < args.size()) {
        out.push_back(make_candidate(args[++i], name, role->second));
      }
      continue;
    }
    // `-e PATTERN` and friends: the value is not a file.
    if (pattern_flag) {
      ++i;
      continue;
    }

    const auto eq = token.text.find('=');
    if (common::starts_with(token.text, "--") && eq != std::string::npos) {
      const std::string flag = token.text.substr(0, eq);
      const std::string value = token.text.substr(eq + 1);
      if (pattern_command && pattern_it->second.contains(flag)) {
        skip_pattern = false;
      }
      if (const auto role = value_flags.find(flag); role != value_flags.end()) {
        out.push_back(make_candidate(value, token, name, role->second));
      } else if (is_absolute_like(value) &&
                 !(pattern_command && pattern_it->second.contains(flag))) {
        out.push_back(make_candidate(value, token, name, PathRole::Operand));
      }
      continue;
    }

    if (const auto attached = attached_short_value(token.text, short_flags)) {
      const auto &[flag, value] = *attached;
      if (pattern_command && pattern_it->second.contains(flag)) {
        skip_pattern = false;
      }
      const auto role = value_flags.find(flag);
      if (value.empty() && i + 1 < args.size()) {
        ++i;
        if (role != value_flags.end()) {
          out.push_back(make_candidate(args[i], name, role->second));
        }
      } else if (!value.empty() && role != value_flags.end()) {
        out.push_back(make_candidate(value, token, name, role->second));
      }
    }
  }

  for (const auto &token : operands) {
    if (skip_pattern) {
      skip_pattern = false;
      continue;
    }
    out.push_back(make_candidate(token, name, PathRole::Operand));
  }
}

void collect_output_flags(const shell::CommandInvocation &invocation,
                          const std::vector<Token> &args,
                          const std::unordered_set<std::string> &flags,
                          std::vector<PathCandidate> &out) {
  std::unordered_set<std::string> short_flags;
  for (const auto &flag : flags) {
    if (flag.size() == 2) {
      short_flags.insert(flag);
    }
  }

  for (std::size_t i = 0; i < args.size(); ++i) {
    const Token &token = args[i];
    if (token.kind != TokenKind::Flag) {
      continue;
    }
    if (flags.contains(token.text)) {
      if (i + 1 < args.size()) {
        out.push_back(make_candidate(args[++i], invocation.name, PathRole::Output));
      }
      continue;
    }
    const auto eq = token.text.find('=');
    if (eq != std::string::npos && flags.contains(token.text.substr(0, eq))) {
      out.push_back(
          make_candidate(token.text.substr(eq + 1), token, invocation.name, PathRole::Output));
      continue;
    }
    if (const auto attached = attached_short_value(token.text, short_flags)) {
      const std::string &value = attached->second;
      if (value.empty() && i + 1 < args.size()) {
        out.push_back(make_candidate(args[++i], invocation.name, PathRole::Output));
      } else if (!value.empty()) {
        out.push_back(make_candidate(value, token, invocation.name, PathRole::Output));
      }
    }
  }
}

// `git clone <url> [<dest>]`
void collect_git_clone(const shell::CommandInvocation &invocation, const std::vector<Token> &args,
                       std::vector<PathCandidate> &out) {
  std::vector<Token> operands;
  bool after_clone = false;
  for (const auto &token : operands_of(args)) {
    if (!after_clone) {
      after_clone = token.text == "clone";
      continue;
    }
    operands.push_back(token);
  }
  if (operands.size() >= 2) {
    out.push_back(make_candidate(operands[1], invocation.name, PathRole::Output));
  }
}

// Returns false when the interpreter runs inline code instead of a file.
bool collect_script(const shell::CommandInvocation &invocation, const std::vector<Token> &args,
                    std::vector<PathCandidate> &out) {
  for (const auto &token : args) {
    if (token.kind == TokenKind::Flag) {
      if (inline_code_flags().contains(token.text)) {
        return false;
      }
      // `bash -ec '...'`
      if (token.text.size() > 2 && token.text[1] != '-' &&
          token.text.find('c') != std::string::npos &&
          (invocation.name == "bash" || invocation.name == "sh" || invocation.name == "zsh" ||
           invocation.name == "dash")) {
        return false;
      }
      continue;
    }
    if (is_path_like(token.text)) {
      out.push_back(make_candidate(token, invocation.name, PathRole::Script));
    }
    return true;
  }
  return true;
}

// Arguments of commands without a dedicated rule that name an absolute or
// home-relative path, bare or as a `--flag=value` value.
void collect_absolute_arguments(const shell::CommandInvocation &invocation,
                                const std::vector<Token> &args, std::vector<PathCandidate> &out) {
  for (const auto &token : args) {
    std::string value = token.text;
    if (token.kind == TokenKind::Flag) {
      const auto eq = token.text.find('=');
      if (!common::starts_with(token.text, "--") || eq == std::string::npos) {
        continue;
      }
      value = token.text.substr(eq + 1);
    } else if (token.kind != TokenKind::Word) {
      continue;
    }
    if (is_absolute_like(value) && !already_listed(out, value)) {
      out.push_back(make_candidate(value, token, invocation.name, PathRole::Operand));
    }
  }
}

} // namespace

const char *path_role_name(PathRole role) {
  switch (role) {
  case PathRole::Operand:
    return "operand";
  case PathRole::Source:
    return "source";
  case PathRole::Destination:
    return "destination";
  case PathRole::Output:
    return "output";
  case PathRole::Script:
    return "script";
  case PathRole::Redirect:
    return "redirect";
  }
  return "unknown";
}

bool is_file_operation_command(const std::string &name) {
  return file_operation_commands().contains(name);
}

std::vector<PathCandidate> extract_path_candidates(const shell::CommandInvocation &invocation) {
  std::vector<PathCandidate> out;
  const auto args = shell::argument_tokens(invocation);
  const std::string &name = invocation.name;

  if (name == "cp" || name == "mv") {
    collect_copy_move(invocation, args, out);
  } else if (is_file_operation_command(name)) {
    collect_file_operands(invocation, args, out);
  } else if (const auto it = output_flags().find(name); it != output_flags().end()) {
    collect_output_flags(invocation, args, it->second, out);
    if (name == "git") {
      collect_git_clone(invocation, args, out);
    }
    collect_absolute_arguments(invocation, args, out);
  } else if (script_commands().contains(name)) {
    if (collect_script(invocation, args, out)) {
      collect_absolute_arguments(invocation, args, out);
    }
  } else {
    collect_absolute_arguments(invocation, args, out);
  }

  collect_redirections(invocation, out);
  return out;
}

} // namespace shellgate::security
