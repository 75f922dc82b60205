#include "shellgate/shell/command_extractor.hpp"

#include "shellgate/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <unordered_map>

namespace shellgate::shell {

namespace {

struct WrapperSpec {
  std::unordered_set<std::string> value_options;
  std::unordered_set<std::string> script_options;
  std::size_t leading_operands = 0;
};

const std::unordered_map<std::string, WrapperSpec> &wrapper_specs() {
  static const std::unordered_map<std::string, WrapperSpec> specs = {
      {"env", {.value_options = {"-u", "--unset", "-C", "--chdir"},
               .script_options = {"-S", "--split-string"}}},
      {"xargs", {.value_options = {"-I", "-n", "-P", "-L", "-s", "-d", "-E", "-a", "--max-args",
                                   "--max-procs", "--max-lines", "--delimiter", "--arg-file",
                                   "--replace", "--eof", "--max-chars",
                                   "--process-slot-var"}}},
      {"timeout", {.value_options = {"-s", "--signal", "-k", "--kill-after"},
                   .leading_operands = 1}},
      {"nice", {.value_options = {"-n", "--adjustment"}}},
      {"time", {.value_options = {"-f", "--format", "-o", "--output"}}},
      {"exec", {.value_options = {"-a"}}},
      {"stdbuf", {.value_options = {"-i", "-o", "-e", "--input", "--output", "--error"}}},
  };
  return specs;
}

const std::unordered_set<std::string> &reset_keywords() {
  static const std::unordered_set<std::string> keywords = {
      "if", "then", "else", "elif", "fi", "while", "until", "do", "done", "esac", "!", "{", "}"};
  return keywords;
}

const std::unordered_set<std::string> &find_exec_flags() {
  static const std::unordered_set<std::string> flags = {"-exec", "-execdir", "-ok", "-okdir"};
  return flags;
}

bool is_dynamic_word(const Token &token) {
  return token.has_expansion || token.text.find('`') != std::string::npos;
}

// `-c`, `-ec`, `-xc`: short option clusters that end the shell's options with a script.
bool takes_inline_script(const Token &token) {
  const std::string &text = token.text;
  if (text.size() < 2 || text[0] != '-' || text[1] == '-') {
    return false;
  }
  for (std::size_t i = 1; i < text.size(); ++i) {
    if (std::isalpha(static_cast<unsigned char>(text[i])) == 0) {
      return false;
    }
  }
  return text.find('c') != std::string::npos;
}

class Walker {
public:
  Walker(const Segment &segment, const ExtractorOptions &options, std::size_t depth)
      : segment_(segment), options_(options), depth_(depth) {}

  common::Result<Extraction> run() {
    for (const auto &token : segment_.tokens) {
      if (auto status = step(token); !status.ok()) {
        return common::Result<Extraction>::failure(status.error());
      }
    }
    if (auto status = end_stage(); !status.ok()) {
      return common::Result<Extraction>::failure(status.error());
    }
    for (auto &command : extraction_.commands) {
      command.text = stage_text(command);
    }
    return common::Result<Extraction>::success(std::move(extraction_));
  }

private:
  struct WrapperState {
    const WrapperSpec *spec = nullptr;
    std::size_t operands_left = 0;
    bool value_next = false;
    bool script_next = false;
  };

  common::Status step(const Token &token) {
    if (redirect_target_next_) {
      if (token.kind == TokenKind::Operator || token.kind == TokenKind::Redirection) {
        return common::Status::error("redirection is missing its target");
      }
      redirect_target_next_ = false;
      attach(token);
      return common::Status::success();
    }

    if (token.kind == TokenKind::Redirection) {
      attach(token);
      redirect_target_next_ = true;
      return common::Status::success();
    }

    if (token.kind == TokenKind::Operator) {
      if (token.text == ")" && case_pattern_) {
        case_pattern_ = false;
        expect_command_ = true;
        current_.reset();
        return common::Status::success();
      }
      if (auto status = end_stage(); !status.ok()) {
        return status;
      }
      if (token.text == "(" && case_pattern_) {
        return common::Status::success();
      }
      expect_command_ = true;
      if (case_depth_ > 0 && (token.text == ";;" || token.text == ";&")) {
        case_pattern_ = true;
        expect_command_ = false;
      }
      return common::Status::success();
    }

    if (skip_next_) {
      skip_next_ = false;
      attach(token);
      return common::Status::success();
    }

    if (script_next_) {
      script_next_ = false;
      attach(token);
      extraction_.inline_scripts.push_back(token.text);
      return common::Status::success();
    }

    if (wrapper_ && handle_wrapper_argument(token)) {
      return common::Status::success();
    }

    if (case_pattern_) {
      if (token.kind == TokenKind::Word && !token.quoted && token.text == "esac") {
        close_case();
      }
      return common::Status::success();
    }

    if (!expect_command_) {
      return handle_argument(token);
    }

    if (token.kind == TokenKind::Assignment || token.kind == TokenKind::Flag) {
      attach(token);
      return common::Status::success();
    }

    if (!token.quoted && handle_keyword(token)) {
      return common::Status::success();
    }

    start_command(token);
    return common::Status::success();
  }

  bool handle_keyword(const Token &token) {
    const std::string &word = token.text;
    if (word == "esac") {
      close_case();
      return true;
    }
    if (reset_keywords().contains(word)) {
      current_.reset();
      expect_command_ = true;
      return true;
    }
    if (word == "for" || word == "select") {
      current_.reset();
      skip_next_ = true;
      expect_command_ = false;
      return true;
    }
    if (word == "function") {
      current_.reset();
      skip_next_ = true;
      return true;
    }
    if (word == "case") {
      current_.reset();
      skip_next_ = true;
      expect_command_ = false;
      case_header_ = true;
      ++case_depth_;
      return true;
    }
    return false;
  }

  void close_case() {
    if (case_depth_ > 0) {
      --case_depth_;
    }
    case_pattern_ = false;
    current_.reset();
    expect_command_ = true;
  }

  common::Status handle_argument(const Token &token) {
    if (case_header_ && !current_ && token.text == "in" && !token.quoted) {
      case_header_ = false;
      case_pattern_ = true;
      return common::Status::success();
    }

    attach(token);
    if (!current_) {
      return common::Status::success();
    }

    const auto &command = extraction_.commands[*current_];
    if (exec_parent_ && (token.text == ";" || token.text == "+") &&
        token.kind == TokenKind::Word) {
      extraction_.commands[*current_].args.pop_back();
      current_ = exec_parent_;
      exec_parent_.reset();
      attach(token);
      return common::Status::success();
    }
    if (command.name == "find" && token.kind == TokenKind::Flag &&
        find_exec_flags().contains(token.text)) {
      exec_parent_ = current_;
      expect_command_ = true;
      return common::Status::success();
    }
    if (options_.shell_interpreters.contains(command.name) && token.kind == TokenKind::Flag &&
        takes_inline_script(token)) {
      script_next_ = true;
    }
    return common::Status::success();
  }

  // Returns true while the token still belongs to the wrapper's own options.
  bool handle_wrapper_argument(const Token &token) {
    auto &state = *wrapper_;
    if (state.value_next) {
      state.value_next = false;
      attach(token);
      return true;
    }
    if (state.script_next) {
      state.script_next = false;
      attach(token);
      extraction_.inline_scripts.push_back(token.text);
      return true;
    }
    if (token.kind == TokenKind::Flag) {
      attach(token);
      if (state.spec != nullptr && state.spec->value_options.contains(token.text)) {
        state.value_next = true;
      } else if (state.spec != nullptr && state.spec->script_options.contains(token.text)) {
        state.script_next = true;
      }
      return true;
    }
    if (token.kind == TokenKind::Assignment) {
      attach(token);
      return true;
    }
    if (state.operands_left > 0) {
      --state.operands_left;
      attach(token);
      return true;
    }
    wrapper_.reset();
    return false;
  }

  void start_command(const Token &token) {
    CommandInvocation invocation;
    invocation.name = is_dynamic_word(token) ? token.raw : common::basename_of(token.text);
    invocation.command = token;
    invocation.depth = depth_;
    invocation.args = std::move(pending_);
    pending_.clear();
    extraction_.commands.push_back(std::move(invocation));
    current_ = extraction_.commands.size() - 1;
    expect_command_ = false;

    const std::string &name = extraction_.commands.back().name;
    if (options_.wrapper_commands.contains(name)) {
      const auto &specs = wrapper_specs();
      const auto it = specs.find(name);
      WrapperState state;
      if (it != specs.end()) {
        state.spec = &it->second;
        state.operands_left = it->second.leading_operands;
      }
      wrapper_ = state;
      expect_command_ = true;
    }
  }

  void attach(const Token &token) {
    if (current_) {
      extraction_.commands[*current_].args.push_back(token);
    } else {
      pending_.push_back(token);
    }
  }

  common::Status end_stage() {
    if (redirect_target_next_) {
      return common::Status::error("redirection is missing its target");
    }
    for (const auto &token : pending_) {
      if (token.kind == TokenKind::Redirection) {
        return common::Status::error("redirection '" + token.raw + "' has no command");
      }
    }
    pending_.clear();
    current_.reset();
    exec_parent_.reset();
    wrapper_.reset();
    skip_next_ = false;
    script_next_ = false;
    return common::Status::success();
  }

  std::string stage_text(const CommandInvocation &command) const {
    std::size_t begin = command.command.begin;
    std::size_t end = command.command.end;
    for (const auto &arg : command.args) {
      begin = std::min(begin, arg.begin);
      end = std::max(end, arg.end);
    }
    if (begin < segment_.offset) {
      return command.command.raw;
    }
    return segment_.text.substr(begin - segment_.offset, end - begin);
  }

  const Segment &segment_;
  const ExtractorOptions &options_;
  std::size_t depth_;
  Extraction extraction_;
  std::vector<Token> pending_;
  std::optional<std::size_t> current_;
  std::optional<std::size_t> exec_parent_;
  std::optional<WrapperState> wrapper_;
  bool expect_command_ = true;
  bool skip_next_ = false;
  bool script_next_ = false;
  bool redirect_target_next_ = false;
  bool case_header_ = false;
  bool case_pattern_ = false;
  std::size_t case_depth_ = 0;
};

} // namespace

ExtractorOptions default_extractor_options() {
  return ExtractorOptions{
      .wrapper_commands = {"nohup", "env", "xargs", "timeout", "nice", "time", "exec", "command",
                           "builtin", "stdbuf"},
      .shell_interpreters = {"sh", "bash", "zsh", "dash"},
  };
}

std::vector<Token> argument_tokens(const CommandInvocation &invocation) {
  std::vector<Token> out;
  bool skip_target = false;
  for (const auto &token : invocation.args) {
    if (skip_target) {
      skip_target = false;
      continue;
    }
    if (token.kind == TokenKind::Redirection) {
      skip_target = true;
      continue;
    }
    if (token.begin < invocation.command.begin) {
      continue;
    }
    out.push_back(token);
  }
  return out;
}

common::Result<Extraction> extract_commands(const Segment &segment,
                                            const ExtractorOptions &options, std::size_t depth) {
  return Walker(segment, options, depth).run();
}

common::Result<std::vector<std::string>> extract_command_names(const Segment &segment,
                                                               const ExtractorOptions &options) {
  auto extraction = extract_commands(segment, options);
  if (!extraction.ok()) {
    return common::Result<std::vector<std::string>>::failure(extraction.error());
  }
  std::vector<std::string> names;
  for (const auto &command : extraction.value().commands) {
    names.push_back(command.name);
  }
  return common::Result<std::vector<std::string>>::success(std::move(names));
}

} // namespace shellgate::shell
