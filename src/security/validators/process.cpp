#include "shellgate/security/validators/process.hpp"

#include "shellgate/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>

namespace shellgate::security::validators {

namespace {

const std::unordered_set<std::string> &allowed_signals() {
  static const std::unordered_set<std::string> signals = {
      "TERM", "KILL", "INT", "HUP", "USR1", "USR2", "QUIT", "STOP", "CONT",
      "15",   "9",    "2",   "1",   "10",   "12",   "3",    "19",   "18"};
  return signals;
}

std::string to_upper(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return value;
}

std::string join_sorted(std::vector<std::string> values) {
  std::sort(values.begin(), values.end());
  std::string out;
  for (const auto &value : values) {
    if (!out.empty()) {
      out += ", ";
    }
    out += value;
  }
  return out;
}

// Accepts what the kill builtin accepts: surrounding blanks and one sign.
std::optional<long long> parse_pid(const std::string &text) {
  std::string digits = common::trim(text);
  if (digits.size() > 1 && digits.front() == '+' &&
      std::isdigit(static_cast<unsigned char>(digits[1])) != 0) {
    digits.erase(0, 1);
  }
  if (digits.empty()) {
    return std::nullopt;
  }
  long long value = 0;
  const auto *first = digits.data();
  const auto *last = first + digits.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return value;
}

} // namespace

bool is_allowed_signal(const std::string &signal) {
  std::string normalized = to_upper(signal);
  if (common::starts_with(normalized, "SIG")) {
    normalized = normalized.substr(3);
  }
  return allowed_signals().contains(normalized);
}

TerminateByNameValidator::TerminateByNameValidator(std::vector<std::string> allowed_processes)
    : allowed_processes_(std::move(allowed_processes)) {}

common::Status TerminateByNameValidator::validate(const shell::CommandInvocation &invocation) const {
  std::vector<std::string> operands;
  for (const auto &token : shell::argument_tokens(invocation)) {
    if (token.kind != shell::TokenKind::Flag) {
      operands.push_back(token.text);
    }
  }
  if (operands.empty()) {
    return common::Status::error("pkill requires a process name");
  }

  std::string target = operands.back();
  // `pkill -f 'node server.js'` matches on the first word of the pattern.
  if (const auto space = target.find(' '); space != std::string::npos) {
    target = target.substr(0, space);
  }

  if (std::find(allowed_processes_.begin(), allowed_processes_.end(), target) !=
      allowed_processes_.end()) {
    return common::Status::success();
  }
  return common::Status::error("pkill only allowed for dev processes: " +
                               join_sorted(allowed_processes_));
}

common::Status SignalSendValidator::validate(const shell::CommandInvocation &invocation) const {
  const auto args = shell::argument_tokens(invocation);
  std::optional<std::string> signal;
  std::vector<std::string> pids;
  bool options_done = false;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string &text = args[i].text;
    const bool dashed = text.size() > 1 && text[0] == '-';
    if (options_done || !dashed || signal.has_value()) {
      pids.push_back(text);
      continue;
    }
    if (text == "-l" || text == "-L" || text == "--list" || text == "--table") {
      return common::Status::success();
    }
    if (text == "--") {
      options_done = true;
      continue;
    }
    if (text == "-s" || text == "-n" || text == "--signal") {
      if (i + 1 >= args.size()) {
        return common::Status::error("kill " + text + " requires a signal");
      }
      signal = args[++i].text;
      continue;
    }
    if (common::starts_with(text, "--signal=")) {
      signal = text.substr(9);
      continue;
    }
    signal = text.substr(1);
  }

  if (pids.empty()) {
    return common::Status::error("kill requires at least one PID");
  }
  if (signal.has_value() && !is_allowed_signal(*signal)) {
    return common::Status::error("kill blocked: signal '" + to_upper(*signal) +
                                 "' not in allowed signals: CONT, HUP, INT, KILL, QUIT, STOP, "
                                 "TERM, USR1, USR2");
  }

  for (const auto &pid : pids) {
    if (common::starts_with(pid, "%")) {
      continue;
    }
    const auto value = parse_pid(pid);
    // Unresolved values such as $PID cannot be checked here.
    if (!value.has_value()) {
      continue;
    }
    if (*value == 1) {
      return common::Status::error("kill blocked: cannot kill PID 1 (init)");
    }
    if (*value < 0) {
      return common::Status::error("kill blocked: negative PID (process group) not allowed: " +
                                   pid);
    }
    if (*value < 100) {
      return common::Status::error("kill blocked: system process PID not allowed: " + pid);
    }
  }
  return common::Status::success();
}

} // namespace shellgate::security::validators
