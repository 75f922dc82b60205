#include "shellgate/observability/log_observer.hpp"

#include "shellgate/common/fs.hpp"

#include <iostream>
#include <type_traits>

namespace shellgate::observability {

namespace {

// Keeps one event per line.
std::string single_line(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (const char ch : text) {
    if (ch == '\n') {
      out += "\\n";
    } else if (ch == '\r') {
      out += "\\r";
    } else {
      out.push_back(ch);
    }
  }
  return out;
}

} // namespace

LogLevel parse_log_level(const std::string &value) {
  const std::string level = common::to_lower(common::trim(value));
  if (level == "debug") {
    return LogLevel::Debug;
  }
  if (level == "warn" || level == "warning") {
    return LogLevel::Warn;
  }
  if (level == "error") {
    return LogLevel::Error;
  }
  return LogLevel::Info;
}

const char *log_level_name(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

LogObserver::LogObserver(LogLevel min_level) : LogObserver(min_level, std::cerr) {}

LogObserver::LogObserver(LogLevel min_level, std::ostream &out)
    : min_level_(min_level), out_(&out) {}

void LogObserver::log_line(LogLevel level, const std::string &message) {
  if (static_cast<int>(level) < static_cast<int>(min_level_)) {
    return;
  }
  *out_ << "[" << log_level_name(level) << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, DecisionEvent>) {
          if (evt.allowed) {
            log_line(LogLevel::Debug,
                     "hook.allow tool=" + evt.tool + " command=" + single_line(evt.command));
          } else {
            log_line(LogLevel::Warn, "hook.block tool=" + evt.tool + " kind=" + evt.kind +
                                         " stage=" + evt.stage +
                                         " reason=" + single_line(evt.reason));
          }
        } else if constexpr (std::is_same_v<T, PolicyLoadedEvent>) {
          log_line(LogLevel::Debug, "policy.loaded source=" + evt.source +
                                        " fingerprint=" + evt.fingerprint +
                                        " allowed=" + std::to_string(evt.allowed_commands));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(LogLevel::Error, evt.component + ": " + single_line(evt.message));
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, EvaluationLatencyMetric>) {
          log_line(LogLevel::Debug, "metric.evaluation_latency_us=" +
                                        std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, CommandsInspectedMetric>) {
          log_line(LogLevel::Debug, "metric.commands_inspected=" + std::to_string(m.count));
        }
      },
      metric);
}

void LogObserver::flush() { out_->flush(); }

} // namespace shellgate::observability
