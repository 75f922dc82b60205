#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace shellgate::observability {

struct DecisionEvent {
  std::string tool;
  std::string command;
  bool allowed = true;
  std::string kind;
  std::string stage;
  std::string reason;
};

struct PolicyLoadedEvent {
  std::string source;
  std::string fingerprint;
  std::size_t allowed_commands = 0;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<DecisionEvent, PolicyLoadedEvent, ErrorEvent>;

struct EvaluationLatencyMetric {
  std::chrono::microseconds latency{0};
};

struct CommandsInspectedMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<EvaluationLatencyMetric, CommandsInspectedMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace shellgate::observability
