#include "shellgate/observability/global.hpp"

#include <mutex>

namespace shellgate::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

bool has_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer != nullptr;
}

// The lock is held across the call so a concurrent set_global_observer
// cannot destroy the observer mid-record.
void record_event(const ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->record_metric(metric);
  }
}

void flush_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->flush();
  }
}

void record_decision(const std::string &tool, const std::string &command, const bool allowed,
                     const std::string &kind, const std::string &stage,
                     const std::string &reason) {
  record_event(DecisionEvent{.tool = tool,
                             .command = command,
                             .allowed = allowed,
                             .kind = kind,
                             .stage = stage,
                             .reason = reason});
}

void record_policy_loaded(const std::string &source, const std::string &fingerprint,
                          const std::size_t allowed_commands) {
  record_event(PolicyLoadedEvent{
      .source = source, .fingerprint = fingerprint, .allowed_commands = allowed_commands});
}

void record_evaluation_latency(std::chrono::microseconds latency) {
  record_metric(EvaluationLatencyMetric{.latency = latency});
}

void record_commands_inspected(const std::uint64_t count) {
  record_metric(CommandsInspectedMetric{.count = count});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace shellgate::observability
