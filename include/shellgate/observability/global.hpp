#pragma once

#include "shellgate/observability/observer.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace shellgate::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
[[nodiscard]] bool has_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);
void flush_global_observer();

void record_decision(const std::string &tool, const std::string &command, bool allowed,
                     const std::string &kind, const std::string &stage,
                     const std::string &reason);
void record_policy_loaded(const std::string &source, const std::string &fingerprint,
                          std::size_t allowed_commands);
void record_evaluation_latency(std::chrono::microseconds latency);
void record_commands_inspected(std::uint64_t count);
void record_error(const std::string &component, const std::string &message);

} // namespace shellgate::observability
