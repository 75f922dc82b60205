#include "shellgate/observability/observers.hpp"

#include "shellgate/common/fs.hpp"
#include "shellgate/observability/log_observer.hpp"

#include <algorithm>
#include <sstream>

namespace shellgate::observability {

namespace {

std::string canonical_backend(const std::string &name) {
  return name == "none" ? "noop" : name;
}

std::unique_ptr<IObserver> create_single(const std::string &backend, LogLevel level) {
  if (backend == "noop") {
    return std::make_unique<NoopObserver>();
  }
  return std::make_unique<LogObserver>(level);
}

std::vector<std::string> backend_names(const std::string &backend) {
  std::vector<std::string> names;
  std::stringstream stream(backend);
  std::string part;
  while (std::getline(stream, part, ',')) {
    const std::string name = canonical_backend(common::trim(part));
    if (!name.empty() && std::find(names.begin(), names.end(), name) == names.end()) {
      names.push_back(name);
    }
  }
  return names;
}

} // namespace

void MultiObserver::add(std::unique_ptr<IObserver> observer) {
  if (observer != nullptr) {
    observers_.push_back(std::move(observer));
  }
}

void MultiObserver::record_event(const ObserverEvent &event) {
  for (auto &observer : observers_) {
    observer->record_event(event);
  }
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  for (auto &observer : observers_) {
    observer->record_metric(metric);
  }
}

void MultiObserver::flush() {
  for (auto &observer : observers_) {
    observer->flush();
  }
}

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const LogLevel level = parse_log_level(config.observability.log_level);
  const auto names = backend_names(common::to_lower(config.observability.backend));
  if (names.empty()) {
    return std::make_unique<NoopObserver>();
  }
  if (names.size() == 1) {
    return create_single(names.front(), level);
  }

  auto multi = std::make_unique<MultiObserver>();
  for (const auto &name : names) {
    multi->add(create_single(name, level));
  }
  return multi;
}

} // namespace shellgate::observability
