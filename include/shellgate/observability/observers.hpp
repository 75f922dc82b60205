#pragma once

#include "shellgate/config/schema.hpp"
#include "shellgate/observability/observer.hpp"

#include <memory>
#include <vector>

namespace shellgate::observability {

class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  void record_metric(const ObserverMetric &) override {}
  [[nodiscard]] std::string_view name() const override { return "noop"; }
};

/// Forwards every record to each child in the order they were added.
class MultiObserver final : public IObserver {
public:
  void add(std::unique_ptr<IObserver> observer);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }
  [[nodiscard]] std::size_t size() const { return observers_.size(); }

private:
  std::vector<std::unique_ptr<IObserver>> observers_;
};

/// Builds the observer named by `observability.backend`: `log`, `none`/`noop`, or a
/// comma list of those. Repeated names collapse to one child; a list naming a
/// single backend yields that backend directly.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace shellgate::observability
