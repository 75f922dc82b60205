#pragma once

#include "shellgate/observability/observer.hpp"

#include <iosfwd>
#include <string>

namespace shellgate::observability {

enum class LogLevel { Debug, Info, Warn, Error };

[[nodiscard]] LogLevel parse_log_level(const std::string &value);
[[nodiscard]] const char *log_level_name(LogLevel level);

/// Writes `[LEVEL] message` lines to stderr (or `out`). stdout is reserved
/// for the hook protocol.
class LogObserver final : public IObserver {
public:
  explicit LogObserver(LogLevel min_level = LogLevel::Info);
  LogObserver(LogLevel min_level, std::ostream &out);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void log_line(LogLevel level, const std::string &message);

  LogLevel min_level_;
  std::ostream *out_;
};

} // namespace shellgate::observability
