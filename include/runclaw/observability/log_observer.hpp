#pragma once

#include "runclaw/observability/observer.hpp"

#include <iosfwd>
#include <mutex>

namespace runclaw::observability {

/// Writes one `[LEVEL] message` line per event to a stream (stderr by default).
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
  std::ostream &out_;
  std::mutex mutex_;
};

} // namespace runclaw::observability
