#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace runclaw::observability {

enum class LogLevel { Debug, Info, Warn, Error };

[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view value);
[[nodiscard]] std::string_view log_level_name(LogLevel level);

struct SchedulerStartEvent {
  std::chrono::milliseconds poll_interval{0};
  std::size_t max_concurrent = 0;
};

struct SchedulerStopEvent {};

struct SchedulerTickEvent {
  std::size_t due_tasks = 0;
};

/// Outcome counts of one tick that found due tasks.
struct TickCompletedEvent {
  std::size_t due = 0;
  std::size_t dispatched = 0;
  std::size_t succeeded = 0;
  std::size_t failed = 0;
  std::size_t skipped = 0;
  std::size_t infrastructure_failures = 0;
};

struct TaskSkippedEvent {
  std::string task_id;
  std::string reason;
};

struct TaskRunEvent {
  std::string task_id;
  std::string status;
  std::chrono::milliseconds duration{0};
};

struct TaskRescheduledEvent {
  std::string task_id;
  std::string next_run;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<SchedulerStartEvent, SchedulerStopEvent, SchedulerTickEvent, TickCompletedEvent,
                 TaskSkippedEvent, TaskRunEvent, TaskRescheduledEvent, ErrorEvent>;

struct InFlightTasksMetric {
  std::uint64_t count = 0;
};

struct RunDurationMetric {
  std::chrono::milliseconds duration{0};
};

using ObserverMetric = std::variant<InFlightTasksMetric, RunDurationMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace runclaw::observability
