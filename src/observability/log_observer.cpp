#include "runclaw/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace runclaw::observability {

LogObserver::LogObserver(const LogLevel min_level) : LogObserver(min_level, std::cerr) {}

LogObserver::LogObserver(const LogLevel min_level, std::ostream &out)
    : min_level_(min_level), out_(out) {}

void LogObserver::log_line(const LogLevel level, const std::string &message) {
  if (static_cast<int>(level) < static_cast<int>(min_level_)) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << "[" << log_level_name(level) << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, SchedulerStartEvent>) {
          log_line(LogLevel::Info,
                   "scheduler.start poll_interval_ms=" + std::to_string(evt.poll_interval.count()) +
                       " max_concurrent=" + std::to_string(evt.max_concurrent));
        } else if constexpr (std::is_same_v<T, SchedulerStopEvent>) {
          log_line(LogLevel::Info, "scheduler.stop");
        } else if constexpr (std::is_same_v<T, SchedulerTickEvent>) {
          log_line(evt.due_tasks == 0 ? LogLevel::Debug : LogLevel::Info,
                   "scheduler.tick due=" + std::to_string(evt.due_tasks));
        } else if constexpr (std::is_same_v<T, TickCompletedEvent>) {
          log_line(evt.failed + evt.infrastructure_failures == 0 ? LogLevel::Info : LogLevel::Warn,
                   "scheduler.tick_done due=" + std::to_string(evt.due) +
                       " dispatched=" + std::to_string(evt.dispatched) +
                       " succeeded=" + std::to_string(evt.succeeded) +
                       " failed=" + std::to_string(evt.failed) +
                       " skipped=" + std::to_string(evt.skipped) +
                       " infrastructure_failures=" + std::to_string(evt.infrastructure_failures));
        } else if constexpr (std::is_same_v<T, TaskSkippedEvent>) {
          log_line(LogLevel::Info, "task.skipped id=" + evt.task_id + " reason=" + evt.reason);
        } else if constexpr (std::is_same_v<T, TaskRunEvent>) {
          log_line(evt.status == "success" ? LogLevel::Info : LogLevel::Warn,
                   "task.run id=" + evt.task_id + " status=" + evt.status +
                       " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, TaskRescheduledEvent>) {
          log_line(LogLevel::Debug,
                   "task.rescheduled id=" + evt.task_id + " next_run=" + evt.next_run);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(LogLevel::Error, evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, InFlightTasksMetric>) {
          log_line(LogLevel::Debug, "metric.in_flight_tasks=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, RunDurationMetric>) {
          log_line(LogLevel::Debug, "metric.run_duration_ms=" + std::to_string(m.duration.count()));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_.flush();
}

} // namespace runclaw::observability
