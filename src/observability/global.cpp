#include "runclaw/observability/global.hpp"

#include <mutex>

namespace runclaw::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

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

void record_scheduler_start(std::chrono::milliseconds poll_interval,
                            const std::size_t max_concurrent) {
  record_event(SchedulerStartEvent{.poll_interval = poll_interval, .max_concurrent = max_concurrent});
}

void record_scheduler_stop() { record_event(SchedulerStopEvent{}); }

void record_scheduler_tick(const std::size_t due_tasks) {
  record_event(SchedulerTickEvent{.due_tasks = due_tasks});
}

void record_tick_completed(const TickCompletedEvent &summary) { record_event(summary); }

void record_task_skipped(const std::string &task_id, const std::string &reason) {
  record_event(TaskSkippedEvent{.task_id = task_id, .reason = reason});
}

void record_task_run(const std::string &task_id, const std::string &status,
                     std::chrono::milliseconds duration) {
  record_event(TaskRunEvent{.task_id = task_id, .status = status, .duration = duration});
  record_metric(RunDurationMetric{.duration = duration});
}

void record_task_rescheduled(const std::string &task_id, const std::string &next_run) {
  record_event(TaskRescheduledEvent{.task_id = task_id, .next_run = next_run});
}

void record_in_flight(const std::uint64_t count) {
  record_metric(InFlightTasksMetric{.count = count});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace runclaw::observability
