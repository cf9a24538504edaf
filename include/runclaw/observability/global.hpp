#pragma once

#include "runclaw/observability/observer.hpp"

#include <memory>

namespace runclaw::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_scheduler_start(std::chrono::milliseconds poll_interval, std::size_t max_concurrent);
void record_scheduler_stop();
void record_scheduler_tick(std::size_t due_tasks);
void record_tick_completed(const TickCompletedEvent &summary);
void record_task_skipped(const std::string &task_id, const std::string &reason);
void record_task_run(const std::string &task_id, const std::string &status,
                     std::chrono::milliseconds duration);
void record_task_rescheduled(const std::string &task_id, const std::string &next_run);
void record_in_flight(std::uint64_t count);
void record_error(const std::string &component, const std::string &message);

} // namespace runclaw::observability
