#include "runclaw/scheduler/scheduler.hpp"

#include "runclaw/observability/global.hpp"
#include "runclaw/schedule/calculator.hpp"

#include <algorithm>
#include <exception>
#include <system_error>
#include <vector>

namespace runclaw::scheduler {

namespace {

constexpr std::chrono::milliseconds kMinPollInterval{1};

std::string status_name(const store::TaskStatus status) {
  return std::string(store::to_string(status));
}

void report_unrecorded_fault(const std::string &task_id, const char *reason) noexcept {
  try {
    observability::record_error("scheduler",
                                "fault of task " + task_id + " was not recorded: " + reason);
  } catch (const std::exception &) {
    // out of memory while logging; the tick still counts the task as failed
  }
}

} // namespace

std::string_view to_string(const SchedulerState state) {
  switch (state) {
  case SchedulerState::Idle:
    return "idle";
  case SchedulerState::Polling:
    return "polling";
  case SchedulerState::Dispatching:
    return "dispatching";
  case SchedulerState::ShuttingDown:
    return "shutting_down";
  }
  return "idle";
}

SchedulerOptions options_from_config(const config::SchedulerConfig &config) {
  SchedulerOptions options;
  options.poll_interval = std::chrono::seconds(config.poll_interval_secs);
  options.task_timeout = std::chrono::seconds(config.task_timeout_secs);
  options.max_concurrent = std::max<std::size_t>(1, config.max_concurrent_tasks);
  options.poll_on_start = config.poll_on_start;
  return options;
}

DispatchSlots::DispatchSlots(const std::size_t capacity) : capacity_(std::max<std::size_t>(1, capacity)) {}

void DispatchSlots::acquire() {
  std::unique_lock<std::mutex> lock(mutex_);
  released_.wait(lock, [this] { return in_flight_ < capacity_; });
  ++in_flight_;
}

void DispatchSlots::release() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (in_flight_ > 0) {
      --in_flight_;
    }
  }
  released_.notify_one();
}

std::size_t DispatchSlots::in_flight() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return in_flight_;
}

Scheduler::Scheduler(store::ITaskStore &store, runner::IExecutionRunner &runner,
                     SchedulerOptions options, Clock clock)
    : store_(store), runner_(runner), options_(options), clock_(std::move(clock)),
      slots_(options.max_concurrent) {
  if (!clock_) {
    clock_ = [] { return std::chrono::system_clock::now(); };
  }
  options_.max_concurrent = slots_.capacity();
  options_.poll_interval = std::max(options_.poll_interval, kMinPollInterval);
}

Scheduler::~Scheduler() { stop(); }

void Scheduler::start() {
  if (running_) {
    return;
  }
  if (thread_.joinable()) {
    thread_.join();
  }
  stopping_ = false;
  running_ = true;
  set_state(SchedulerState::Idle);
  thread_ = std::thread([this]() { run_loop(); });
}

void Scheduler::stop() {
  {
    std::lock_guard<std::mutex> lock(wake_mutex_);
    stopping_ = true;
    running_ = false;
  }
  wake_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
  set_state(SchedulerState::ShuttingDown);
}

bool Scheduler::is_running() const { return running_; }

SchedulerState Scheduler::state() const { return state_.load(); }

void Scheduler::set_state(const SchedulerState state) {
  if (stopping_ && state != SchedulerState::ShuttingDown) {
    state_ = SchedulerState::ShuttingDown;
    return;
  }
  state_ = state;
}

void Scheduler::run_loop() {
  observability::record_scheduler_start(options_.poll_interval, options_.max_concurrent);

  const auto interval = options_.poll_interval;
  auto next_tick = std::chrono::steady_clock::now();
  if (!options_.poll_on_start) {
    next_tick += interval;
  }

  while (running_) {
    {
      std::unique_lock<std::mutex> lock(wake_mutex_);
      wake_.wait_until(lock, next_tick, [this] { return !running_.load(); });
    }
    if (!running_) {
      break;
    }

    try {
      (void)poll_once();
    } catch (const std::exception &ex) {
      observability::record_error("scheduler", std::string("tick failed: ") + ex.what());
      set_state(SchedulerState::Idle);
    }

    // Missed boundaries are skipped; the next tick lands on the next one still ahead.
    const auto now = std::chrono::steady_clock::now();
    next_tick += interval;
    if (next_tick <= now) {
      const auto behind = (now - next_tick) / interval + 1;
      next_tick += interval * behind;
    }
  }

  set_state(SchedulerState::ShuttingDown);
  observability::record_scheduler_stop();
}

TickSummary Scheduler::poll_once() {
  TickSummary summary;
  set_state(SchedulerState::Polling);

  auto due = store_.list_due_tasks(clock_());
  if (!due.ok()) {
    observability::record_error("scheduler", "failed to load due tasks: " + due.error());
    set_state(SchedulerState::Idle);
    return summary;
  }
  summary.due = due.value().size();
  observability::record_scheduler_tick(summary.due);
  if (due.value().empty()) {
    set_state(SchedulerState::Idle);
    return summary;
  }

  set_state(SchedulerState::Dispatching);
  std::mutex summary_mutex;
  std::vector<std::thread> workers;
  workers.reserve(due.value().size());

  for (const auto &task : due.value()) {
    if (stopping_) {
      break;
    }
    slots_.acquire();
    observability::record_in_flight(slots_.in_flight());

    try {
      workers.emplace_back([this, task_id = task.id, &summary, &summary_mutex]() {
        const Outcome outcome = dispatch_task(task_id);
        slots_.release();
        observability::record_in_flight(slots_.in_flight());

        std::lock_guard<std::mutex> lock(summary_mutex);
        switch (outcome) {
        case Outcome::Skipped:
          ++summary.skipped;
          break;
        case Outcome::Succeeded:
          ++summary.succeeded;
          break;
        case Outcome::Failed:
          ++summary.failed;
          break;
        case Outcome::InfrastructureFailure:
          ++summary.infrastructure_failures;
          break;
        }
      });
    } catch (const std::system_error &ex) {
      slots_.release();
      observability::record_error("scheduler", "could not start worker for task " + task.id +
                                                   ": " + ex.what());
      std::lock_guard<std::mutex> lock(summary_mutex);
      ++summary.infrastructure_failures;
      continue;
    }
    std::lock_guard<std::mutex> lock(summary_mutex);
    ++summary.dispatched;
  }

  for (auto &worker : workers) {
    worker.join();
  }

  observability::record_tick_completed({.due = summary.due,
                                        .dispatched = summary.dispatched,
                                        .succeeded = summary.succeeded,
                                        .failed = summary.failed,
                                        .skipped = summary.skipped,
                                        .infrastructure_failures =
                                            summary.infrastructure_failures});
  set_state(SchedulerState::Idle);
  return summary;
}

Scheduler::Outcome Scheduler::dispatch_task(const std::string &task_id) {
  try {
    return execute_task(task_id);
  } catch (const std::exception &ex) {
    record_fault(task_id, ex.what());
  } catch (...) {
    record_fault(task_id, "unknown exception");
  }
  return Outcome::Failed;
}

Scheduler::Outcome Scheduler::execute_task(const std::string &task_id) {
  // The task may have been paused or cancelled since it was selected.
  auto current = store_.get_task(task_id);
  if (!current.ok()) {
    observability::record_error("scheduler", "could not reload task " + task_id + ": " +
                                                 current.error());
    return Outcome::InfrastructureFailure;
  }
  if (!current.value().has_value()) {
    observability::record_task_skipped(task_id, "task no longer exists");
    return Outcome::Skipped;
  }
  const store::ScheduledTask task = *current.value();
  if (task.status != store::TaskStatus::Active) {
    observability::record_task_skipped(task_id, "status is " + status_name(task.status));
    return Outcome::Skipped;
  }

  protocol::ExecutionRequest request;
  request.prompt = task.prompt;
  request.session_id = "scheduled_" + task.id;
  request.group_folder = task.group_folder;
  request.chat_jid = task.chat_jid;
  request.is_main = false;
  request.is_scheduled_task = true;

  const common::TimePoint run_at = clock_();
  auto outcome = runner_.run(request, options_.task_timeout);
  if (!outcome.ok()) {
    observability::record_error("scheduler", "task " + task.id +
                                                 " could not be executed: " + outcome.error());
    return Outcome::InfrastructureFailure;
  }
  return finish_task(task, outcome.value(), run_at);
}

Scheduler::Outcome Scheduler::finish_task(const store::ScheduledTask &task,
                                          const runner::ExecutionOutcome &outcome,
                                          const common::TimePoint run_at) {
  const auto &result = outcome.result;
  store::RunStatus run_status = store::RunStatus::Success;
  if (outcome.timed_out) {
    run_status = store::RunStatus::Timeout;
  } else if (!result.is_success()) {
    run_status = store::RunStatus::Error;
  }
  const bool succeeded = run_status == store::RunStatus::Success;

  store::TaskRunLog log;
  log.task_id = task.id;
  log.run_at = run_at;
  log.duration_ms = outcome.duration.count();
  log.status = run_status;
  log.result = result.result;
  log.error = result.error;
  if (!succeeded && !log.error.has_value()) {
    log.error = "agent reported status " + result.status;
  }

  if (auto appended = store_.append_run_log(log); !appended.ok()) {
    observability::record_error("scheduler", "could not record run of task " + task.id + ": " +
                                                 appended.error());
  }
  if (auto updated = store_.update_last_run(task.id, run_at, succeeded ? result.result : log.error);
      !updated.ok()) {
    observability::record_error("scheduler", "could not update last run of task " + task.id +
                                                 ": " + updated.error());
  }
  observability::record_task_run(task.id, std::string(store::to_string(run_status)),
                                 outcome.duration);

  if (!succeeded) {
    if (auto failed = store_.mark_failed(task.id); !failed.ok()) {
      observability::record_error("scheduler", "could not mark task " + task.id +
                                                   " failed: " + failed.error());
    }
    return Outcome::Failed;
  }

  if (schedule::parse_schedule_kind(task.schedule_type) == schedule::ScheduleKind::Once) {
    if (auto completed = store_.mark_completed(task.id); !completed.ok()) {
      observability::record_error("scheduler", "could not mark task " + task.id +
                                                   " completed: " + completed.error());
    }
    return Outcome::Succeeded;
  }

  const auto next = schedule::compute_next_run(task, clock_());
  if (!next.has_value()) {
    observability::record_error("scheduler", "task " + task.id + " has no next run for " +
                                                 task.schedule_type + " schedule '" +
                                                 task.schedule_value + "'");
    return Outcome::Succeeded;
  }
  if (auto rescheduled = store_.update_next_run(task.id, next); !rescheduled.ok()) {
    observability::record_error("scheduler", "could not reschedule task " + task.id + ": " +
                                                 rescheduled.error());
    return Outcome::Succeeded;
  }
  observability::record_task_rescheduled(task.id, common::format_rfc3339(*next));
  return Outcome::Succeeded;
}

void Scheduler::record_fault(const std::string &task_id, const char *message) noexcept {
  // Runs inside a catch handler on a worker thread; nothing may escape.
  try {
    observability::record_error("scheduler", "task " + task_id + " faulted: " + message);
    const auto now = clock_();
    store::TaskRunLog log;
    log.task_id = task_id;
    log.run_at = now;
    log.status = store::RunStatus::Error;
    log.error = std::string("unexpected fault: ") + message;
    if (auto appended = store_.append_run_log(log); !appended.ok()) {
      observability::record_error("scheduler", "could not record fault of task " + task_id +
                                                   ": " + appended.error());
    }
    if (auto updated = store_.update_last_run(task_id, now, log.error); !updated.ok()) {
      observability::record_error("scheduler", "could not update last run of task " + task_id +
                                                   ": " + updated.error());
    }
    if (auto failed = store_.mark_failed(task_id); !failed.ok()) {
      observability::record_error("scheduler", "could not mark task " + task_id +
                                                   " failed: " + failed.error());
    }
  } catch (const std::exception &ex) {
    report_unrecorded_fault(task_id, ex.what());
  } catch (...) {
    report_unrecorded_fault(task_id, "unknown exception");
  }
}

} // namespace runclaw::scheduler
