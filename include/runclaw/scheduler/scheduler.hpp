#pragma once

#include "runclaw/common/time.hpp"
#include "runclaw/config/schema.hpp"
#include "runclaw/runner/execution_runner.hpp"
#include "runclaw/store/task_store.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

namespace runclaw::scheduler {

enum class SchedulerState { Idle, Polling, Dispatching, ShuttingDown };

[[nodiscard]] std::string_view to_string(SchedulerState state);

struct SchedulerOptions {
  std::chrono::milliseconds poll_interval{60'000};
  std::chrono::milliseconds task_timeout{600'000};
  std::size_t max_concurrent = 4;
  /// Poll as soon as the loop starts instead of after the first interval.
  bool poll_on_start = false;
};

[[nodiscard]] SchedulerOptions options_from_config(const config::SchedulerConfig &config);

struct TickSummary {
  std::size_t due = 0;
  std::size_t dispatched = 0;
  std::size_t skipped = 0;
  std::size_t succeeded = 0;
  std::size_t failed = 0;
  std::size_t infrastructure_failures = 0;
};

using Clock = std::function<common::TimePoint()>;

/// Counting gate on in-flight executions.
class DispatchSlots {
public:
  explicit DispatchSlots(std::size_t capacity);

  /// Blocks until fewer than `capacity` slots are taken.
  void acquire();
  void release();
  [[nodiscard]] std::size_t in_flight() const;
  [[nodiscard]] std::size_t capacity() const { return capacity_; }

private:
  mutable std::mutex mutex_;
  std::condition_variable released_;
  std::size_t capacity_;
  std::size_t in_flight_ = 0;
};

/// Polls the store on a fixed cadence and runs due tasks through the runner, at most
/// `max_concurrent` at a time. Each tick waits for its whole batch; ticks missed meanwhile are
/// skipped, not queued.
class Scheduler {
public:
  Scheduler(store::ITaskStore &store, runner::IExecutionRunner &runner,
            SchedulerOptions options = {}, Clock clock = {});
  ~Scheduler();

  Scheduler(const Scheduler &) = delete;
  Scheduler &operator=(const Scheduler &) = delete;

  void start();
  /// Stops issuing ticks and dispatching; in-flight runs finish or time out first.
  void stop();
  [[nodiscard]] bool is_running() const;
  [[nodiscard]] SchedulerState state() const;
  [[nodiscard]] const SchedulerOptions &options() const { return options_; }

  /// One synchronous tick.
  TickSummary poll_once();

private:
  enum class Outcome { Skipped, Succeeded, Failed, InfrastructureFailure };

  void run_loop();
  void set_state(SchedulerState state);
  [[nodiscard]] Outcome dispatch_task(const std::string &task_id);
  [[nodiscard]] Outcome execute_task(const std::string &task_id);
  [[nodiscard]] Outcome finish_task(const store::ScheduledTask &task,
                                    const runner::ExecutionOutcome &outcome,
                                    common::TimePoint run_at);
  void record_fault(const std::string &task_id, const char *message) noexcept;

  store::ITaskStore &store_;
  runner::IExecutionRunner &runner_;
  SchedulerOptions options_;
  Clock clock_;
  DispatchSlots slots_;

  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<bool> stopping_{false};
  std::atomic<SchedulerState> state_{SchedulerState::Idle};
  std::mutex wake_mutex_;
  std::condition_variable wake_;
};

} // namespace runclaw::scheduler
