#pragma once

#include "runclaw/config/config.hpp"
#include "runclaw/observability/observer.hpp"
#include "runclaw/runner/execution_runner.hpp"
#include "runclaw/sandbox/process.hpp"
#include "runclaw/store/task_store.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace runclaw::testing {

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;
  /// Writes an executable `/bin/sh` script and returns its path.
  [[nodiscard]] std::filesystem::path create_script(const std::string &name,
                                                    const std::string &body) const;

private:
  std::filesystem::path path_;
};

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value);
  ~EnvGuard();

  EnvGuard(const EnvGuard &) = delete;
  EnvGuard &operator=(const EnvGuard &) = delete;
};

/// Points the config path override at `next` (or clears it) and restores it afterwards.
struct ConfigOverrideGuard {
  std::optional<std::filesystem::path> old_override;

  explicit ConfigOverrideGuard(std::optional<std::filesystem::path> next = std::nullopt);
  ~ConfigOverrideGuard();

  ConfigOverrideGuard(const ConfigOverrideGuard &) = delete;
  ConfigOverrideGuard &operator=(const ConfigOverrideGuard &) = delete;
};

/// Config rooted in the workspace, running `command` directly instead of docker.
config::Config temp_config(const TempWorkspace &workspace,
                           std::vector<std::string> command = {"/bin/cat"});

config::RuntimePaths temp_paths(const TempWorkspace &workspace);

store::ScheduledTask make_task(const std::string &id, const std::string &schedule_type,
                               const std::string &schedule_value);

/// In-memory ITaskStore that records every call.
class MemoryTaskStore final : public store::ITaskStore {
public:
  void put(store::ScheduledTask task);
  [[nodiscard]] std::optional<store::ScheduledTask> find(const std::string &id) const;
  [[nodiscard]] std::vector<store::TaskRunLog> run_logs() const;

  /// Called with the task id before get_task answers; may mutate the stored task.
  std::function<void(const std::string &, store::ScheduledTask &)> on_get_task;
  bool fail_list_due = false;
  /// append_run_log throws std::runtime_error instead of storing.
  bool throw_on_append_run_log = false;

  [[nodiscard]] common::Result<std::vector<store::ScheduledTask>>
  list_due_tasks(common::TimePoint now) override;
  [[nodiscard]] common::Result<std::optional<store::ScheduledTask>>
  get_task(const std::string &id) override;
  [[nodiscard]] common::Status append_run_log(const store::TaskRunLog &log) override;
  [[nodiscard]] common::Status update_last_run(const std::string &id, common::TimePoint run_at,
                                               const std::optional<std::string> &last_result) override;
  [[nodiscard]] common::Status update_next_run(const std::string &id,
                                               std::optional<common::TimePoint> next_run) override;
  [[nodiscard]] common::Status mark_completed(const std::string &id) override;
  [[nodiscard]] common::Status mark_failed(const std::string &id) override;
  [[nodiscard]] common::Status create_task(const store::ScheduledTask &task) override;
  [[nodiscard]] common::Result<std::vector<store::ScheduledTask>> list_tasks() override;
  [[nodiscard]] common::Result<std::vector<store::TaskRunLog>>
  list_run_logs(const std::string &task_id, std::size_t limit) override;
  [[nodiscard]] common::Result<bool> set_status(const std::string &id,
                                                store::TaskStatus status) override;

private:
  mutable std::mutex mutex_;
  std::map<std::string, store::ScheduledTask> tasks_;
  std::vector<store::TaskRunLog> logs_;
};

/// Runner answering every request with a scripted outcome, tracking concurrency.
class ScriptedRunner final : public runner::IExecutionRunner {
public:
  using Handler = std::function<common::Result<runner::ExecutionOutcome>(
      const protocol::ExecutionRequest &)>;

  explicit ScriptedRunner(Handler handler = {});

  /// Each call sleeps this long while counted as in flight.
  std::chrono::milliseconds hold{0};

  [[nodiscard]] common::Result<runner::ExecutionOutcome>
  run(const protocol::ExecutionRequest &request, std::chrono::milliseconds timeout) override;

  [[nodiscard]] std::size_t calls() const { return calls_; }
  [[nodiscard]] std::size_t max_in_flight() const { return max_in_flight_; }
  [[nodiscard]] std::vector<protocol::ExecutionRequest> requests() const;
  [[nodiscard]] std::chrono::milliseconds last_timeout() const;

private:
  Handler handler_;
  std::atomic<std::size_t> calls_{0};
  std::atomic<std::size_t> in_flight_{0};
  std::atomic<std::size_t> max_in_flight_{0};
  mutable std::mutex mutex_;
  std::vector<protocol::ExecutionRequest> requests_;
  std::chrono::milliseconds last_timeout_{0};
};

[[nodiscard]] runner::ExecutionOutcome success_outcome(const std::string &result);
[[nodiscard]] runner::ExecutionOutcome error_outcome(const std::string &error);

/// Launcher that records specs and returns canned output.
class FakeLauncher final : public sandbox::IProcessLauncher {
public:
  std::vector<sandbox::ProcessSpec> specs;
  std::vector<common::Result<sandbox::ProcessOutput>> responses;

  [[nodiscard]] common::Result<sandbox::ProcessOutput> run(const sandbox::ProcessSpec &spec) override;
};

class RecordingObserver final : public observability::IObserver {
public:
  void record_event(const observability::ObserverEvent &event) override;
  void record_metric(const observability::ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "recording"; }

  [[nodiscard]] std::vector<observability::ObserverEvent> events() const;
  [[nodiscard]] std::vector<observability::ObserverMetric> metrics() const;
  /// Messages of every ErrorEvent, as `component: message`.
  [[nodiscard]] std::vector<std::string> errors() const;

private:
  mutable std::mutex mutex_;
  std::vector<observability::ObserverEvent> events_;
  std::vector<observability::ObserverMetric> metrics_;
};

/// Installs a RecordingObserver as the global observer for the guard's lifetime.
class ScopedRecordingObserver {
public:
  ScopedRecordingObserver();
  ~ScopedRecordingObserver();

  ScopedRecordingObserver(const ScopedRecordingObserver &) = delete;
  ScopedRecordingObserver &operator=(const ScopedRecordingObserver &) = delete;

  RecordingObserver &operator*() const { return *observer_; }
  RecordingObserver *operator->() const { return observer_; }

private:
  RecordingObserver *observer_ = nullptr;
};

} // namespace runclaw::testing
