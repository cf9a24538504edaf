#include "tests/helpers/test_helpers.hpp"

#include "runclaw/observability/global.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <random>
#include <stdexcept>
#include <thread>

namespace runclaw::testing {

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() /
          ("runclaw-test-workspace-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempWorkspace::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc);
  out << content;
}

std::filesystem::path TempWorkspace::create_script(const std::string &name,
                                                   const std::string &body) const {
  create_file(name, "#!/bin/sh\n" + body);
  const auto script = path_ / name;
  std::filesystem::permissions(script,
                               std::filesystem::perms::owner_all |
                                   std::filesystem::perms::group_read |
                                   std::filesystem::perms::group_exec,
                               std::filesystem::perm_options::replace);
  return script;
}

EnvGuard::EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
  if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
    old_value = existing;
  }
  if (value.has_value()) {
    setenv(key.c_str(), value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

EnvGuard::~EnvGuard() {
  if (old_value.has_value()) {
    setenv(key.c_str(), old_value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

ConfigOverrideGuard::ConfigOverrideGuard(std::optional<std::filesystem::path> next) {
  old_override = config::config_path_override();
  if (next.has_value()) {
    config::set_config_path_override(*next);
  } else {
    config::clear_config_path_override();
  }
}

ConfigOverrideGuard::~ConfigOverrideGuard() {
  if (old_override.has_value()) {
    config::set_config_path_override(*old_override);
  } else {
    config::clear_config_path_override();
  }
}

config::Config temp_config(const TempWorkspace &workspace, std::vector<std::string> command) {
  config::Config config;
  config.paths.root = (workspace.path() / "root").string();
  config.container.runtime = "command";
  config.container.command = std::move(command);
  config.container.timeout_ms = 10'000;
  config.container.passthrough_env.clear();
  config.observability.backend = "none";
  return config;
}

config::RuntimePaths temp_paths(const TempWorkspace &workspace) {
  config::RuntimePaths paths;
  paths.root = workspace.path() / "root";
  paths.store_dir = paths.root / "store";
  paths.groups_dir = paths.root / "groups";
  paths.data_dir = paths.root / "data";
  return paths;
}

store::ScheduledTask make_task(const std::string &id, const std::string &schedule_type,
                               const std::string &schedule_value) {
  store::ScheduledTask task;
  task.id = id;
  task.group_folder = "main";
  task.chat_jid = "chat@example";
  task.prompt = "prompt for " + id;
  task.schedule_type = schedule_type;
  task.schedule_value = schedule_value;
  task.created_at = std::chrono::system_clock::now();
  return task;
}

void MemoryTaskStore::put(store::ScheduledTask task) {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::string id = task.id;
  tasks_[id] = std::move(task);
}

std::optional<store::ScheduledTask> MemoryTaskStore::find(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = tasks_.find(id);
  if (it == tasks_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<store::TaskRunLog> MemoryTaskStore::run_logs() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return logs_;
}

common::Result<std::vector<store::ScheduledTask>>
MemoryTaskStore::list_due_tasks(const common::TimePoint now) {
  using Tasks = common::Result<std::vector<store::ScheduledTask>>;
  if (fail_list_due) {
    return Tasks::failure("store unavailable");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<store::ScheduledTask> due;
  for (const auto &[id, task] : tasks_) {
    if (task.status == store::TaskStatus::Active &&
        (!task.next_run.has_value() || *task.next_run <= now)) {
      due.push_back(task);
    }
  }
  std::stable_sort(due.begin(), due.end(), [](const auto &left, const auto &right) {
    if (left.next_run.has_value() != right.next_run.has_value()) {
      return !left.next_run.has_value();
    }
    return left.next_run < right.next_run;
  });
  return Tasks::success(std::move(due));
}

common::Result<std::optional<store::ScheduledTask>>
MemoryTaskStore::get_task(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = tasks_.find(id);
  if (it == tasks_.end()) {
    return common::Result<std::optional<store::ScheduledTask>>::success(std::nullopt);
  }
  if (on_get_task) {
    on_get_task(id, it->second);
  }
  return common::Result<std::optional<store::ScheduledTask>>::success(it->second);
}

common::Status MemoryTaskStore::append_run_log(const store::TaskRunLog &log) {
  if (throw_on_append_run_log) {
    throw std::runtime_error("run log storage exploded");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  logs_.push_back(log);
  logs_.back().id = static_cast<std::int64_t>(logs_.size());
  return common::Status::success();
}

common::Status MemoryTaskStore::update_last_run(const std::string &id,
                                                const common::TimePoint run_at,
                                                const std::optional<std::string> &last_result) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = tasks_.find(id);
  if (it == tasks_.end()) {
    return common::Status::error("task not found: " + id);
  }
  it->second.last_run = run_at;
  it->second.last_result = last_result;
  return common::Status::success();
}

common::Status MemoryTaskStore::update_next_run(const std::string &id,
                                                std::optional<common::TimePoint> next_run) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = tasks_.find(id);
  if (it == tasks_.end()) {
    return common::Status::error("task not found: " + id);
  }
  it->second.next_run = next_run;
  return common::Status::success();
}

common::Status MemoryTaskStore::mark_completed(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = tasks_.find(id);
  if (it == tasks_.end()) {
    return common::Status::error("task not found: " + id);
  }
  it->second.status = store::TaskStatus::Completed;
  it->second.next_run.reset();
  return common::Status::success();
}

common::Status MemoryTaskStore::mark_failed(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = tasks_.find(id);
  if (it == tasks_.end()) {
    return common::Status::error("task not found: " + id);
  }
  it->second.status = store::TaskStatus::Failed;
  return common::Status::success();
}

common::Status MemoryTaskStore::create_task(const store::ScheduledTask &task) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!tasks_.emplace(task.id, task).second) {
    return common::Status::error("duplicate task id: " + task.id);
  }
  return common::Status::success();
}

common::Result<std::vector<store::ScheduledTask>> MemoryTaskStore::list_tasks() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<store::ScheduledTask> tasks;
  for (const auto &[id, task] : tasks_) {
    tasks.push_back(task);
  }
  return common::Result<std::vector<store::ScheduledTask>>::success(std::move(tasks));
}

common::Result<std::vector<store::TaskRunLog>>
MemoryTaskStore::list_run_logs(const std::string &task_id, const std::size_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<store::TaskRunLog> logs;
  for (auto it = logs_.rbegin(); it != logs_.rend() && logs.size() < limit; ++it) {
    if (it->task_id == task_id) {
      logs.push_back(*it);
    }
  }
  return common::Result<std::vector<store::TaskRunLog>>::success(std::move(logs));
}

common::Result<bool> MemoryTaskStore::set_status(const std::string &id,
                                                 const store::TaskStatus status) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = tasks_.find(id);
  if (it == tasks_.end()) {
    return common::Result<bool>::success(false);
  }
  it->second.status = status;
  return common::Result<bool>::success(true);
}

ScriptedRunner::ScriptedRunner(Handler handler) : handler_(std::move(handler)) {}

common::Result<runner::ExecutionOutcome>
ScriptedRunner::run(const protocol::ExecutionRequest &request,
                    const std::chrono::milliseconds timeout) {
  ++calls_;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.push_back(request);
    last_timeout_ = timeout;
  }

  const std::size_t now_in_flight = ++in_flight_;
  std::size_t observed = max_in_flight_.load();
  while (now_in_flight > observed && !max_in_flight_.compare_exchange_weak(observed, now_in_flight)) {
  }
  if (hold.count() > 0) {
    std::this_thread::sleep_for(hold);
  }
  --in_flight_;

  if (handler_) {
    return handler_(request);
  }
  return common::Result<runner::ExecutionOutcome>::success(success_outcome("done"));
}

std::vector<protocol::ExecutionRequest> ScriptedRunner::requests() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return requests_;
}

std::chrono::milliseconds ScriptedRunner::last_timeout() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_timeout_;
}

runner::ExecutionOutcome success_outcome(const std::string &result) {
  runner::ExecutionOutcome outcome;
  outcome.result.status = protocol::STATUS_SUCCESS;
  outcome.result.result = result;
  outcome.duration = std::chrono::milliseconds(5);
  return outcome;
}

runner::ExecutionOutcome error_outcome(const std::string &error) {
  runner::ExecutionOutcome outcome;
  outcome.result.status = protocol::STATUS_ERROR;
  outcome.result.error = error;
  outcome.duration = std::chrono::milliseconds(5);
  return outcome;
}

common::Result<sandbox::ProcessOutput> FakeLauncher::run(const sandbox::ProcessSpec &spec) {
  specs.push_back(spec);
  if (responses.empty()) {
    sandbox::ProcessOutput output;
    output.exit_code = 0;
    return common::Result<sandbox::ProcessOutput>::success(output);
  }
  auto response = responses.front();
  responses.erase(responses.begin());
  return response;
}

void RecordingObserver::record_event(const observability::ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.push_back(event);
}

void RecordingObserver::record_metric(const observability::ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(mutex_);
  metrics_.push_back(metric);
}

std::vector<observability::ObserverEvent> RecordingObserver::events() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_;
}

std::vector<observability::ObserverMetric> RecordingObserver::metrics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return metrics_;
}

std::vector<std::string> RecordingObserver::errors() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> messages;
  for (const auto &event : events_) {
    if (const auto *error = std::get_if<observability::ErrorEvent>(&event); error != nullptr) {
      messages.push_back(error->component + ": " + error->message);
    }
  }
  return messages;
}

ScopedRecordingObserver::ScopedRecordingObserver() {
  auto observer = std::make_unique<RecordingObserver>();
  observer_ = observer.get();
  observability::set_global_observer(std::move(observer));
}

ScopedRecordingObserver::~ScopedRecordingObserver() { observability::set_global_observer(nullptr); }

} // namespace runclaw::testing
