#include "runclaw/daemon/daemon.hpp"

#include "runclaw/observability/global.hpp"

#include <iostream>

namespace runclaw::daemon {

common::Result<std::unique_ptr<store::SqliteTaskStore>>
open_task_store(const config::RuntimePaths &paths) {
  using StoreResult = common::Result<std::unique_ptr<store::SqliteTaskStore>>;
  if (auto dirs = config::ensure_directories(paths); !dirs.ok()) {
    return StoreResult::failure(dirs.error());
  }
  auto task_store = std::make_unique<store::SqliteTaskStore>(paths.database_path());
  if (!task_store->is_open()) {
    return StoreResult::failure("failed to open task database " + paths.database_path().string() +
                                ": " + task_store->open_error());
  }
  return StoreResult::success(std::move(task_store));
}

common::Result<Engine> build_engine(const config::Config &config) {
  auto paths = config::resolve_paths(config);
  if (!paths.ok()) {
    return common::Result<Engine>::failure(paths.error());
  }

  auto task_store = open_task_store(paths.value());
  if (!task_store.ok()) {
    return common::Result<Engine>::failure(task_store.error());
  }

  Engine engine;
  engine.paths = paths.value();
  engine.store = std::move(task_store.value());
  engine.runner =
      std::make_unique<runner::SandboxExecutionRunner>(config.container, engine.paths);
  engine.scheduler = std::make_unique<scheduler::Scheduler>(
      *engine.store, *engine.runner, scheduler::options_from_config(config.scheduler));
  return common::Result<Engine>::success(std::move(engine));
}

Daemon::Daemon(const config::Config &config) : config_(config) {}

Daemon::~Daemon() { stop(); }

common::Status Daemon::start() {
  if (running_) {
    return common::Status::error("daemon already running");
  }

  auto cfg_dir = config::config_dir();
  if (!cfg_dir.ok()) {
    return common::Status::error(cfg_dir.error());
  }

  auto pid = std::make_unique<PidFile>(cfg_dir.value() / "daemon.pid");
  auto pid_status = pid->acquire();
  if (!pid_status.ok()) {
    return pid_status;
  }

  config::apply_timezone(config_.timezone);

  auto engine = build_engine(config_);
  if (!engine.ok()) {
    observability::record_error("daemon", engine.error());
    return common::Status::error(engine.error());
  }
  engine_ = std::move(engine.value());
  pid_file_ = std::move(pid);

  std::cerr << "[daemon] store=" << engine_.paths.database_path().string()
            << " runtime=" << config_.container.runtime << " timezone=" << config_.timezone
            << "\n";
  engine_.scheduler->start();
  running_ = true;
  return common::Status::success();
}

void Daemon::stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  std::cerr << "[daemon] stopping; waiting for in-flight tasks\n";
  if (engine_.scheduler) {
    engine_.scheduler->stop();
  }
  engine_.scheduler.reset();
  engine_.runner.reset();
  engine_.store.reset();
  if (pid_file_) {
    pid_file_->release();
  }
  std::cerr << "[daemon] stopped\n";
}

bool Daemon::is_running() const { return running_; }

} // namespace runclaw::daemon
