#pragma once

#include "runclaw/common/result.hpp"
#include "runclaw/config/config.hpp"
#include "runclaw/daemon/pid_file.hpp"
#include "runclaw/runner/sandbox_runner.hpp"
#include "runclaw/scheduler/scheduler.hpp"
#include "runclaw/store/sqlite_task_store.hpp"

#include <atomic>
#include <memory>

namespace runclaw::daemon {

/// The wired engine: store, runner and scheduler for one configuration.
struct Engine {
  config::RuntimePaths paths;
  std::unique_ptr<store::SqliteTaskStore> store;
  std::unique_ptr<runner::SandboxExecutionRunner> runner;
  std::unique_ptr<scheduler::Scheduler> scheduler;
};

/// Opens the task store under the configured root, creating directories as needed.
[[nodiscard]] common::Result<std::unique_ptr<store::SqliteTaskStore>>
open_task_store(const config::RuntimePaths &paths);

[[nodiscard]] common::Result<Engine> build_engine(const config::Config &config);

class Daemon {
public:
  explicit Daemon(const config::Config &config);
  ~Daemon();

  Daemon(const Daemon &) = delete;
  Daemon &operator=(const Daemon &) = delete;

  [[nodiscard]] common::Status start();
  void stop();
  [[nodiscard]] bool is_running() const;
  [[nodiscard]] const Engine &engine() const { return engine_; }

private:
  const config::Config &config_;
  Engine engine_;
  std::unique_ptr<PidFile> pid_file_;
  std::atomic<bool> running_{false};
};

} // namespace runclaw::daemon
