#include "test_framework.hpp"

#include "runclaw/runner/sandbox_runner.hpp"
#include "runclaw/scheduler/scheduler.hpp"
#include "runclaw/store/sqlite_task_store.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <thread>

namespace {

using runclaw::testing::TempWorkspace;

// Echoes the group it was started in, or fails for prompts mentioning "fail".
constexpr const char *kAgentScript = R"SH(
input=$(cat)
case "$input" in
  *fail*)
    echo "agent crashed" >&2
    exit 3
    ;;
esac
echo "---RUNCLAW_OUTPUT_START---"
printf '{"status":"success","result":"handled %s"}\n' "$(basename "$(pwd)")"
echo "---RUNCLAW_OUTPUT_END---"
)SH";

struct Harness {
  TempWorkspace workspace;
  runclaw::config::RuntimePaths paths = runclaw::testing::temp_paths(workspace);
  runclaw::store::SqliteTaskStore store{paths.database_path()};
  runclaw::runner::SandboxExecutionRunner runner{
      runclaw::testing::temp_config(
          workspace, {"/bin/sh", workspace.create_script("agent.sh", kAgentScript).string()})
          .container,
      paths};

  Harness() {
    auto dirs = runclaw::config::ensure_directories(paths);
    runclaw::tests::require(dirs.ok(), dirs.error());
    runclaw::tests::require(store.is_open(), store.open_error());
  }

  runclaw::scheduler::Scheduler scheduler(std::size_t max_concurrent = 2) {
    runclaw::scheduler::SchedulerOptions options;
    options.task_timeout = std::chrono::seconds(20);
    options.max_concurrent = max_concurrent;
    options.poll_interval = std::chrono::milliseconds(30);
    options.poll_on_start = true;
    return runclaw::scheduler::Scheduler(store, runner, options);
  }

  void add(runclaw::store::ScheduledTask task) {
    task.next_run = std::chrono::system_clock::now() - std::chrono::seconds(1);
    auto created = store.create_task(task);
    runclaw::tests::require(created.ok(), created.error());
  }

  runclaw::store::ScheduledTask get(const std::string &id) {
    auto task = store.get_task(id);
    runclaw::tests::require(task.ok() && task.value().has_value(), "missing task " + id);
    return *task.value();
  }
};

} // namespace

void register_scheduler_integration_tests(std::vector<runclaw::tests::TestCase> &tests) {
  using runclaw::tests::require;
  namespace store = runclaw::store;

  tests.push_back({"integration_once_task_completes_with_log", [] {
                     Harness harness;
                     harness.add(runclaw::testing::make_task("once-1", "once",
                                                             "2026-01-01T00:00:00Z"));
                     auto scheduler = harness.scheduler();
                     const auto summary = scheduler.poll_once();
                     require(summary.due == 1, "one task due");
                     require(summary.succeeded == 1, "task should succeed");

                     const auto task = harness.get("once-1");
                     require(task.status == store::TaskStatus::Completed, "once task completes");
                     require(!task.next_run.has_value(), "completed task has no next run");
                     require(task.last_run.has_value(), "last run recorded");
                     require(task.last_result == std::optional<std::string>("handled main"),
                             "last result mismatch: " + task.last_result.value_or("<none>"));

                     auto logs = harness.store.list_run_logs("once-1", 10);
                     require(logs.ok() && logs.value().size() == 1, "expected one run log");
                     require(logs.value().front().status == store::RunStatus::Success,
                             "log should be success");
                     require(logs.value().front().result ==
                                 std::optional<std::string>("handled main"),
                             "log result mismatch");

                     require(scheduler.poll_once().due == 0, "completed task is not due again");
                   }});

  tests.push_back({"integration_failing_agent_marks_task_failed", [] {
                     Harness harness;
                     auto task = runclaw::testing::make_task("cron-1", "cron", "0 9 * * *");
                     task.prompt = "please fail";
                     harness.add(task);
                     auto scheduler = harness.scheduler();
                     const auto summary = scheduler.poll_once();
                     require(summary.failed == 1, "task should fail");

                     const auto stored = harness.get("cron-1");
                     require(stored.status == store::TaskStatus::Failed, "task marked failed");
                     auto logs = harness.store.list_run_logs("cron-1", 10);
                     require(logs.ok() && logs.value().size() == 1, "expected one run log");
                     require(logs.value().front().status == store::RunStatus::Error,
                             "log should be error");
                     require(logs.value().front().error.has_value(), "error text recorded");
                   }});

  tests.push_back({"integration_interval_task_rescheduled", [] {
                     Harness harness;
                     harness.add(runclaw::testing::make_task("every-hour", "interval", "3600000"));
                     auto scheduler = harness.scheduler();
                     const auto before = std::chrono::system_clock::now();
                     require(scheduler.poll_once().succeeded == 1, "task should succeed");

                     const auto task = harness.get("every-hour");
                     require(task.status == store::TaskStatus::Active, "interval stays active");
                     require(task.next_run.has_value(), "next run scheduled");
                     require(*task.next_run >= before + std::chrono::minutes(59),
                             "next run an hour out");
                     require(scheduler.poll_once().due == 0, "not due again yet");
                   }});

  tests.push_back({"integration_background_loop_drains_due_tasks", [] {
                     Harness harness;
                     for (int i = 0; i < 4; ++i) {
                       harness.add(runclaw::testing::make_task("batch-" + std::to_string(i),
                                                               "once", "2026-01-01T00:00:00Z"));
                     }
                     auto scheduler = harness.scheduler(2);
                     scheduler.start();

                     const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(20);
                     auto all_done = [&harness] {
                       for (int i = 0; i < 4; ++i) {
                         if (harness.get("batch-" + std::to_string(i)).status !=
                             store::TaskStatus::Completed) {
                           return false;
                         }
                       }
                       return true;
                     };
                     while (!all_done() && std::chrono::steady_clock::now() < deadline) {
                       std::this_thread::sleep_for(std::chrono::milliseconds(20));
                     }
                     scheduler.stop();
                     require(all_done(), "every task should complete");
                     for (int i = 0; i < 4; ++i) {
                       auto logs = harness.store.list_run_logs("batch-" + std::to_string(i), 10);
                       require(logs.ok() && logs.value().size() == 1,
                               "each task runs exactly once");
                     }
                   }});
}
