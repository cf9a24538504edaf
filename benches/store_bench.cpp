#include "bench_common.hpp"

#include "runclaw/store/sqlite_task_store.hpp"

#include <chrono>
#include <filesystem>
#include <random>

namespace {

std::filesystem::path make_temp_dir() {
  static std::mt19937_64 rng{std::random_device{}()};
  const auto base = std::filesystem::temp_directory_path() /
                    ("runclaw-store-bench-" + std::to_string(rng()));
  std::filesystem::create_directories(base);
  return base;
}

} // namespace

void run_store_benchmark() {
  std::cout << "\n=== Store Benchmarks ===\n";
  const auto dir = make_temp_dir();
  {
    runclaw::store::SqliteTaskStore store(dir / "messages.db");
    if (!store.is_open()) {
      std::cout << "store unavailable: " << store.open_error() << "\n";
      return;
    }

    const auto now = std::chrono::system_clock::now();
    int next_id = 0;
    runclaw::bench::run_bench("create_task", 500, [&] {
      runclaw::store::ScheduledTask task;
      task.id = "bench-" + std::to_string(next_id);
      task.group_folder = "main";
      task.chat_jid = "bench@example";
      task.prompt = "benchmark";
      task.schedule_type = "interval";
      task.schedule_value = "60000";
      // half due, half in the future
      task.next_run = now + std::chrono::minutes(next_id % 2 == 0 ? -1 : 60);
      task.created_at = now;
      ++next_id;
      (void)store.create_task(task);
    });

    runclaw::bench::run_bench("list_due_tasks", 500, [&] { (void)store.list_due_tasks(now); });

    runclaw::bench::run_bench("append_run_log", 500, [&] {
      runclaw::store::TaskRunLog log;
      log.task_id = "bench-0";
      log.run_at = now;
      log.duration_ms = 42;
      log.result = "ok";
      (void)store.append_run_log(log);
    });
  }
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
}
