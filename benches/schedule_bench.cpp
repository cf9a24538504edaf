#include "bench_common.hpp"

#include "runclaw/config/config.hpp"
#include "runclaw/schedule/calculator.hpp"
#include "runclaw/schedule/cron.hpp"

#include <chrono>

void run_schedule_benchmark() {
  std::cout << "\n=== Schedule Benchmarks ===\n";
  runclaw::config::apply_timezone("UTC");
  const auto now = std::chrono::system_clock::now();

  runclaw::bench::run_bench("cron_parse", 5000, [] {
    (void)runclaw::schedule::CronExpression::parse("*/5 9-17 * jan-jun mon-fri");
  });

  auto dense = runclaw::schedule::CronExpression::parse("*/15 * * * *");
  if (dense.ok()) {
    runclaw::bench::run_bench("cron_next_dense", 5000,
                              [&] { (void)dense.value().next_occurrence(now); });
  }

  // Feb 29 on a Monday only comes around every few years.
  auto sparse = runclaw::schedule::CronExpression::parse("0 12 29 2 1");
  if (sparse.ok()) {
    runclaw::bench::run_bench("cron_next_sparse", 200,
                              [&] { (void)sparse.value().next_occurrence(now); });
  }

  runclaw::bench::run_bench("initial_next_run_interval", 20000, [&] {
    (void)runclaw::schedule::initial_next_run("interval", "3600000", now);
  });
}
