#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "runclaw/observability/factory.hpp"
#include "runclaw/observability/global.hpp"
#include "runclaw/observability/log_observer.hpp"
#include "runclaw/observability/multi_observer.hpp"
#include "runclaw/observability/noop_observer.hpp"

#include <chrono>
#include <memory>
#include <sstream>

void register_observability_tests(std::vector<runclaw::tests::TestCase> &tests) {
  using runclaw::tests::require;
  namespace obs = runclaw::observability;

  tests.push_back({"observability_log_level_parsing", [] {
                     require(obs::parse_log_level("WARNING") == obs::LogLevel::Warn, "warning");
                     require(obs::parse_log_level("trace") == obs::LogLevel::Debug, "trace");
                     require(!obs::parse_log_level("verbose").has_value(), "unknown level");
                     require(obs::log_level_name(obs::LogLevel::Error) == "ERROR", "name");
                   }});

  tests.push_back({"observability_log_observer_filters_by_level", [] {
                     std::ostringstream out;
                     obs::LogObserver observer(obs::LogLevel::Info, out);
                     observer.record_event(obs::SchedulerTickEvent{.due_tasks = 0});
                     observer.record_event(obs::SchedulerTickEvent{.due_tasks = 3});
                     observer.record_event(obs::TaskRunEvent{.task_id = "t1",
                                                             .status = "timeout",
                                                             .duration = std::chrono::milliseconds(7)});
                     observer.record_event(
                         obs::ErrorEvent{.component = "scheduler", .message = "store down"});
                     observer.record_metric(obs::InFlightTasksMetric{.count = 2});
                     observer.flush();

                     const std::string text = out.str();
                     require(text.find("due=0") == std::string::npos, "idle tick is debug");
                     require(text.find("[INFO] scheduler.tick due=3") != std::string::npos,
                             "busy tick logged");
                     require(text.find("[WARN] task.run id=t1 status=timeout duration_ms=7") !=
                                 std::string::npos,
                             "non-success run is a warning");
                     require(text.find("[ERROR] scheduler: store down") != std::string::npos,
                             "error logged");
                     require(text.find("in_flight") == std::string::npos, "metrics are debug");
                   }});

  tests.push_back({"observability_log_observer_renders_tick_outcome", [] {
                     std::ostringstream out;
                     obs::LogObserver observer(obs::LogLevel::Info, out);
                     observer.record_event(obs::TickCompletedEvent{
                         .due = 2, .dispatched = 2, .succeeded = 2});
                     observer.record_event(obs::TickCompletedEvent{
                         .due = 3, .dispatched = 2, .succeeded = 1, .infrastructure_failures = 1});
                     observer.flush();
                     const std::string text = out.str();
                     require(text.find("[INFO] scheduler.tick_done due=2 dispatched=2 succeeded=2 "
                                       "failed=0 skipped=0 infrastructure_failures=0") !=
                                 std::string::npos,
                             "clean tick is info: " + text);
                     require(text.find("[WARN] scheduler.tick_done due=3 dispatched=2 succeeded=1 "
                                       "failed=0 skipped=0 infrastructure_failures=1") !=
                                 std::string::npos,
                             "tick with failures is a warning: " + text);

                     std::ostringstream quiet;
                     obs::LogObserver errors_only(obs::LogLevel::Error, quiet);
                     errors_only.record_event(obs::TickCompletedEvent{.due = 1, .failed = 1});
                     errors_only.flush();
                     require(quiet.str().empty(), "error level hides tick outcomes");
                   }});

  tests.push_back({"observability_factory_backends", [] {
                     runclaw::config::Config cfg;
                     cfg.observability.backend = "none";
                     require(obs::create_observer(cfg)->name() == "noop", "none is noop");
                     cfg.observability.backend = "log";
                     require(obs::create_observer(cfg)->name() == "log", "log backend");
                     cfg.observability.backend = "log, noop";
                     require(obs::create_observer(cfg)->name() == "multi", "list is multi");
                   }});

  tests.push_back({"observability_multi_observer_fans_out", [] {
                     obs::MultiObserver multi;
                     auto first = std::make_unique<runclaw::testing::RecordingObserver>();
                     auto second = std::make_unique<runclaw::testing::RecordingObserver>();
                     auto *first_ptr = first.get();
                     auto *second_ptr = second.get();
                     multi.add(std::move(first));
                     multi.add(std::move(second));
                     multi.add(nullptr);
                     multi.record_event(obs::SchedulerStopEvent{});
                     require(first_ptr->events().size() == 1, "first observer missed event");
                     require(second_ptr->events().size() == 1, "second observer missed event");
                   }});

  tests.push_back({"observability_global_helpers_reach_installed_observer", [] {
                     runclaw::testing::ScopedRecordingObserver recorder;
                     obs::record_task_skipped("t9", "status is paused");
                     obs::record_task_run("t9", "success", std::chrono::milliseconds(12));
                     obs::record_error("store", "disk full");

                     const auto events = recorder->events();
                     require(events.size() == 3, "expected three events");
                     const auto *skipped = std::get_if<obs::TaskSkippedEvent>(&events[0]);
                     require(skipped != nullptr && skipped->reason == "status is paused",
                             "skip event mismatch");
                     require(recorder->metrics().size() == 1, "run duration metric expected");
                     require(recorder->errors() == std::vector<std::string>{"store: disk full"},
                             "error mismatch");
                   }});
}
