#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "runclaw/config/config.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace {

using runclaw::testing::ConfigOverrideGuard;
using runclaw::testing::EnvGuard;

// Scheduler/container variables read by apply_env_overrides, cleared for a test's duration.
struct CleanSchedulerEnv {
  EnvGuard poll{"SCHEDULER_POLL_INTERVAL", std::nullopt};
  EnvGuard timeout{"TASK_TIMEOUT", std::nullopt};
  EnvGuard concurrent{"MAX_CONCURRENT_TASKS", std::nullopt};
  EnvGuard container_timeout{"CONTAINER_TIMEOUT", std::nullopt};
  EnvGuard output{"CONTAINER_MAX_OUTPUT_SIZE", std::nullopt};
  EnvGuard image{"CONTAINER_IMAGE", std::nullopt};
  EnvGuard root{"RUNCLAW_ROOT", std::nullopt};
  EnvGuard config_path{"RUNCLAW_CONFIG_PATH", std::nullopt};
};

} // namespace

void register_config_tests(std::vector<runclaw::tests::TestCase> &tests) {
  using runclaw::tests::require;
  namespace config = runclaw::config;

  tests.push_back({"config_defaults", [] {
                     const config::Config cfg;
                     require(cfg.scheduler.poll_interval_secs == 60, "poll default");
                     require(cfg.scheduler.task_timeout_secs == 600, "task timeout default");
                     require(cfg.scheduler.max_concurrent_tasks == 4, "concurrency default");
                     require(cfg.container.timeout_ms == 300'000, "container timeout default");
                     require(cfg.container.max_output_bytes == 10 * 1024 * 1024,
                             "output cap default");
                     require(cfg.container.runtime == "docker", "runtime default");
                     auto warnings = config::validate_config(cfg);
                     require(warnings.ok(), warnings.error());
                   }});

  tests.push_back({"config_env_overrides_positive_integers_only", [] {
                     CleanSchedulerEnv clean;
                     EnvGuard poll("SCHEDULER_POLL_INTERVAL", "15");
                     EnvGuard timeout("TASK_TIMEOUT", "0");
                     EnvGuard concurrent("MAX_CONCURRENT_TASKS", "abc");
                     EnvGuard output("CONTAINER_MAX_OUTPUT_SIZE", "2048");
                     EnvGuard image("CONTAINER_IMAGE", "example/agent:1");

                     config::Config cfg;
                     config::apply_env_overrides(cfg);
                     require(cfg.scheduler.poll_interval_secs == 15, "poll override");
                     require(cfg.scheduler.task_timeout_secs == 600, "zero must be ignored");
                     require(cfg.scheduler.max_concurrent_tasks == 4, "garbage must be ignored");
                     require(cfg.container.max_output_bytes == 2048, "output override");
                     require(cfg.container.image == "example/agent:1", "image override");
                   }});

  tests.push_back({"config_parse_reads_every_section", [] {
                     auto parsed = config::parse_config(R"(timezone = "America/New_York"
[paths]
root = "/srv/runclaw"
[scheduler]
poll_interval_secs = 30
task_timeout_secs = 120
max_concurrent_tasks = 2
poll_on_start = true
[container]
runtime = "COMMAND"
command = ["/usr/bin/agent", "--json"]
timeout_ms = 5000
memory_limit = "512m"
cpu_limit = 0.5
pids_limit = 64
[observability]
backend = "log"
log_level = "debug"
)");
                     require(parsed.ok(), parsed.error());
                     const auto &cfg = parsed.value();
                     require(cfg.timezone == "America/New_York", "timezone");
                     require(cfg.paths.root == "/srv/runclaw", "root");
                     require(cfg.scheduler.poll_interval_secs == 30, "poll");
                     require(cfg.scheduler.max_concurrent_tasks == 2, "concurrency");
                     require(cfg.scheduler.poll_on_start, "poll_on_start");
                     require(cfg.container.runtime == "command", "runtime is lowercased");
                     require(cfg.container.command.size() == 2, "command");
                     require(cfg.container.memory_limit == std::optional<std::string>("512m"),
                             "memory");
                     require(cfg.container.pids_limit == std::optional<std::uint32_t>(64), "pids");
                     require(cfg.observability.log_level == "debug", "log level");
                   }});

  tests.push_back({"config_validate_rejects_hard_errors", [] {
                     config::Config cfg;
                     cfg.scheduler.max_concurrent_tasks = 0;
                     require(!config::validate_config(cfg).ok(), "zero concurrency must fail");

                     cfg = config::Config{};
                     cfg.container.runtime = "podman-ish";
                     require(!config::validate_config(cfg).ok(), "unknown runtime must fail");

                     cfg = config::Config{};
                     cfg.container.runtime = "command";
                     require(!config::validate_config(cfg).ok(), "empty command must fail");

                     cfg = config::Config{};
                     cfg.observability.log_level = "loud";
                     require(!config::validate_config(cfg).ok(), "bad log level must fail");
                   }});

  tests.push_back({"config_validate_warns_on_capped_timeout", [] {
                     config::Config cfg;
                     cfg.container.timeout_ms = 1000;
                     auto warnings = config::validate_config(cfg);
                     require(warnings.ok(), warnings.error());
                     bool found = false;
                     for (const auto &warning : warnings.value()) {
                       found = found || warning.find("container.timeout_ms") != std::string::npos;
                     }
                     require(found, "expected a timeout cap warning");
                   }});

  tests.push_back({"config_save_then_load", [] {
                     CleanSchedulerEnv clean;
                     runclaw::testing::TempWorkspace workspace;
                     ConfigOverrideGuard guard(workspace.path() / "config.toml");

                     auto cfg = runclaw::testing::temp_config(workspace, {"/bin/echo", "hi there"});
                     cfg.scheduler.poll_interval_secs = 5;
                     cfg.container.cpu_limit = 2.0;
                     auto saved = config::save_config(cfg);
                     require(saved.ok(), saved.error());
                     require(config::config_exists(), "config should exist after save");

                     auto loaded = config::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().scheduler.poll_interval_secs == 5, "poll round trip");
                     require(loaded.value().container.command.size() == 2 &&
                                 loaded.value().container.command[1] == "hi there",
                             "command round trip");
                     require(loaded.value().container.cpu_limit.has_value() &&
                                 *loaded.value().container.cpu_limit == 2.0,
                             "cpu round trip");
                     require(loaded.value().paths.root == cfg.paths.root, "root round trip");
                   }});

  tests.push_back({"config_missing_file_yields_defaults", [] {
                     CleanSchedulerEnv clean;
                     runclaw::testing::TempWorkspace workspace;
                     ConfigOverrideGuard guard(workspace.path() / "absent.toml");
                     auto loaded = config::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().scheduler.poll_interval_secs == 60,
                             "defaults expected");
                   }});

  tests.push_back({"config_resolve_paths_layout", [] {
                     runclaw::testing::TempWorkspace workspace;
                     auto cfg = runclaw::testing::temp_config(workspace);
                     auto paths = config::resolve_paths(cfg);
                     require(paths.ok(), paths.error());
                     const auto root = workspace.path() / "root";
                     require(paths.value().database_path() == root / "store" / "messages.db",
                             "database path");
                     require(paths.value().ipc_dir() == root / "data" / "ipc", "ipc dir");
                     require(paths.value().transcript_dir() == root / "groups" / "logs",
                             "transcript dir");

                     auto created = config::ensure_directories(paths.value());
                     require(created.ok(), created.error());
                     require(std::filesystem::is_directory(paths.value().temp_dir()),
                             "temp dir created");
                   }});
}
