#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace runclaw::config {

struct PathsConfig {
  /// Base directory for store/, groups/ and data/. Empty means the config directory.
  std::string root;
};

struct SchedulerConfig {
  std::uint64_t poll_interval_secs = 60;
  std::uint64_t task_timeout_secs = 600;
  std::uint32_t max_concurrent_tasks = 4;
  bool poll_on_start = false;
};

struct ContainerConfig {
  /// "docker" wraps the agent in `docker run`; "command" runs `command` directly.
  std::string runtime = "docker";
  std::string binary = "docker";
  std::string image = "anthropic/claude-code:latest";
  std::vector<std::string> args;
  std::vector<std::string> command;
  std::uint64_t timeout_ms = 300'000;
  std::uint64_t max_output_bytes = 10 * 1024 * 1024;
  std::string network;
  std::optional<std::string> memory_limit;
  std::optional<double> cpu_limit;
  std::optional<std::uint32_t> pids_limit;
  std::vector<std::string> passthrough_env = {"CLAUDE_CODE_OAUTH_TOKEN", "ANTHROPIC_API_KEY",
                                              "ANTHROPIC_BASE_URL"};
};

struct ObservabilityConfig {
  std::string backend = "log";
  std::string log_level = "info";
};

struct Config {
  std::string timezone = "UTC";
  PathsConfig paths;
  SchedulerConfig scheduler;
  ContainerConfig container;
  ObservabilityConfig observability;
};

} // namespace runclaw::config
