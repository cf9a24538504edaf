#include "runclaw/cli/commands.hpp"

#include "runclaw/common/fs.hpp"
#include "runclaw/common/time.hpp"
#include "runclaw/config/config.hpp"
#include "runclaw/daemon/daemon.hpp"
#include "runclaw/observability/factory.hpp"
#include "runclaw/observability/global.hpp"
#include "runclaw/schedule/calculator.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace runclaw::cli {

namespace {

std::atomic<bool> g_shutdown_requested{false};

void handle_shutdown_signal(int) { g_shutdown_requested = true; }

std::string version_string() {
#ifdef RUNCLAW_VERSION
  std::string version = RUNCLAW_VERSION;
#else
  std::string version = "0.1.0";
#endif
#ifdef RUNCLAW_GIT_COMMIT
  const std::string commit = RUNCLAW_GIT_COMMIT;
  if (!commit.empty() && commit != "unknown") {
    version += " (" + commit + ")";
  }
#endif
  return "runclaw " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::optional<std::uint64_t> parse_u64(const std::string &raw) {
  const std::string value = common::trim(raw);
  std::uint64_t parsed = 0;
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (value.empty() || ec != std::errc() || ptr != value.data() + value.size()) {
    return std::nullopt;
  }
  return parsed;
}

/// Loads configuration, installs the configured observer and the time zone.
std::optional<config::Config> load_runtime_config() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return std::nullopt;
  }
  auto validated = config::validate_config(cfg.value());
  if (!validated.ok()) {
    std::cerr << "invalid configuration: " << validated.error() << "\n";
    return std::nullopt;
  }
  for (const auto &warning : validated.value()) {
    std::cerr << "[config] warning: " << warning << "\n";
  }
  observability::set_global_observer(observability::create_observer(cfg.value()));
  config::apply_timezone(cfg.value().timezone);
  return cfg.value();
}

std::string optional_time_text(const std::optional<common::TimePoint> &value) {
  return value.has_value() ? common::format_rfc3339(*value) : "-";
}

int run_daemon(std::vector<std::string> args) {
  std::string duration_raw;
  (void)take_option(args, "--duration-secs", "", duration_raw);
  std::optional<std::uint64_t> duration;
  if (!duration_raw.empty()) {
    duration = parse_u64(duration_raw);
    if (!duration.has_value()) {
      std::cerr << "invalid --duration-secs: " << duration_raw << "\n";
      return 1;
    }
  }

  auto cfg = load_runtime_config();
  if (!cfg.has_value()) {
    return 1;
  }

  daemon::Daemon daemon(*cfg);
  auto started = daemon.start();
  if (!started.ok()) {
    std::cerr << started.error() << "\n";
    return 1;
  }
  std::cout << "Daemon started (poll every " << cfg->scheduler.poll_interval_secs
            << "s, max " << cfg->scheduler.max_concurrent_tasks << " concurrent tasks)\n";

  g_shutdown_requested = false;
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);

  const auto started_at = std::chrono::steady_clock::now();
  while (!g_shutdown_requested) {
    if (duration.has_value() && *duration > 0 &&
        std::chrono::steady_clock::now() - started_at >= std::chrono::seconds(*duration)) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  daemon.stop();
  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
  return 0;
}

int run_tick() {
  auto cfg = load_runtime_config();
  if (!cfg.has_value()) {
    return 1;
  }
  auto engine = daemon::build_engine(*cfg);
  if (!engine.ok()) {
    std::cerr << engine.error() << "\n";
    return 1;
  }
  const auto summary = engine.value().scheduler->poll_once();
  std::cout << "due=" << summary.due << " dispatched=" << summary.dispatched
            << " succeeded=" << summary.succeeded << " failed=" << summary.failed
            << " skipped=" << summary.skipped
            << " infrastructure_failures=" << summary.infrastructure_failures << "\n";
  return summary.infrastructure_failures == 0 ? 0 : 1;
}

int run_tasks(std::vector<std::string> args) {
  auto cfg = load_runtime_config();
  if (!cfg.has_value()) {
    return 1;
  }
  auto paths = config::resolve_paths(*cfg);
  if (!paths.ok()) {
    std::cerr << paths.error() << "\n";
    return 1;
  }
  auto opened = daemon::open_task_store(paths.value());
  if (!opened.ok()) {
    std::cerr << opened.error() << "\n";
    return 1;
  }
  auto &task_store = *opened.value();

  const std::string sub = args.empty() ? "list" : args[0];
  if (!args.empty()) {
    args.erase(args.begin());
  }

  if (sub == "list") {
    auto tasks = task_store.list_tasks();
    if (!tasks.ok()) {
      std::cerr << tasks.error() << "\n";
      return 1;
    }
    if (tasks.value().empty()) {
      std::cout << "No scheduled tasks\n";
      return 0;
    }
    for (const auto &task : tasks.value()) {
      std::cout << task.id << " | " << task.group_folder << " | " << task.schedule_type << " "
                << task.schedule_value << " | " << store::to_string(task.status)
                << " | next=" << optional_time_text(task.next_run)
                << " | last=" << optional_time_text(task.last_run) << "\n";
    }
    return 0;
  }

  if (sub == "add") {
    std::string group;
    std::string chat;
    std::string kind;
    std::string value;
    std::string prompt;
    std::string id;
    std::string context_mode = "isolated";
    (void)take_option(args, "--group", "-g", group);
    (void)take_option(args, "--chat", "", chat);
    (void)take_option(args, "--kind", "-k", kind);
    (void)take_option(args, "--value", "-v", value);
    (void)take_option(args, "--prompt", "-p", prompt);
    (void)take_option(args, "--id", "", id);
    (void)take_option(args, "--context-mode", "", context_mode);
    if (group.empty() || kind.empty() || value.empty() || prompt.empty()) {
      std::cerr << "usage: runclaw tasks add --group G --chat C --kind cron|interval|once "
                   "--value V --prompt P [--id ID] [--context-mode M]\n";
      return 1;
    }

    const auto now = std::chrono::system_clock::now();
    auto next_run = schedule::initial_next_run(kind, value, now);
    if (!next_run.ok()) {
      std::cerr << next_run.error() << "\n";
      return 1;
    }

    store::ScheduledTask task;
    task.id = id.empty() ? "task-" + std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(
                                                        now.time_since_epoch())
                                                        .count())
                         : id;
    task.group_folder = group;
    task.chat_jid = chat;
    task.prompt = prompt;
    task.schedule_type = kind;
    task.schedule_value = value;
    task.next_run = next_run.value();
    task.status = store::TaskStatus::Active;
    task.created_at = now;
    task.context_mode = context_mode;
    auto created = task_store.create_task(task);
    if (!created.ok()) {
      std::cerr << created.error() << "\n";
      return 1;
    }
    std::cout << "Added task " << task.id << " (next run " << common::format_rfc3339(*task.next_run)
              << ")\n";
    return 0;
  }

  if (sub == "pause" || sub == "resume" || sub == "cancel") {
    if (args.empty()) {
      std::cerr << "usage: runclaw tasks " << sub << " <id>\n";
      return 1;
    }
    const std::string &id = args[0];
    common::Result<bool> changed = common::Result<bool>::success(false);
    if (sub == "cancel") {
      auto existing = task_store.get_task(id);
      if (!existing.ok()) {
        std::cerr << existing.error() << "\n";
        return 1;
      }
      if (existing.value().has_value()) {
        auto completed = task_store.mark_completed(id);
        changed = completed.ok() ? common::Result<bool>::success(true)
                                 : common::Result<bool>::failure(completed.error());
      }
    } else {
      changed = task_store.set_status(id, sub == "pause" ? store::TaskStatus::Paused
                                                         : store::TaskStatus::Active);
    }
    if (!changed.ok()) {
      std::cerr << changed.error() << "\n";
      return 1;
    }
    if (!changed.value()) {
      std::cerr << "task not found: " << id << "\n";
      return 1;
    }
    std::cout << "Task " << id << " " << (sub == "pause"    ? "paused"
                                          : sub == "resume" ? "resumed"
                                                            : "cancelled")
              << "\n";
    return 0;
  }

  if (sub == "runs") {
    std::string limit_raw;
    (void)take_option(args, "--limit", "-n", limit_raw);
    if (args.empty()) {
      std::cerr << "usage: runclaw tasks runs <id> [--limit N]\n";
      return 1;
    }
    std::size_t limit = 10;
    if (!limit_raw.empty()) {
      const auto parsed = parse_u64(limit_raw);
      if (!parsed.has_value() || *parsed == 0) {
        std::cerr << "invalid --limit: " << limit_raw << "\n";
        return 1;
      }
      limit = static_cast<std::size_t>(*parsed);
    }
    auto logs = task_store.list_run_logs(args[0], limit);
    if (!logs.ok()) {
      std::cerr << logs.error() << "\n";
      return 1;
    }
    for (const auto &log : logs.value()) {
      std::cout << common::format_rfc3339(log.run_at) << " | " << store::to_string(log.status)
                << " | " << schedule::format_duration(log.duration_ms);
      if (log.error.has_value()) {
        std::cout << " | " << *log.error;
      } else if (log.result.has_value()) {
        std::string preview = common::trim(*log.result);
        if (preview.size() > 120) {
          preview.resize(120);
          preview += "...";
        }
        std::cout << " | " << preview;
      }
      std::cout << "\n";
    }
    return 0;
  }

  std::cerr << "unknown tasks subcommand: " << sub << "\n";
  return 1;
}

int run_config(std::vector<std::string> args) {
  if (args.empty() || args[0] == "check") {
    auto cfg = config::load_config();
    if (!cfg.ok()) {
      std::cerr << cfg.error() << "\n";
      return 1;
    }
    auto validated = config::validate_config(cfg.value());
    if (!validated.ok()) {
      std::cerr << "invalid configuration: " << validated.error() << "\n";
      return 1;
    }
    for (const auto &warning : validated.value()) {
      std::cout << "warning: " << warning << "\n";
    }
    auto paths = config::resolve_paths(cfg.value());
    if (paths.ok()) {
      std::cout << "root: " << paths.value().root.string() << "\n";
      std::cout << "database: " << paths.value().database_path().string() << "\n";
    }
    std::cout << "runtime: " << cfg.value().container.runtime << "\n";
    std::cout << "configuration ok\n";
    return 0;
  }

  if (args[0] == "init") {
    if (config::config_exists()) {
      std::cerr << "configuration already exists\n";
      return 1;
    }
    auto saved = config::save_config(config::Config{});
    if (!saved.ok()) {
      std::cerr << saved.error() << "\n";
      return 1;
    }
    auto path = config::config_path();
    std::cout << "Wrote " << (path.ok() ? path.value().string() : std::string("config")) << "\n";
    return 0;
  }

  std::cerr << "unknown config command\n";
  return 1;
}

void print_help() {
  constexpr const char *RESET = "\033[0m";
  constexpr const char *BOLD = "\033[1m";
  constexpr const char *DIM = "\033[2m";
  constexpr const char *GREEN = "\033[32m";

  std::cout << "\n";
  std::cout << BOLD << "  runclaw" << RESET << DIM << "  scheduled agent execution engine"
            << RESET << "\n";
  std::cout << DIM << "  " << version_string() << RESET << "\n\n";

  std::cout << BOLD << "  USAGE" << RESET << "\n";
  std::cout << DIM << "  $ " << RESET << "runclaw [--config PATH] <command> [options]\n\n";

  std::cout << BOLD << "  SERVICE" << RESET << "\n";
  std::cout << "  " << GREEN << "daemon" << RESET << DIM
            << "               Run the scheduler until SIGINT/SIGTERM [--duration-secs N]"
            << RESET << "\n";
  std::cout << "  " << GREEN << "tick" << RESET << DIM
            << "                 Run one poll cycle and exit" << RESET << "\n\n";

  std::cout << BOLD << "  TASKS" << RESET << "\n";
  std::cout << "  " << GREEN << "tasks list" << RESET << DIM << "           List scheduled tasks"
            << RESET << "\n";
  std::cout << "  " << GREEN << "tasks add" << RESET << DIM
            << "            --group G --chat C --kind K --value V --prompt P" << RESET << "\n";
  std::cout << "  " << GREEN << "tasks pause|resume" << RESET << DIM << "   <id>" << RESET << "\n";
  std::cout << "  " << GREEN << "tasks cancel" << RESET << DIM << "         <id>" << RESET << "\n";
  std::cout << "  " << GREEN << "tasks runs" << RESET << DIM << "           <id> [--limit N]"
            << RESET << "\n\n";

  std::cout << BOLD << "  CONFIGURATION" << RESET << "\n";
  std::cout << "  " << GREEN << "config check" << RESET << DIM
            << "         Validate the configuration" << RESET << "\n";
  std::cout << "  " << GREEN << "config init" << RESET << DIM
            << "          Write a default configuration file" << RESET << "\n";
  std::cout << "  " << GREEN << "config-path" << RESET << DIM
            << "          Print the configuration file path" << RESET << "\n";
  std::cout << "  " << GREEN << "version" << RESET << DIM << "              Show version" << RESET
            << "\n\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc > 0 ? argc - 1 : 0, argc > 0 ? argv + 1 : argv);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }
  if (subcommand == "daemon") {
    return run_daemon(std::move(args));
  }
  if (subcommand == "tick") {
    return run_tick();
  }
  if (subcommand == "tasks") {
    return run_tasks(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace runclaw::cli
