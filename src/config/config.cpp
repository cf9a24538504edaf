#include "runclaw/config/config.hpp"

#include "runclaw/common/fs.hpp"
#include "runclaw/common/toml.hpp"
#include "runclaw/observability/observer.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

namespace runclaw::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".runclaw";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("RUNCLAW_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string strip_env_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    std::string out;
    out.reserve(value.size() - 2);
    bool escaped = false;
    for (std::size_t i = 1; i + 1 < value.size(); ++i) {
      const char ch = value[i];
      if (!escaped) {
        if (ch == '\\') {
          escaped = true;
          continue;
        }
        out.push_back(ch);
        continue;
      }
      switch (ch) {
      case 'n':
        out.push_back('\n');
        break;
      case 't':
        out.push_back('\t');
        break;
      default:
        out.push_back(ch);
        break;
      }
      escaped = false;
    }
    return out;
  }
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  if (!(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  for (const char ch : name) {
    const auto uch = static_cast<unsigned char>(ch);
    if (!(std::isalnum(uch) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }

  std::ifstream file(path);
  if (!file) {
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }

    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }

    const std::string key = common::trim(trimmed.substr(0, eq));
    if (!is_valid_env_name(key)) {
      continue;
    }
    // existing environment wins
    setenv(key.c_str(), strip_env_quotes(trimmed.substr(eq + 1)).c_str(), 0);
  }
}

void load_dotenv_files() {
  std::vector<std::filesystem::path> candidates;
  if (const char *env_file = std::getenv("RUNCLAW_ENV_FILE");
      env_file != nullptr && *env_file != '\0') {
    candidates.emplace_back(common::expand_path(env_file));
  }
  if (auto dir = config_dir(); dir.ok()) {
    candidates.push_back(dir.value() / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    candidates.push_back(cwd / ".env");
  }

  for (const auto &candidate : candidates) {
    load_dotenv_file(candidate);
  }
}

std::optional<std::string> env_value(const char *name) {
  if (const char *value = std::getenv(name); value != nullptr && *value != '\0') {
    return std::string(value);
  }
  return std::nullopt;
}

std::optional<std::uint64_t> env_positive_u64(const char *name) {
  const auto raw = env_value(name);
  if (!raw.has_value()) {
    return std::nullopt;
  }
  const std::string value = common::trim(*raw);
  std::uint64_t parsed = 0;
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (ec != std::errc() || ptr != value.data() + value.size() || parsed == 0) {
    return std::nullopt;
  }
  return parsed;
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    std::filesystem::path candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::ensure_dir(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }

  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Config &config) {
  load_dotenv_files();

  if (const auto value = env_positive_u64("SCHEDULER_POLL_INTERVAL"); value.has_value()) {
    config.scheduler.poll_interval_secs = *value;
  }
  if (const auto value = env_positive_u64("TASK_TIMEOUT"); value.has_value()) {
    config.scheduler.task_timeout_secs = *value;
  }
  if (const auto value = env_positive_u64("MAX_CONCURRENT_TASKS");
      value.has_value() && *value <= 1024) {
    config.scheduler.max_concurrent_tasks = static_cast<std::uint32_t>(*value);
  }
  if (const auto value = env_positive_u64("CONTAINER_TIMEOUT"); value.has_value()) {
    config.container.timeout_ms = *value;
  }
  if (const auto value = env_positive_u64("CONTAINER_MAX_OUTPUT_SIZE"); value.has_value()) {
    config.container.max_output_bytes = *value;
  }
  if (const auto value = env_value("CONTAINER_IMAGE"); value.has_value()) {
    config.container.image = *value;
  }
  if (const auto value = env_value("TZ"); value.has_value()) {
    config.timezone = *value;
  }
  if (const auto value = env_value("RUNCLAW_ROOT"); value.has_value()) {
    config.paths.root = *value;
  }
  if (const auto value = env_value("RUNCLAW_LOG_LEVEL"); value.has_value()) {
    config.observability.log_level = *value;
  }
  if (const auto value = env_value("RUNCLAW_OBSERVABILITY"); value.has_value()) {
    config.observability.backend = *value;
  }
}

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;
  config.timezone = doc.get_string("timezone", config.timezone);
  config.paths.root = doc.get_string("paths.root", config.paths.root);

  auto &scheduler = config.scheduler;
  scheduler.poll_interval_secs =
      doc.get_u64("scheduler.poll_interval_secs", scheduler.poll_interval_secs);
  scheduler.task_timeout_secs =
      doc.get_u64("scheduler.task_timeout_secs", scheduler.task_timeout_secs);
  scheduler.max_concurrent_tasks = static_cast<std::uint32_t>(
      doc.get_u64("scheduler.max_concurrent_tasks", scheduler.max_concurrent_tasks));
  scheduler.poll_on_start = doc.get_bool("scheduler.poll_on_start", scheduler.poll_on_start);

  auto &container = config.container;
  container.runtime = common::to_lower(doc.get_string("container.runtime", container.runtime));
  container.binary = doc.get_string("container.binary", container.binary);
  container.image = doc.get_string("container.image", container.image);
  container.args = doc.get_string_array("container.args", container.args);
  container.command = doc.get_string_array("container.command", container.command);
  container.timeout_ms = doc.get_u64("container.timeout_ms", container.timeout_ms);
  container.max_output_bytes =
      doc.get_u64("container.max_output_bytes", container.max_output_bytes);
  container.network = doc.get_string("container.network", container.network);
  if (doc.has("container.memory_limit")) {
    container.memory_limit = doc.get_string("container.memory_limit");
  }
  if (doc.has("container.cpu_limit")) {
    container.cpu_limit = doc.get_double("container.cpu_limit", 0.0);
  }
  if (doc.has("container.pids_limit")) {
    container.pids_limit = static_cast<std::uint32_t>(doc.get_u64("container.pids_limit", 0));
  }
  container.passthrough_env =
      doc.get_string_array("container.passthrough_env", container.passthrough_env);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
  config.observability.log_level =
      doc.get_string("observability.log_level", config.observability.log_level);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  load_dotenv_files();

  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  auto content = common::read_text_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  auto config = parse_config(content.value());
  if (!config.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + config.error());
  }
  apply_env_overrides(config.value());
  return config;
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Status::error(cfg_path_result.error());
  }

  std::ostringstream file;
  file << "timezone = " << common::quote_toml_string(config.timezone) << "\n";

  file << "\n[paths]\n";
  file << "root = " << common::quote_toml_string(config.paths.root) << "\n";

  file << "\n[scheduler]\n";
  file << "poll_interval_secs = " << config.scheduler.poll_interval_secs << "\n";
  file << "task_timeout_secs = " << config.scheduler.task_timeout_secs << "\n";
  file << "max_concurrent_tasks = " << config.scheduler.max_concurrent_tasks << "\n";
  file << "poll_on_start = " << bool_to_toml(config.scheduler.poll_on_start) << "\n";

  const auto &container = config.container;
  file << "\n[container]\n";
  file << "runtime = " << common::quote_toml_string(container.runtime) << "\n";
  file << "binary = " << common::quote_toml_string(container.binary) << "\n";
  file << "image = " << common::quote_toml_string(container.image) << "\n";
  file << "args = " << common::toml_string_array(container.args) << "\n";
  file << "command = " << common::toml_string_array(container.command) << "\n";
  file << "timeout_ms = " << container.timeout_ms << "\n";
  file << "max_output_bytes = " << container.max_output_bytes << "\n";
  file << "network = " << common::quote_toml_string(container.network) << "\n";
  if (container.memory_limit.has_value()) {
    file << "memory_limit = " << common::quote_toml_string(*container.memory_limit) << "\n";
  }
  if (container.cpu_limit.has_value()) {
    file << "cpu_limit = " << *container.cpu_limit << "\n";
  }
  if (container.pids_limit.has_value()) {
    file << "pids_limit = " << *container.pids_limit << "\n";
  }
  file << "passthrough_env = " << common::toml_string_array(container.passthrough_env) << "\n";

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  file << "log_level = " << common::quote_toml_string(config.observability.log_level) << "\n";

  return common::write_text_file(cfg_path_result.value(), file.str());
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using Warnings = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  const auto &scheduler = config.scheduler;
  if (scheduler.poll_interval_secs == 0) {
    return Warnings::failure("scheduler.poll_interval_secs must be > 0");
  }
  if (scheduler.task_timeout_secs == 0) {
    return Warnings::failure("scheduler.task_timeout_secs must be > 0");
  }
  if (scheduler.max_concurrent_tasks == 0) {
    return Warnings::failure("scheduler.max_concurrent_tasks must be > 0");
  }

  const auto &container = config.container;
  if (container.runtime != "docker" && container.runtime != "command") {
    return Warnings::failure("Invalid container.runtime: " + container.runtime);
  }
  if (container.runtime == "docker") {
    if (common::trim(container.binary).empty()) {
      return Warnings::failure("container.binary is required for the docker runtime");
    }
    if (common::trim(container.image).empty()) {
      return Warnings::failure("container.image is required for the docker runtime");
    }
  }
  if (container.runtime == "command" && container.command.empty()) {
    return Warnings::failure("container.command is required for the command runtime");
  }
  if (container.timeout_ms == 0) {
    return Warnings::failure("container.timeout_ms must be > 0");
  }
  if (container.max_output_bytes == 0) {
    return Warnings::failure("container.max_output_bytes must be > 0");
  }
  if (container.cpu_limit.has_value() && *container.cpu_limit <= 0.0) {
    return Warnings::failure("container.cpu_limit must be > 0");
  }

  if (!observability::parse_log_level(common::trim(config.observability.log_level)).has_value()) {
    return Warnings::failure("Invalid observability.log_level: " + config.observability.log_level);
  }

  if (scheduler.task_timeout_secs < scheduler.poll_interval_secs) {
    warnings.push_back("scheduler.task_timeout_secs is shorter than the poll interval");
  }
  if (container.timeout_ms < scheduler.task_timeout_secs * 1000) {
    warnings.push_back("scheduled runs are capped by container.timeout_ms (" +
                       std::to_string(container.timeout_ms) + "ms)");
  }
  const std::string zone = common::trim(config.timezone);
  if (zone.empty()) {
    warnings.push_back("timezone is empty; cron expressions use the host zone");
  } else if (zone != "UTC" && zone.front() != ':') {
    std::error_code ec;
    if (!std::filesystem::exists(std::filesystem::path("/usr/share/zoneinfo") / zone, ec)) {
      warnings.push_back("timezone not found in /usr/share/zoneinfo: " + zone);
    }
  }

  return Warnings::success(std::move(warnings));
}

common::Result<RuntimePaths> resolve_paths(const Config &config) {
  RuntimePaths paths;
  const std::string root = common::trim(config.paths.root);
  if (root.empty()) {
    auto dir = config_dir();
    if (!dir.ok()) {
      return common::Result<RuntimePaths>::failure(dir.error());
    }
    paths.root = dir.value();
  } else {
    paths.root = std::filesystem::path(common::expand_path(root));
  }
  paths.store_dir = paths.root / "store";
  paths.groups_dir = paths.root / "groups";
  paths.data_dir = paths.root / "data";
  return common::Result<RuntimePaths>::success(std::move(paths));
}

common::Status ensure_directories(const RuntimePaths &paths) {
  for (const auto &dir : {paths.store_dir, paths.groups_dir, paths.data_dir, paths.ipc_dir(),
                          paths.temp_dir(), paths.transcript_dir()}) {
    auto created = common::ensure_dir(dir);
    if (!created.ok()) {
      return common::Status::error(created.error());
    }
  }
  return common::Status::success();
}

void apply_timezone(const std::string &timezone) {
  const std::string zone = common::trim(timezone);
  if (zone.empty()) {
    return;
  }
  setenv("TZ", zone.c_str(), 1);
  tzset();
}

} // namespace runclaw::config
