#pragma once

#include "runclaw/common/result.hpp"
#include "runclaw/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace runclaw::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml_text);
[[nodiscard]] common::Status save_config(const Config &config);

/// Hard errors fail the result; soft problems come back as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

/// Directory layout derived from `paths.root`.
struct RuntimePaths {
  std::filesystem::path root;
  std::filesystem::path store_dir;
  std::filesystem::path groups_dir;
  std::filesystem::path data_dir;

  [[nodiscard]] std::filesystem::path database_path() const { return store_dir / "messages.db"; }
  [[nodiscard]] std::filesystem::path ipc_dir() const { return data_dir / "ipc"; }
  [[nodiscard]] std::filesystem::path temp_dir() const { return data_dir / "tmp"; }
  [[nodiscard]] std::filesystem::path transcript_dir() const { return groups_dir / "logs"; }
};

[[nodiscard]] common::Result<RuntimePaths> resolve_paths(const Config &config);

/// Creates every directory in `paths`.
[[nodiscard]] common::Status ensure_directories(const RuntimePaths &paths);

/// Points the process time zone at `timezone` so cron evaluation uses it.
void apply_timezone(const std::string &timezone);

} // namespace runclaw::config
