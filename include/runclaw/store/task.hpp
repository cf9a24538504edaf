#pragma once

#include "runclaw/common/time.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace runclaw::store {

enum class TaskStatus { Active, Completed, Failed, Paused };

enum class RunStatus { Success, Error, Timeout };

[[nodiscard]] std::string_view to_string(TaskStatus status);
[[nodiscard]] std::optional<TaskStatus> parse_task_status(std::string_view value);
[[nodiscard]] std::string_view to_string(RunStatus status);
[[nodiscard]] std::optional<RunStatus> parse_run_status(std::string_view value);

struct ScheduledTask {
  std::string id;
  std::string group_folder;
  std::string chat_jid;
  std::string prompt;
  /// `cron`, `interval` or `once`; other values never reschedule.
  std::string schedule_type;
  std::string schedule_value;
  /// Empty means due immediately.
  std::optional<common::TimePoint> next_run;
  std::optional<common::TimePoint> last_run;
  std::optional<std::string> last_result;
  TaskStatus status = TaskStatus::Active;
  common::TimePoint created_at{};
  std::string context_mode = "isolated";
};

struct TaskRunLog {
  std::int64_t id = 0;
  std::string task_id;
  common::TimePoint run_at{};
  std::int64_t duration_ms = 0;
  RunStatus status = RunStatus::Success;
  std::optional<std::string> result;
  std::optional<std::string> error;
};

} // namespace runclaw::store
