#include "runclaw/store/task.hpp"

namespace runclaw::store {

std::string_view to_string(const TaskStatus status) {
  switch (status) {
  case TaskStatus::Active:
    return "active";
  case TaskStatus::Completed:
    return "completed";
  case TaskStatus::Failed:
    return "failed";
  case TaskStatus::Paused:
    return "paused";
  }
  return "active";
}

std::optional<TaskStatus> parse_task_status(std::string_view value) {
  if (value == "active") {
    return TaskStatus::Active;
  }
  if (value == "completed") {
    return TaskStatus::Completed;
  }
  if (value == "failed") {
    return TaskStatus::Failed;
  }
  if (value == "paused") {
    return TaskStatus::Paused;
  }
  return std::nullopt;
}

std::string_view to_string(const RunStatus status) {
  switch (status) {
  case RunStatus::Success:
    return "success";
  case RunStatus::Error:
    return "error";
  case RunStatus::Timeout:
    return "timeout";
  }
  return "error";
}

std::optional<RunStatus> parse_run_status(std::string_view value) {
  if (value == "success") {
    return RunStatus::Success;
  }
  if (value == "error") {
    return RunStatus::Error;
  }
  if (value == "timeout") {
    return RunStatus::Timeout;
  }
  return std::nullopt;
}

} // namespace runclaw::store
