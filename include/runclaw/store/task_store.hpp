#pragma once

#include "runclaw/common/result.hpp"
#include "runclaw/store/task.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace runclaw::store {

/// Persistence boundary for scheduled tasks and their run history. Implementations must be
/// safe for concurrent use; every call is atomic with respect to the row it touches.
class ITaskStore {
public:
  virtual ~ITaskStore() = default;

  /// Active tasks whose next run is unset or not after `now`, earliest first, unset first.
  [[nodiscard]] virtual common::Result<std::vector<ScheduledTask>>
  list_due_tasks(common::TimePoint now) = 0;
  [[nodiscard]] virtual common::Result<std::optional<ScheduledTask>>
  get_task(const std::string &id) = 0;

  [[nodiscard]] virtual common::Status append_run_log(const TaskRunLog &log) = 0;
  [[nodiscard]] virtual common::Status
  update_last_run(const std::string &id, common::TimePoint run_at,
                  const std::optional<std::string> &last_result) = 0;
  [[nodiscard]] virtual common::Status
  update_next_run(const std::string &id, std::optional<common::TimePoint> next_run) = 0;
  /// Sets status `completed` and clears the next run.
  [[nodiscard]] virtual common::Status mark_completed(const std::string &id) = 0;
  [[nodiscard]] virtual common::Status mark_failed(const std::string &id) = 0;

  [[nodiscard]] virtual common::Status create_task(const ScheduledTask &task) = 0;
  [[nodiscard]] virtual common::Result<std::vector<ScheduledTask>> list_tasks() = 0;
  /// Newest first.
  [[nodiscard]] virtual common::Result<std::vector<TaskRunLog>>
  list_run_logs(const std::string &task_id, std::size_t limit) = 0;
  /// Returns false when no task has that id.
  [[nodiscard]] virtual common::Result<bool> set_status(const std::string &id,
                                                        TaskStatus status) = 0;
};

} // namespace runclaw::store
