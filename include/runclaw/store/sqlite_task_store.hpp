#pragma once

#include "runclaw/store/task_store.hpp"

#include <filesystem>
#include <mutex>
#include <sqlite3.h>

namespace runclaw::store {

class SqliteTaskStore final : public ITaskStore {
public:
  explicit SqliteTaskStore(std::filesystem::path db_path);
  ~SqliteTaskStore() override;

  SqliteTaskStore(const SqliteTaskStore &) = delete;
  SqliteTaskStore &operator=(const SqliteTaskStore &) = delete;

  [[nodiscard]] bool is_open() const { return db_ != nullptr; }
  [[nodiscard]] const std::string &open_error() const { return open_error_; }
  [[nodiscard]] const std::filesystem::path &path() const { return db_path_; }

  [[nodiscard]] common::Result<std::vector<ScheduledTask>>
  list_due_tasks(common::TimePoint now) override;
  [[nodiscard]] common::Result<std::optional<ScheduledTask>>
  get_task(const std::string &id) override;

  [[nodiscard]] common::Status append_run_log(const TaskRunLog &log) override;
  [[nodiscard]] common::Status update_last_run(const std::string &id, common::TimePoint run_at,
                                               const std::optional<std::string> &last_result) override;
  [[nodiscard]] common::Status update_next_run(const std::string &id,
                                               std::optional<common::TimePoint> next_run) override;
  [[nodiscard]] common::Status mark_completed(const std::string &id) override;
  [[nodiscard]] common::Status mark_failed(const std::string &id) override;

  [[nodiscard]] common::Status create_task(const ScheduledTask &task) override;
  [[nodiscard]] common::Result<std::vector<ScheduledTask>> list_tasks() override;
  [[nodiscard]] common::Result<std::vector<TaskRunLog>>
  list_run_logs(const std::string &task_id, std::size_t limit) override;
  [[nodiscard]] common::Result<bool> set_status(const std::string &id,
                                                TaskStatus status) override;

private:
  using Params = std::vector<std::optional<std::string>>;

  [[nodiscard]] common::Status init_schema();
  [[nodiscard]] common::Result<int> execute(const char *sql, const Params &params);
  [[nodiscard]] common::Result<std::vector<ScheduledTask>>
  query_tasks(const char *sql, const Params &params, bool skip_bad_rows);
  [[nodiscard]] static common::Result<ScheduledTask> row_to_task(sqlite3_stmt *stmt);

  std::filesystem::path db_path_;
  sqlite3 *db_ = nullptr;
  std::string open_error_;
  std::mutex mutex_;
};

} // namespace runclaw::store
