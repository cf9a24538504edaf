#include "runclaw/store/sqlite_task_store.hpp"

#include "runclaw/observability/global.hpp"

namespace runclaw::store {

namespace {

constexpr int kBusyTimeoutMs = 5000;

constexpr const char *kTaskColumns =
    "id, group_folder, chat_jid, prompt, schedule_type, schedule_value, next_run, last_run, "
    "last_result, status, created_at, context_mode";

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string message = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(message);
  }
  return common::Status::success();
}

void bind_params(sqlite3_stmt *stmt, const std::vector<std::optional<std::string>> &params) {
  for (std::size_t i = 0; i < params.size(); ++i) {
    const int index = static_cast<int>(i) + 1;
    if (params[i].has_value()) {
      sqlite3_bind_text(stmt, index, params[i]->c_str(), -1, SQLITE_TRANSIENT);
    } else {
      sqlite3_bind_null(stmt, index);
    }
  }
}

std::optional<std::string> column_text(sqlite3_stmt *stmt, const int column) {
  const auto *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, column));
  if (text == nullptr) {
    return std::nullopt;
  }
  return std::string(text);
}

std::optional<std::string> optional_time(const std::optional<common::TimePoint> &value) {
  if (!value.has_value()) {
    return std::nullopt;
  }
  return common::format_rfc3339(*value);
}

} // namespace

SqliteTaskStore::SqliteTaskStore(std::filesystem::path db_path) : db_path_(std::move(db_path)) {
  std::error_code ec;
  if (db_path_.has_parent_path()) {
    std::filesystem::create_directories(db_path_.parent_path(), ec);
  }
  if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
    open_error_ = db_ == nullptr ? "sqlite open failed" : sqlite3_errmsg(db_);
    if (db_ != nullptr) {
      sqlite3_close(db_);
    }
    db_ = nullptr;
    return;
  }
  sqlite3_busy_timeout(db_, kBusyTimeoutMs);
  if (auto wal = exec_sql(db_, "PRAGMA journal_mode=WAL;"); !wal.ok()) {
    observability::record_error("store", "could not enable WAL: " + wal.error());
  }
  if (auto schema = init_schema(); !schema.ok()) {
    open_error_ = schema.error();
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

SqliteTaskStore::~SqliteTaskStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status SqliteTaskStore::init_schema() {
  if (db_ == nullptr) {
    return common::Status::error("task db not initialized");
  }
  return exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS scheduled_tasks (
  id TEXT PRIMARY KEY,
  group_folder TEXT NOT NULL,
  chat_jid TEXT NOT NULL,
  prompt TEXT NOT NULL,
  schedule_type TEXT NOT NULL,
  schedule_value TEXT NOT NULL,
  next_run TEXT,
  last_run TEXT,
  last_result TEXT,
  status TEXT NOT NULL DEFAULT 'active',
  created_at TEXT NOT NULL,
  context_mode TEXT NOT NULL DEFAULT 'isolated'
);
CREATE TABLE IF NOT EXISTS task_run_logs (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  task_id TEXT NOT NULL,
  run_at TEXT NOT NULL,
  duration_ms INTEGER NOT NULL,
  status TEXT NOT NULL,
  result TEXT,
  error TEXT
);
CREATE INDEX IF NOT EXISTS idx_scheduled_tasks_due ON scheduled_tasks(status, next_run);
CREATE INDEX IF NOT EXISTS idx_task_run_logs_task ON task_run_logs(task_id, run_at);
)");
}

common::Result<int> SqliteTaskStore::execute(const char *sql, const Params &params) {
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<int>::failure(sqlite3_errmsg(db_));
  }
  bind_params(stmt, params);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<int>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<int>::success(sqlite3_changes(db_));
}

common::Result<ScheduledTask> SqliteTaskStore::row_to_task(sqlite3_stmt *stmt) {
  ScheduledTask task;
  task.id = column_text(stmt, 0).value_or("");
  task.group_folder = column_text(stmt, 1).value_or("");
  task.chat_jid = column_text(stmt, 2).value_or("");
  task.prompt = column_text(stmt, 3).value_or("");
  task.schedule_type = column_text(stmt, 4).value_or("");
  task.schedule_value = column_text(stmt, 5).value_or("");

  if (const auto next = column_text(stmt, 6); next.has_value()) {
    auto parsed = common::parse_rfc3339(*next);
    if (!parsed.ok()) {
      return common::Result<ScheduledTask>::failure("task " + task.id +
                                                    " has unreadable next_run: " + parsed.error());
    }
    task.next_run = parsed.value();
  }
  if (const auto last = column_text(stmt, 7); last.has_value()) {
    auto parsed = common::parse_rfc3339(*last);
    if (parsed.ok()) {
      task.last_run = parsed.value();
    }
  }
  task.last_result = column_text(stmt, 8);

  const std::string status_text = column_text(stmt, 9).value_or("");
  const auto status = parse_task_status(status_text);
  if (!status.has_value()) {
    return common::Result<ScheduledTask>::failure("task " + task.id + " has unknown status: " +
                                                  status_text);
  }
  task.status = *status;

  if (const auto created = column_text(stmt, 10); created.has_value()) {
    auto parsed = common::parse_rfc3339(*created);
    if (parsed.ok()) {
      task.created_at = parsed.value();
    }
  }
  task.context_mode = column_text(stmt, 11).value_or("isolated");
  return common::Result<ScheduledTask>::success(std::move(task));
}

common::Result<std::vector<ScheduledTask>>
SqliteTaskStore::query_tasks(const char *sql, const Params &params, const bool skip_bad_rows) {
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::vector<ScheduledTask>>::failure(sqlite3_errmsg(db_));
  }
  bind_params(stmt, params);

  std::vector<ScheduledTask> out;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    auto task = row_to_task(stmt);
    if (!task.ok()) {
      if (skip_bad_rows) {
        observability::record_error("store", task.error());
        continue;
      }
      sqlite3_finalize(stmt);
      return common::Result<std::vector<ScheduledTask>>::failure(task.error());
    }
    out.push_back(std::move(task.value()));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<std::vector<ScheduledTask>>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<std::vector<ScheduledTask>>::success(std::move(out));
}

common::Result<std::vector<ScheduledTask>>
SqliteTaskStore::list_due_tasks(const common::TimePoint now) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::vector<ScheduledTask>>::failure("task db not initialized");
  }
  const std::string sql = std::string("SELECT ") + kTaskColumns +
                          " FROM scheduled_tasks WHERE status = 'active' AND "
                          "(next_run IS NULL OR julianday(next_run) <= julianday(?1)) "
                          "ORDER BY next_run IS NOT NULL, julianday(next_run) ASC, created_at ASC";
  return query_tasks(sql.c_str(), {common::format_rfc3339(now)}, true);
}

common::Result<std::optional<ScheduledTask>> SqliteTaskStore::get_task(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::optional<ScheduledTask>>::failure("task db not initialized");
  }
  const std::string sql =
      std::string("SELECT ") + kTaskColumns + " FROM scheduled_tasks WHERE id = ?1";
  auto rows = query_tasks(sql.c_str(), {id}, false);
  if (!rows.ok()) {
    return common::Result<std::optional<ScheduledTask>>::failure(rows.error());
  }
  if (rows.value().empty()) {
    return common::Result<std::optional<ScheduledTask>>::success(std::nullopt);
  }
  return common::Result<std::optional<ScheduledTask>>::success(std::move(rows.value().front()));
}

common::Status SqliteTaskStore::append_run_log(const TaskRunLog &log) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error("task db not initialized");
  }
  return execute("INSERT INTO task_run_logs(task_id, run_at, duration_ms, status, result, error) "
                 "VALUES(?1, ?2, CAST(?3 AS INTEGER), ?4, ?5, ?6)",
                 {log.task_id, common::format_rfc3339(log.run_at),
                  std::to_string(log.duration_ms), std::string(to_string(log.status)), log.result,
                  log.error})
      .status();
}

common::Status SqliteTaskStore::update_last_run(const std::string &id,
                                                const common::TimePoint run_at,
                                                const std::optional<std::string> &last_result) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error("task db not initialized");
  }
  return execute("UPDATE scheduled_tasks SET last_run = ?2, last_result = ?3 WHERE id = ?1",
                 {id, common::format_rfc3339(run_at), last_result})
      .status();
}

common::Status SqliteTaskStore::update_next_run(const std::string &id,
                                                const std::optional<common::TimePoint> next_run) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error("task db not initialized");
  }
  return execute("UPDATE scheduled_tasks SET next_run = ?2 WHERE id = ?1",
                 {id, optional_time(next_run)})
      .status();
}

common::Status SqliteTaskStore::mark_completed(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error("task db not initialized");
  }
  return execute("UPDATE scheduled_tasks SET status = 'completed', next_run = NULL WHERE id = ?1",
                 {id})
      .status();
}

common::Status SqliteTaskStore::mark_failed(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error("task db not initialized");
  }
  return execute("UPDATE scheduled_tasks SET status = 'failed' WHERE id = ?1", {id}).status();
}

common::Status SqliteTaskStore::create_task(const ScheduledTask &task) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error("task db not initialized");
  }
  return execute(
             "INSERT INTO scheduled_tasks(id, group_folder, chat_jid, prompt, schedule_type, "
             "schedule_value, next_run, last_run, last_result, status, created_at, context_mode) "
             "VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12)",
             {task.id, task.group_folder, task.chat_jid, task.prompt, task.schedule_type,
              task.schedule_value, optional_time(task.next_run), optional_time(task.last_run),
              task.last_result, std::string(to_string(task.status)),
              common::format_rfc3339(task.created_at), task.context_mode})
      .status();
}

common::Result<std::vector<ScheduledTask>> SqliteTaskStore::list_tasks() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::vector<ScheduledTask>>::failure("task db not initialized");
  }
  const std::string sql = std::string("SELECT ") + kTaskColumns +
                          " FROM scheduled_tasks ORDER BY julianday(created_at) ASC, id ASC";
  return query_tasks(sql.c_str(), {}, true);
}

common::Result<std::vector<TaskRunLog>> SqliteTaskStore::list_run_logs(const std::string &task_id,
                                                                       const std::size_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::vector<TaskRunLog>>::failure("task db not initialized");
  }
  sqlite3_stmt *stmt = nullptr;
  const char *sql = "SELECT id, task_id, run_at, duration_ms, status, result, error "
                    "FROM task_run_logs WHERE task_id = ?1 "
                    "ORDER BY julianday(run_at) DESC, id DESC LIMIT ?2";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::vector<TaskRunLog>>::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, task_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(limit));

  std::vector<TaskRunLog> out;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    TaskRunLog log;
    log.id = sqlite3_column_int64(stmt, 0);
    log.task_id = column_text(stmt, 1).value_or("");
    if (auto run_at = common::parse_rfc3339(column_text(stmt, 2).value_or("")); run_at.ok()) {
      log.run_at = run_at.value();
    }
    log.duration_ms = sqlite3_column_int64(stmt, 3);
    log.status = parse_run_status(column_text(stmt, 4).value_or("")).value_or(RunStatus::Error);
    log.result = column_text(stmt, 5);
    log.error = column_text(stmt, 6);
    out.push_back(std::move(log));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<std::vector<TaskRunLog>>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<std::vector<TaskRunLog>>::success(std::move(out));
}

common::Result<bool> SqliteTaskStore::set_status(const std::string &id, const TaskStatus status) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<bool>::failure("task db not initialized");
  }
  auto changed = execute("UPDATE scheduled_tasks SET status = ?2 WHERE id = ?1",
                         {id, std::string(to_string(status))});
  if (!changed.ok()) {
    return common::Result<bool>::failure(changed.error());
  }
  return common::Result<bool>::success(changed.value() > 0);
}

} // namespace runclaw::store
