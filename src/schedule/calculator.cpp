#include "runclaw/schedule/calculator.hpp"

#include "runclaw/common/fs.hpp"
#include "runclaw/observability/global.hpp"
#include "runclaw/schedule/cron.hpp"

#include <charconv>

namespace runclaw::schedule {

namespace {

std::optional<std::int64_t> parse_interval_ms(const std::string &raw) {
  const std::string value = common::trim(raw);
  std::int64_t parsed = 0;
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (value.empty() || ec != std::errc() || ptr != value.data() + value.size() || parsed < 0) {
    return std::nullopt;
  }
  return parsed;
}

// Nothing when now + interval is not representable by the clock.
std::optional<common::TimePoint> add_interval(const common::TimePoint now,
                                              const std::int64_t interval_ms) {
  using std::chrono::duration_cast;
  using std::chrono::milliseconds;
  const std::int64_t max_ms = duration_cast<milliseconds>(common::TimePoint::duration::max()).count();
  const std::int64_t now_ms = duration_cast<milliseconds>(now.time_since_epoch()).count();
  // one spare millisecond covers the sub-millisecond part of now
  if (interval_ms > max_ms || interval_ms > max_ms - now_ms - 1) {
    return std::nullopt;
  }
  return now + milliseconds(interval_ms);
}

} // namespace

std::optional<ScheduleKind> parse_schedule_kind(std::string_view value) {
  if (value == "cron") {
    return ScheduleKind::Cron;
  }
  if (value == "interval") {
    return ScheduleKind::Interval;
  }
  if (value == "once") {
    return ScheduleKind::Once;
  }
  return std::nullopt;
}

std::string_view to_string(const ScheduleKind kind) {
  switch (kind) {
  case ScheduleKind::Cron:
    return "cron";
  case ScheduleKind::Interval:
    return "interval";
  case ScheduleKind::Once:
    return "once";
  }
  return "once";
}

bool is_valid_schedule_type(std::string_view value) {
  return parse_schedule_kind(value).has_value();
}

std::optional<common::TimePoint> compute_next_run(const store::ScheduledTask &task,
                                                  const common::TimePoint now) {
  const auto kind = parse_schedule_kind(task.schedule_type);
  if (!kind.has_value()) {
    return std::nullopt;
  }

  switch (*kind) {
  case ScheduleKind::Once:
    return std::nullopt;
  case ScheduleKind::Interval: {
    const auto interval = parse_interval_ms(task.schedule_value);
    if (!interval.has_value()) {
      return std::nullopt;
    }
    return add_interval(now, *interval);
  }
  case ScheduleKind::Cron: {
    auto expression = CronExpression::parse(task.schedule_value);
    if (!expression.ok()) {
      observability::record_error("schedule", "task " + task.id + " has invalid cron expression '" +
                                                  task.schedule_value + "': " +
                                                  expression.error());
      return std::nullopt;
    }
    return expression.value().next_occurrence(now);
  }
  }
  return std::nullopt;
}

common::Result<common::TimePoint> initial_next_run(std::string_view kind_text,
                                                   const std::string &value,
                                                   const common::TimePoint now) {
  const auto kind = parse_schedule_kind(kind_text);
  if (!kind.has_value()) {
    return common::Result<common::TimePoint>::failure("unknown schedule type: " +
                                                      std::string(kind_text));
  }

  switch (*kind) {
  case ScheduleKind::Once:
    return common::parse_rfc3339(value);
  case ScheduleKind::Interval: {
    const auto interval = parse_interval_ms(value);
    if (!interval.has_value()) {
      return common::Result<common::TimePoint>::failure(
          "interval must be a non-negative number of milliseconds: " + value);
    }
    const auto next = add_interval(now, *interval);
    if (!next.has_value()) {
      return common::Result<common::TimePoint>::failure("interval is too large: " + value);
    }
    return common::Result<common::TimePoint>::success(*next);
  }
  case ScheduleKind::Cron: {
    auto expression = CronExpression::parse(value);
    if (!expression.ok()) {
      return common::Result<common::TimePoint>::failure("invalid cron expression: " +
                                                        expression.error());
    }
    const auto next = expression.value().next_occurrence(now);
    if (!next.has_value()) {
      return common::Result<common::TimePoint>::failure("cron expression never fires: " + value);
    }
    return common::Result<common::TimePoint>::success(*next);
  }
  }
  return common::Result<common::TimePoint>::failure("unknown schedule type");
}

common::Status validate_schedule(std::string_view kind, const std::string &value,
                                 const common::TimePoint now) {
  return initial_next_run(kind, value, now).status();
}

bool is_task_due(const store::ScheduledTask &task, const common::TimePoint now) {
  if (task.status != store::TaskStatus::Active) {
    return false;
  }
  return !task.next_run.has_value() || *task.next_run <= now;
}

store::TaskStatus determine_task_status(const bool success, const bool is_once) {
  if (!success) {
    return store::TaskStatus::Failed;
  }
  return is_once ? store::TaskStatus::Completed : store::TaskStatus::Active;
}

std::string format_duration(const std::int64_t milliseconds) {
  if (milliseconds < 1000) {
    return std::to_string(milliseconds) + "ms";
  }
  if (milliseconds < 60'000) {
    return std::to_string(milliseconds / 1000) + "s";
  }
  return std::to_string(milliseconds / 60'000) + "m";
}

} // namespace runclaw::schedule
