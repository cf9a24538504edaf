#pragma once

#include "runclaw/common/result.hpp"
#include "runclaw/common/time.hpp"
#include "runclaw/store/task.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace runclaw::schedule {

enum class ScheduleKind { Cron, Interval, Once };

[[nodiscard]] std::optional<ScheduleKind> parse_schedule_kind(std::string_view value);
[[nodiscard]] std::string_view to_string(ScheduleKind kind);
[[nodiscard]] bool is_valid_schedule_type(std::string_view value);

/// Next due instant after a completed run, or nothing when the task does not recur (once
/// tasks, unknown kinds, unparseable values). `now` is the only notion of time consulted.
[[nodiscard]] std::optional<common::TimePoint> compute_next_run(const store::ScheduledTask &task,
                                                                common::TimePoint now);

/// First due instant for a newly created task. Fails when the value does not fit the kind.
[[nodiscard]] common::Result<common::TimePoint>
initial_next_run(std::string_view kind, const std::string &value, common::TimePoint now);

[[nodiscard]] common::Status validate_schedule(std::string_view kind, const std::string &value,
                                               common::TimePoint now);

[[nodiscard]] bool is_task_due(const store::ScheduledTask &task, common::TimePoint now);
[[nodiscard]] store::TaskStatus determine_task_status(bool success, bool is_once);

/// `500ms`, `42s`, `3m`
[[nodiscard]] std::string format_duration(std::int64_t milliseconds);

} // namespace runclaw::schedule
