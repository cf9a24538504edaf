#pragma once

#include "runclaw/common/result.hpp"

#include <chrono>
#include <string>

namespace runclaw::common {

using TimePoint = std::chrono::system_clock::time_point;

/// `2026-01-02T03:04:05.678Z`
[[nodiscard]] std::string format_rfc3339(TimePoint time_point);

/// Accepts `YYYY-MM-DDTHH:MM:SS[.fraction](Z|z|+HH:MM|-HH:MM)`; a space may replace the `T`.
[[nodiscard]] Result<TimePoint> parse_rfc3339(const std::string &value);

/// `20260102_030405` in UTC, used for artifact file names.
[[nodiscard]] std::string format_compact_utc(TimePoint time_point);

} // namespace runclaw::common
