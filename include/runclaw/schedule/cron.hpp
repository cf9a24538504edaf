#pragma once

#include "runclaw/common/result.hpp"
#include "runclaw/common/time.hpp"

#include <ctime>
#include <optional>
#include <string_view>
#include <vector>

namespace runclaw::schedule {

/// Cron expression in 5-field (`min hour dom mon dow`), 6-field (leading seconds) or 7-field
/// (trailing year) form. Evaluated in the process-local time zone.
class CronExpression {
public:
  [[nodiscard]] static common::Result<CronExpression> parse(std::string_view expression);

  /// First matching instant strictly after `after`, or nothing within five years.
  [[nodiscard]] std::optional<common::TimePoint> next_occurrence(common::TimePoint after) const;
  [[nodiscard]] bool matches(const std::tm &time) const;

private:
  enum class Names { None, Months, Weekdays };

  [[nodiscard]] static common::Result<std::vector<int>> parse_field(std::string_view field, int min,
                                                                     int max, Names names);
  [[nodiscard]] bool day_matches(const std::tm &day) const;

  std::vector<int> seconds_;
  std::vector<int> minutes_;
  std::vector<int> hours_;
  std::vector<int> days_;
  std::vector<int> months_;
  std::vector<int> weekdays_;
  std::vector<int> years_;
  bool days_restricted_ = false;
  bool weekdays_restricted_ = false;
};

} // namespace runclaw::schedule
