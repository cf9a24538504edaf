#include "runclaw/schedule/cron.hpp"

#include "runclaw/common/fs.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <set>
#include <sstream>
#include <string>

namespace runclaw::schedule {

namespace {

constexpr int kSearchDays = 366 * 5;
constexpr int kMinYear = 1970;
constexpr int kMaxYear = 2099;

constexpr std::array<const char *, 12> kMonthNames = {"jan", "feb", "mar", "apr", "may", "jun",
                                                      "jul", "aug", "sep", "oct", "nov", "dec"};
constexpr std::array<const char *, 7> kWeekdayNames = {"sun", "mon", "tue", "wed",
                                                       "thu", "fri", "sat"};

bool contains_value(const std::vector<int> &values, const int value) {
  return std::binary_search(values.begin(), values.end(), value);
}

std::string normalize_expression(std::string expression) {
  expression = common::to_lower(common::trim(expression));
  if (expression == "@yearly" || expression == "@annually") {
    return "0 0 1 1 *";
  }
  if (expression == "@monthly") {
    return "0 0 1 * *";
  }
  if (expression == "@weekly") {
    return "0 0 * * 0";
  }
  if (expression == "@daily" || expression == "@midnight") {
    return "0 0 * * *";
  }
  if (expression == "@hourly") {
    return "0 * * * *";
  }
  return expression;
}

common::Result<int> parse_int(const std::string &value) {
  int parsed = 0;
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (value.empty() || ec != std::errc() || ptr != value.data() + value.size()) {
    return common::Result<int>::failure("invalid integer: " + value);
  }
  return common::Result<int>::success(parsed);
}

bool is_wildcard(const std::string &field) {
  return !field.empty() && (field.front() == '*' || field.front() == '?');
}

} // namespace

common::Result<CronExpression> CronExpression::parse(std::string_view expression_view) {
  const std::string normalized = normalize_expression(std::string(expression_view));

  std::istringstream stream(normalized);
  std::vector<std::string> fields;
  std::string field;
  while (stream >> field) {
    fields.push_back(field);
  }
  if (fields.size() < 5 || fields.size() > 7) {
    return common::Result<CronExpression>::failure(
        "cron expression must have 5, 6 or 7 fields");
  }
  if (fields.size() == 5) {
    fields.insert(fields.begin(), "0");
  }
  if (fields.size() == 6) {
    fields.push_back("*");
  }

  struct FieldSpec {
    int min;
    int max;
    Names names;
    std::vector<int> CronExpression::*target;
  };
  const std::array<FieldSpec, 7> specs = {{
      {0, 59, Names::None, &CronExpression::seconds_},
      {0, 59, Names::None, &CronExpression::minutes_},
      {0, 23, Names::None, &CronExpression::hours_},
      {1, 31, Names::None, &CronExpression::days_},
      {1, 12, Names::Months, &CronExpression::months_},
      {0, 7, Names::Weekdays, &CronExpression::weekdays_},
      {kMinYear, kMaxYear, Names::None, &CronExpression::years_},
  }};

  CronExpression expression;
  for (std::size_t i = 0; i < specs.size(); ++i) {
    auto values = parse_field(fields[i], specs[i].min, specs[i].max, specs[i].names);
    if (!values.ok()) {
      return common::Result<CronExpression>::failure("field " + std::to_string(i + 1) + " '" +
                                                     fields[i] + "': " + values.error());
    }
    expression.*(specs[i].target) = std::move(values.value());
  }

  // 7 is an alias for Sunday
  auto &weekdays = expression.weekdays_;
  if (contains_value(weekdays, 7)) {
    weekdays.pop_back();
    if (!contains_value(weekdays, 0)) {
      weekdays.insert(weekdays.begin(), 0);
    }
  }

  expression.days_restricted_ = !is_wildcard(fields[3]);
  expression.weekdays_restricted_ = !is_wildcard(fields[5]);
  return common::Result<CronExpression>::success(std::move(expression));
}

common::Result<std::vector<int>> CronExpression::parse_field(std::string_view field_view,
                                                             const int min, const int max,
                                                             const Names names) {
  const std::string field = common::trim(std::string(field_view));
  if (field.empty()) {
    return common::Result<std::vector<int>>::failure("empty cron field");
  }

  auto resolve = [names](const std::string &token) -> common::Result<int> {
    if (names != Names::None && token.size() == 3 &&
        std::isalpha(static_cast<unsigned char>(token.front())) != 0) {
      if (names == Names::Months) {
        for (std::size_t i = 0; i < kMonthNames.size(); ++i) {
          if (token == kMonthNames[i]) {
            return common::Result<int>::success(static_cast<int>(i) + 1);
          }
        }
      } else {
        for (std::size_t i = 0; i < kWeekdayNames.size(); ++i) {
          if (token == kWeekdayNames[i]) {
            return common::Result<int>::success(static_cast<int>(i));
          }
        }
      }
      return common::Result<int>::failure("unknown name: " + token);
    }
    return parse_int(token);
  };

  std::set<int> values;

  auto add_range = [&](int start, int end, int step) -> common::Status {
    if (step <= 0) {
      return common::Status::error("step must be positive");
    }
    if (start > end || start < min || end > max) {
      return common::Status::error("field range out of bounds");
    }
    for (int value = start; value <= end; value += step) {
      values.insert(value);
    }
    return common::Status::success();
  };

  auto parse_range = [&](const std::string &base, int &start, int &end) -> common::Status {
    const auto dash = base.find('-');
    if (dash == std::string::npos) {
      auto value = resolve(base);
      if (!value.ok()) {
        return value.status();
      }
      start = value.value();
      end = value.value();
      return common::Status::success();
    }
    auto left = resolve(common::trim(base.substr(0, dash)));
    auto right = resolve(common::trim(base.substr(dash + 1)));
    if (!left.ok() || !right.ok()) {
      return common::Status::error("invalid range: " + base);
    }
    start = left.value();
    end = right.value();
    return common::Status::success();
  };

  std::stringstream parts(field);
  std::string segment;
  while (std::getline(parts, segment, ',')) {
    segment = common::trim(segment);
    if (segment.empty()) {
      return common::Result<std::vector<int>>::failure("empty list element");
    }

    std::string base = segment;
    int step = 1;
    bool stepped = false;
    if (const auto slash = segment.find('/'); slash != std::string::npos) {
      base = common::trim(segment.substr(0, slash));
      auto parsed_step = parse_int(common::trim(segment.substr(slash + 1)));
      if (!parsed_step.ok()) {
        return common::Result<std::vector<int>>::failure(parsed_step.error());
      }
      step = parsed_step.value();
      stepped = true;
    }

    int range_start = min;
    int range_end = max;
    if (base != "*" && base != "?") {
      auto status = parse_range(base, range_start, range_end);
      if (!status.ok()) {
        return common::Result<std::vector<int>>::failure(status.error());
      }
      // `a/n` runs from a to the end of the field
      if (stepped && base.find('-') == std::string::npos) {
        range_end = max;
      }
    }

    auto status = add_range(range_start, range_end, step);
    if (!status.ok()) {
      return common::Result<std::vector<int>>::failure(status.error());
    }
  }

  if (values.empty()) {
    return common::Result<std::vector<int>>::failure("no values in field");
  }

  return common::Result<std::vector<int>>::success(std::vector<int>(values.begin(), values.end()));
}

bool CronExpression::day_matches(const std::tm &day) const {
  if (!contains_value(months_, day.tm_mon + 1) || !contains_value(years_, day.tm_year + 1900)) {
    return false;
  }
  const bool dom = contains_value(days_, day.tm_mday);
  const bool dow = contains_value(weekdays_, day.tm_wday);
  if (days_restricted_ && weekdays_restricted_) {
    return dom || dow;
  }
  return dom && dow;
}

bool CronExpression::matches(const std::tm &time) const {
  return contains_value(seconds_, time.tm_sec) && contains_value(minutes_, time.tm_min) &&
         contains_value(hours_, time.tm_hour) && day_matches(time);
}

std::optional<common::TimePoint>
CronExpression::next_occurrence(const common::TimePoint after) const {
  const std::time_t floor_after =
      std::chrono::system_clock::to_time_t(std::chrono::floor<std::chrono::seconds>(after));
  std::tm start{};
  localtime_r(&floor_after, &start);

  for (int offset = 0; offset < kSearchDays; ++offset) {
    // Noon keeps the normalized date clear of DST transitions.
    std::tm day{};
    day.tm_year = start.tm_year;
    day.tm_mon = start.tm_mon;
    day.tm_mday = start.tm_mday + offset;
    day.tm_hour = 12;
    day.tm_isdst = -1;
    if (std::mktime(&day) == static_cast<std::time_t>(-1)) {
      continue;
    }
    if (day.tm_year + 1900 > years_.back()) {
      return std::nullopt;
    }
    if (!day_matches(day)) {
      continue;
    }

    const bool first_day = offset == 0;
    for (const int hour : hours_) {
      if (first_day && hour < start.tm_hour) {
        continue;
      }
      for (const int minute : minutes_) {
        if (first_day && hour == start.tm_hour && minute < start.tm_min) {
          continue;
        }
        for (const int second : seconds_) {
          std::tm candidate{};
          candidate.tm_year = day.tm_year;
          candidate.tm_mon = day.tm_mon;
          candidate.tm_mday = day.tm_mday;
          candidate.tm_hour = hour;
          candidate.tm_min = minute;
          candidate.tm_sec = second;
          candidate.tm_isdst = -1;
          const std::time_t instant = std::mktime(&candidate);
          if (instant == static_cast<std::time_t>(-1) || instant <= floor_after) {
            continue;
          }
          // wall-clock times skipped by a DST jump normalize to a different hour
          if (candidate.tm_hour != hour || candidate.tm_min != minute ||
              candidate.tm_mday != day.tm_mday) {
            continue;
          }
          return std::chrono::system_clock::from_time_t(instant);
        }
      }
    }
  }

  return std::nullopt;
}

} // namespace runclaw::schedule
