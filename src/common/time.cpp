#include "runclaw/common/time.hpp"

#include "runclaw/common/fs.hpp"

#include <charconv>
#include <cstdio>
#include <ctime>

namespace runclaw::common {

namespace {

bool read_digits(const std::string &text, const std::size_t pos, const std::size_t count,
                 int &out) {
  if (pos + count > text.size()) {
    return false;
  }
  int value = 0;
  auto [ptr, ec] = std::from_chars(text.data() + pos, text.data() + pos + count, value);
  if (ec != std::errc() || ptr != text.data() + pos + count) {
    return false;
  }
  out = value;
  return true;
}

std::tm to_utc_tm(const TimePoint time_point) {
  const auto seconds = std::chrono::floor<std::chrono::seconds>(time_point);
  const std::time_t raw = std::chrono::system_clock::to_time_t(seconds);
  std::tm tm{};
  gmtime_r(&raw, &tm);
  return tm;
}

int days_in_month(const int year, const int month) {
  static constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2) {
    const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    return leap ? 29 : 28;
  }
  return kDays[month - 1];
}

} // namespace

std::string format_rfc3339(const TimePoint time_point) {
  const auto seconds = std::chrono::floor<std::chrono::seconds>(time_point);
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(time_point - seconds).count();
  const std::tm tm = to_utc_tm(time_point);
  char buffer[40];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", tm.tm_year + 1900,
                tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
                static_cast<int>(millis));
  return buffer;
}

std::string format_compact_utc(const TimePoint time_point) {
  const std::tm tm = to_utc_tm(time_point);
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%04d%02d%02d_%02d%02d%02d", tm.tm_year + 1900,
                tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec);
  return buffer;
}

Result<TimePoint> parse_rfc3339(const std::string &raw) {
  const std::string value = trim(raw);
  const auto invalid = [&value]() {
    return Result<TimePoint>::failure("invalid timestamp: " + value);
  };

  int year = 0;
  int month = 0;
  int day = 0;
  int hour = 0;
  int minute = 0;
  int second = 0;
  if (value.size() < 20 || !read_digits(value, 0, 4, year) || value[4] != '-' ||
      !read_digits(value, 5, 2, month) || value[7] != '-' || !read_digits(value, 8, 2, day) ||
      (value[10] != 'T' && value[10] != 't' && value[10] != ' ') ||
      !read_digits(value, 11, 2, hour) || value[13] != ':' ||
      !read_digits(value, 14, 2, minute) || value[16] != ':' ||
      !read_digits(value, 17, 2, second)) {
    return invalid();
  }
  if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month) || hour > 23 ||
      minute > 59 || second > 60) {
    return invalid();
  }

  std::size_t pos = 19;
  std::chrono::milliseconds fraction{0};
  if (pos < value.size() && value[pos] == '.') {
    ++pos;
    const std::size_t start = pos;
    long long scaled = 0;
    int kept = 0;
    while (pos < value.size() && value[pos] >= '0' && value[pos] <= '9') {
      if (kept < 3) {
        scaled = scaled * 10 + (value[pos] - '0');
        ++kept;
      }
      ++pos;
    }
    if (pos == start) {
      return invalid();
    }
    while (kept < 3) {
      scaled *= 10;
      ++kept;
    }
    fraction = std::chrono::milliseconds(scaled);
  }

  std::chrono::minutes offset{0};
  if (pos >= value.size()) {
    return invalid();
  }
  if (value[pos] == 'Z' || value[pos] == 'z') {
    ++pos;
  } else if (value[pos] == '+' || value[pos] == '-') {
    const int sign = value[pos] == '-' ? -1 : 1;
    int offset_hours = 0;
    int offset_minutes = 0;
    if (!read_digits(value, pos + 1, 2, offset_hours) || pos + 3 >= value.size() ||
        value[pos + 3] != ':' || !read_digits(value, pos + 4, 2, offset_minutes) ||
        offset_hours > 23 || offset_minutes > 59) {
      return invalid();
    }
    offset = std::chrono::minutes(sign * (offset_hours * 60 + offset_minutes));
    pos += 6;
  } else {
    return invalid();
  }
  if (pos != value.size()) {
    return invalid();
  }

  const std::chrono::sys_days date =
      std::chrono::year_month_day{std::chrono::year{year},
                                  std::chrono::month{static_cast<unsigned>(month)},
                                  std::chrono::day{static_cast<unsigned>(day)}};
  const TimePoint parsed = TimePoint(date) + std::chrono::hours(hour) +
                           std::chrono::minutes(minute) + std::chrono::seconds(second) +
                           fraction - offset;
  return Result<TimePoint>::success(std::chrono::time_point_cast<TimePoint::duration>(parsed));
}

} // namespace runclaw::common
