// argconv/value/temporal.hpp - Calendar date, timestamp and duration values
#pragma once

#include <cstdint>
#include <string>

namespace argconv
{

struct Date
{
  int year = 1970;
  int month = 1;
  int day = 1;

  /// Whether the fields form an existing proleptic Gregorian date.
  [[nodiscard]] static bool is_valid(int year, int month, int day) noexcept;

  /// Days since 1970-01-01.
  [[nodiscard]] int64_t days_since_epoch() const noexcept;
  [[nodiscard]] static Date from_days_since_epoch(int64_t days) noexcept;

  /// "YYYY-MM-DD"
  [[nodiscard]] std::string to_string() const;

  friend bool operator==(const Date & a, const Date & b)
  {
    return a.year == b.year && a.month == b.month && a.day == b.day;
  }
  friend bool operator!=(const Date & a, const Date & b) { return !(a == b); }
};

struct DateTime
{
  Date date;
  int hour = 0;
  int minute = 0;
  int second = 0;
  int microsecond = 0;

  [[nodiscard]] bool has_time() const noexcept
  {
    return hour != 0 || minute != 0 || second != 0 || microsecond != 0;
  }

  /// Microseconds since the Unix epoch (UTC).
  [[nodiscard]] int64_t epoch_microseconds() const noexcept;
  [[nodiscard]] static DateTime from_epoch_microseconds(int64_t us) noexcept;

  /// "YYYY-MM-DD hh:mm:ss[.ffffff]"
  [[nodiscard]] std::string to_string() const;

  friend bool operator==(const DateTime & a, const DateTime & b)
  {
    return a.date == b.date && a.hour == b.hour && a.minute == b.minute && a.second == b.second &&
           a.microsecond == b.microsecond;
  }
  friend bool operator!=(const DateTime & a, const DateTime & b) { return !(a == b); }
};

struct TimeDelta
{
  int64_t microseconds = 0;

  [[nodiscard]] double total_seconds() const noexcept
  {
    return static_cast<double>(microseconds) / 1e6;
  }

  /// "[D day[s], ]h:mm:ss[.ffffff]" with floor-divided negative days.
  [[nodiscard]] std::string to_string() const;

  friend bool operator==(const TimeDelta & a, const TimeDelta & b)
  {
    return a.microseconds == b.microseconds;
  }
  friend bool operator!=(const TimeDelta & a, const TimeDelta & b) { return !(a == b); }
};

}  // namespace argconv
