// argconv/value/temporal.cpp - Temporal value implementation
//
#include "argconv/value/temporal.hpp"

#include <fmt/core.h>

namespace argconv
{

namespace
{

constexpr int64_t k_us_per_second = 1000000;
constexpr int64_t k_us_per_day = 86400 * k_us_per_second;

bool is_leap(int year) noexcept
{
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) noexcept
{
  static constexpr int k_days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && is_leap(year)) return 29;
  return k_days[month - 1];
}

int64_t floor_div(int64_t a, int64_t b) noexcept
{
  int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
  return q;
}

}  // namespace

// ============================================================================
// Date
// ============================================================================

bool Date::is_valid(int year, int month, int day) noexcept
{
  if (year < 1 || year > 9999) return false;
  if (month < 1 || month > 12) return false;
  return day >= 1 && day <= days_in_month(year, month);
}

int64_t Date::days_since_epoch() const noexcept
{
  // Howard Hinnant's days_from_civil.
  const int64_t y = static_cast<int64_t>(year) - (month <= 2 ? 1 : 0);
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const int64_t yoe = y - era * 400;
  const int64_t mp = (month + 9) % 12;
  const int64_t doy = (153 * mp + 2) / 5 + day - 1;
  const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + doe - 719468;
}

Date Date::from_days_since_epoch(int64_t days) noexcept
{
  const int64_t z = days + 719468;
  const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const int64_t doe = z - era * 146097;
  const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const int64_t mp = (5 * doy + 2) / 153;
  const int64_t d = doy - (153 * mp + 2) / 5 + 1;
  const int64_t m = mp < 10 ? mp + 3 : mp - 9;
  const int64_t y = yoe + era * 400 + (m <= 2 ? 1 : 0);
  return Date{static_cast<int>(y), static_cast<int>(m), static_cast<int>(d)};
}

std::string Date::to_string() const { return fmt::format("{:04}-{:02}-{:02}", year, month, day); }

// ============================================================================
// DateTime
// ============================================================================

int64_t DateTime::epoch_microseconds() const noexcept
{
  const int64_t seconds = static_cast<int64_t>(hour) * 3600 + minute * 60 + second;
  return date.days_since_epoch() * k_us_per_day + seconds * k_us_per_second + microsecond;
}

DateTime DateTime::from_epoch_microseconds(int64_t us) noexcept
{
  const int64_t days = floor_div(us, k_us_per_day);
  int64_t rest = us - days * k_us_per_day;

  DateTime dt;
  dt.date = Date::from_days_since_epoch(days);
  dt.hour = static_cast<int>(rest / (3600 * k_us_per_second));
  rest %= 3600 * k_us_per_second;
  dt.minute = static_cast<int>(rest / (60 * k_us_per_second));
  rest %= 60 * k_us_per_second;
  dt.second = static_cast<int>(rest / k_us_per_second);
  dt.microsecond = static_cast<int>(rest % k_us_per_second);
  return dt;
}

std::string DateTime::to_string() const
{
  std::string result =
    fmt::format("{} {:02}:{:02}:{:02}", date.to_string(), hour, minute, second);
  if (microsecond != 0) {
    result += fmt::format(".{:06}", microsecond);
  }
  return result;
}

// ============================================================================
// TimeDelta
// ============================================================================

std::string TimeDelta::to_string() const
{
  const int64_t days = floor_div(microseconds, k_us_per_day);
  int64_t rest = microseconds - days * k_us_per_day;

  const int64_t hours = rest / (3600 * k_us_per_second);
  rest %= 3600 * k_us_per_second;
  const int64_t minutes = rest / (60 * k_us_per_second);
  rest %= 60 * k_us_per_second;
  const int64_t seconds = rest / k_us_per_second;
  const int64_t micros = rest % k_us_per_second;

  std::string result;
  if (days != 0) {
    result = fmt::format("{} day{}, ", days, (days == 1 || days == -1) ? "" : "s");
  }
  result += fmt::format("{}:{:02}:{:02}", hours, minutes, seconds);
  if (micros != 0) {
    result += fmt::format(".{:06}", micros);
  }
  return result;
}

}  // namespace argconv
