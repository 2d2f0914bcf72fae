// argconv/temporal/date_time.cpp - Date and duration parsing
//
#include "argconv/temporal/date_time.hpp"

#include <cctype>
#include <cmath>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "argconv/basic/errors.hpp"
#include "argconv/basic/text.hpp"
#include "argconv/value/decimal.hpp"

namespace argconv
{

namespace
{

constexpr int64_t k_us_per_second = 1000000;

// 0001-01-01 and 9999-12-31 23:59:59.999999 relative to the epoch.
constexpr int64_t k_min_epoch_us = -62135596800LL * k_us_per_second;
constexpr int64_t k_max_epoch_us = 253402300799LL * k_us_per_second + 999999;

[[noreturn]] void invalid_timestamp(const Value & value)
{
  throw ConversionError(fmt::format("Invalid timestamp '{}'.", value.str()));
}

[[noreturn]] void invalid_time_string(const Value & value)
{
  throw ConversionError(fmt::format("Invalid time string '{}'.", value.str()));
}

/// Parse a float the way float() does; nullopt for anything else.
std::optional<double> parse_number(std::string_view text)
{
  const auto decimal = Decimal::parse(remove_chars(text, "_"));
  if (!decimal || !decimal->is_finite()) return std::nullopt;
  return decimal->to_double();
}

int to_int(std::string_view digits)
{
  int result = 0;
  for (const char c : digits) {
    result = result * 10 + (c - '0');
  }
  return result;
}

bool all_digits(std::string_view s)
{
  if (s.empty()) return false;
  for (const char c : s) {
    if (std::isdigit(static_cast<unsigned char>(c)) == 0) return false;
  }
  return true;
}

/// `[-][hh:]mm:ss[.fff]`
std::optional<double> timer_to_seconds(std::string_view text)
{
  bool negative = false;
  if (!text.empty() && text.front() == '-') {
    negative = true;
    text.remove_prefix(1);
  }

  std::string_view fraction;
  const auto dot = text.find('.');
  if (dot != std::string_view::npos) {
    fraction = text.substr(dot + 1);
    text = text.substr(0, dot);
    if (!all_digits(fraction)) return std::nullopt;
  }

  std::vector<std::string_view> parts;
  size_t start = 0;
  while (true) {
    const auto colon = text.find(':', start);
    parts.push_back(text.substr(start, colon == std::string_view::npos ? colon : colon - start));
    if (colon == std::string_view::npos) break;
    start = colon + 1;
  }
  if (parts.size() < 2 || parts.size() > 3) return std::nullopt;
  for (const auto part : parts) {
    if (!all_digits(part)) return std::nullopt;
  }

  double seconds = 0.0;
  for (const auto part : parts) {
    seconds = seconds * 60 + std::stod(std::string(part));
  }
  if (!fraction.empty()) {
    seconds += std::stod(std::string(fraction)) / std::pow(10.0, fraction.size());
  }
  return negative ? -seconds : seconds;
}

/// Replace unit names with single-letter specifiers (ms becomes 'M').
std::string normalize_time_string(std::string_view text)
{
  static const std::pair<char, std::vector<std::string>> k_units[] = {
    {'n', {"nanoseconds", "nanosecond", "ns"}},
    {'u', {"microseconds", "microsecond", "us", "\xce\xbcs"}},
    {'M', {"milliseconds", "millisecs", "msecs", "millisecond", "millisec", "millis", "msec", "ms"}},
    {'s', {"seconds", "secs", "second", "sec"}},
    {'m', {"minutes", "mins", "minute", "min"}},
    {'h', {"hours", "hour"}},
    {'d', {"days", "day"}},
    {'w', {"weeks", "week"}},
  };

  std::string result = normalize(text);
  for (const auto & [specifier, aliases] : k_units) {
    for (const auto & alias : aliases) {
      size_t pos = 0;
      while ((pos = result.find(alias, pos)) != std::string::npos) {
        result.replace(pos, alias.size(), 1, specifier);
        pos += 1;
      }
    }
  }
  return result;
}

std::optional<double> unit_string_to_seconds(std::string_view text)
{
  std::string normalized = normalize_time_string(text);
  if (normalized.empty()) return std::nullopt;

  double sign = 1.0;
  std::string_view rest = normalized;
  if (rest.front() == '-') {
    sign = -1.0;
    rest.remove_prefix(1);
  }

  double total = 0.0;
  std::string pending;
  for (const char c : rest) {
    double factor = 0.0;
    switch (c) {
      case 'n':
        factor = 1e-9;
        break;
      case 'u':
        factor = 1e-6;
        break;
      case 'M':
        factor = 1e-3;
        break;
      case 's':
        factor = 1.0;
        break;
      case 'm':
        factor = 60.0;
        break;
      case 'h':
        factor = 3600.0;
        break;
      case 'd':
        factor = 86400.0;
        break;
      case 'w':
        factor = 7 * 86400.0;
        break;
      default:
        pending.push_back(c);
        continue;
    }
    const auto amount = parse_number(pending);
    if (!amount) return std::nullopt;
    total += *amount * factor;
    pending.clear();
  }
  if (!pending.empty()) return std::nullopt;
  return sign * total;
}

std::optional<TimeDelta> seconds_to_timedelta(double seconds)
{
  const double micros = std::round(seconds * 1e6);
  if (!std::isfinite(micros) || std::fabs(micros) >= 9.2e18) return std::nullopt;
  return TimeDelta{static_cast<int64_t>(micros)};
}

std::optional<DateTime> epoch_seconds_to_datetime(double seconds)
{
  const double micros = std::round(seconds * 1e6);
  if (!std::isfinite(micros)) return std::nullopt;
  if (micros < static_cast<double>(k_min_epoch_us) || micros > static_cast<double>(k_max_epoch_us)) {
    return std::nullopt;
  }
  return DateTime::from_epoch_microseconds(static_cast<int64_t>(micros));
}

std::optional<DateTime> parse_timestamp(std::string_view text)
{
  std::string digits;
  for (const char c : text) {
    if (std::isdigit(static_cast<unsigned char>(c)) != 0) digits.push_back(c);
  }
  if (digits.size() < 8 || digits.size() > 20) return std::nullopt;
  digits.resize(20, '0');

  const std::string_view d = digits;
  DateTime dt;
  dt.date.year = to_int(d.substr(0, 4));
  dt.date.month = to_int(d.substr(4, 2));
  dt.date.day = to_int(d.substr(6, 2));
  dt.hour = to_int(d.substr(8, 2));
  dt.minute = to_int(d.substr(10, 2));
  dt.second = to_int(d.substr(12, 2));
  dt.microsecond = to_int(d.substr(14, 6));

  if (!Date::is_valid(dt.date.year, dt.date.month, dt.date.day)) return std::nullopt;
  if (dt.hour > 23 || dt.minute > 59 || dt.second > 59) return std::nullopt;
  return dt;
}

}  // namespace

std::optional<double> time_string_to_seconds(std::string_view text)
{
  if (auto seconds = timer_to_seconds(text)) return seconds;
  return unit_string_to_seconds(text);
}

DateTime convert_date(const Value & value)
{
  std::optional<DateTime> result;
  switch (value.kind()) {
    case ValueKind::DateTime:
      return value.as_datetime();
    case ValueKind::Date:
      return DateTime{value.as_date()};
    case ValueKind::Bool:
      result = epoch_seconds_to_datetime(value.as_bool() ? 1.0 : 0.0);
      break;
    case ValueKind::Integer:
      result = epoch_seconds_to_datetime(static_cast<double>(value.as_integer()));
      break;
    case ValueKind::Float:
      result = epoch_seconds_to_datetime(value.as_float());
      break;
    case ValueKind::String:
      result = parse_timestamp(value.as_string());
      break;
    default:
      break;
  }
  if (!result) invalid_timestamp(value);
  return *result;
}

TimeDelta convert_time(const Value & value)
{
  std::optional<double> seconds;
  switch (value.kind()) {
    case ValueKind::TimeDelta:
      return value.as_timedelta();
    case ValueKind::Bool:
      return TimeDelta{value.as_bool() ? k_us_per_second : 0};
    case ValueKind::Integer: {
      const int64_t secs = value.as_integer();
      constexpr int64_t k_limit = std::numeric_limits<int64_t>::max() / k_us_per_second;
      if (secs > k_limit || secs < -k_limit) {
        invalid_time_string(value);
      }
      return TimeDelta{secs * k_us_per_second};
    }
    case ValueKind::Float:
      seconds = value.as_float();
      break;
    case ValueKind::String: {
      const std::string & text = value.as_string();
      seconds = parse_number(strip(text));
      if (!seconds) seconds = time_string_to_seconds(text);
      break;
    }
    default:
      break;
  }
  if (seconds) {
    if (auto result = seconds_to_timedelta(*seconds)) return *result;
  }
  invalid_time_string(value);
}

}  // namespace argconv
