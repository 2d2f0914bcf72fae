// argconv/temporal/date_time.hpp - Date and duration parsing
//
// Default implementations of the two leaf conversions used by the date,
// datetime and timedelta converters.
//
#pragma once

#include <optional>
#include <string_view>

#include "argconv/value/temporal.hpp"
#include "argconv/value/value.hpp"

namespace argconv
{

/**
 * Convert a value to a timestamp.
 *
 * - datetime: returned as is
 * - date: midnight of that day
 * - integer/float: seconds since 1970-01-01 00:00:00 UTC
 * - string: a timestamp whose digits (8 to 20 of them) are read as
 *   YYYY MM DD hh mm ss ffffff, missing trailing digits being zero.
 *   Separators are free-form: "2024-01-31 12:30", "20240131 123000.5"
 *
 * @throws ConversionError "Invalid timestamp '<value>'."
 */
[[nodiscard]] DateTime convert_date(const Value & value);

/**
 * Convert a value to a duration.
 *
 * - timedelta: returned as is
 * - integer/float: seconds
 * - string: a number of seconds ("1.5"), a timer ("01:02:03.5", "-2:30")
 *   or a time string ("1 day 2 hours 3 min 4 s 5 ms", "1d2h")
 *
 * @throws ConversionError "Invalid time string '<value>'."
 */
[[nodiscard]] TimeDelta convert_time(const Value & value);

/// Seconds in a time string or timer, or std::nullopt if the text is neither.
[[nodiscard]] std::optional<double> time_string_to_seconds(std::string_view text);

}  // namespace argconv
