// argconv/convert/scalar_converters.cpp - Converters for single values
//
#include "argconv/convert/scalar_converters.hpp"

#include <cmath>
#include <limits>

#include <fmt/core.h>

#include "argconv/basic/text.hpp"
#include "argconv/temporal/date_time.hpp"
#include "argconv/value/decimal.hpp"
#include "argconv/vocabulary/languages.hpp"

namespace argconv
{

namespace
{

/// Digit value in bases up to 16, or -1.
int digit_value(char c) noexcept
{
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

/**
 * Parse an optionally signed integer in `base`.
 *
 * @return std::nullopt if the text is not an integer or does not fit in 64 bits
 */
std::optional<int64_t> parse_int(std::string_view text, int base)
{
  std::string_view s = strip(text);
  bool negative = false;
  if (!s.empty() && (s.front() == '+' || s.front() == '-')) {
    negative = s.front() == '-';
    s.remove_prefix(1);
  }
  if (s.empty()) return std::nullopt;

  // Accumulate as a negative number so that INT64_MIN is representable.
  constexpr int64_t k_min = std::numeric_limits<int64_t>::min();
  int64_t result = 0;
  for (const char c : s) {
    const int digit = digit_value(c);
    if (digit < 0 || digit >= base) return std::nullopt;
    if (result < (k_min + digit) / base) return std::nullopt;
    result = result * base - digit;
  }
  if (!negative) {
    if (result == k_min) return std::nullopt;
    return -result;
  }
  return result;
}

/// Split off a 0x, 0o or 0b prefix; the text must already be lowercase.
std::pair<std::string, int> get_base(const std::string & text)
{
  static const std::pair<std::string_view, int> k_prefixes[] = {
    {"0x", 16},
    {"0o", 8},
    {"0b", 2},
  };
  for (const auto & [prefix, base] : k_prefixes) {
    const auto pos = text.find(prefix);
    if (pos == std::string::npos) continue;
    const bool single = text.find(prefix, pos + prefix.size()) == std::string::npos;
    const std::string_view head = std::string_view(text).substr(0, pos);
    if (single && (head.empty() || head == "-" || head == "+")) {
      return {std::string(head) + text.substr(pos + prefix.size()), base};
    }
  }
  return {text, 10};
}

Value float_to_integer(double value)
{
  if (!std::isfinite(value) || std::floor(value) != value) {
    throw ConversionError("Conversion would lose precision.");
  }
  if (value < -9.223372036854775808e18 || value >= 9.223372036854775808e18) {
    throw ConversionError();
  }
  return Value::make_integer(static_cast<int64_t>(value));
}

/// Integer payload of a bool, an integer or an integer-backed enum member.
std::optional<int64_t> integral_value(const Value & value)
{
  switch (value.kind()) {
    case ValueKind::Bool:
      return value.as_bool() ? 1 : 0;
    case ValueKind::Integer:
      return value.as_integer();
    case ValueKind::EnumMember:
      return integral_value(value.as_enum_member().value());
    default:
      return std::nullopt;
  }
}

/// Latin-1 encoding of UTF-8 text.
std::string encode_latin1(const std::string & text)
{
  std::string result;
  const auto code_points = decode_utf8(text);
  result.reserve(code_points.size());
  for (size_t i = 0; i < code_points.size(); ++i) {
    const uint32_t cp = code_points[i];
    if (cp > 0xFF) {
      std::string character;
      append_utf8(character, cp);
      throw ConversionError(
        fmt::format("Character '{}' at position {} cannot be mapped to a byte.", character, i));
    }
    result.push_back(static_cast<char>(cp));
  }
  return result;
}

std::string normalize_path(const std::string & text)
{
  std::string result;
  if (!text.empty() && text.front() == '/') {
    result = "/";
  }
  size_t start = 0;
  bool first = true;
  while (start <= text.size()) {
    auto end = text.find('/', start);
    if (end == std::string::npos) end = text.size();
    const std::string_view part = std::string_view(text).substr(start, end - start);
    if (!part.empty() && part != ".") {
      if (!first) result.push_back('/');
      result.append(part);
      first = false;
    }
    start = end + 1;
  }
  return result.empty() ? "." : result;
}

}  // namespace

// ============================================================================
// Any / String / Boolean
// ============================================================================

AnyConverter::AnyConverter(
  TypeInfo info, const CustomConverters * custom, std::shared_ptr<const Languages> languages)
: ConverterBase(std::move(info), custom, std::move(languages))
{
  primitive_type_ = TypeKind::Any;
  static_name_ = "Any";
  value_types_ = {TypeKind::Any};
}

bool AnyConverter::no_conversion_needed(const Value & /*value*/) const { return true; }

StringConverter::StringConverter(
  TypeInfo info, const CustomConverters * custom, std::shared_ptr<const Languages> languages)
: ConverterBase(std::move(info), custom, std::move(languages))
{
  primitive_type_ = TypeKind::String;
  static_name_ = "string";
  value_types_ = {TypeKind::Any};
}

Value StringConverter::do_convert(const Value & value) const
{
  return Value::make_string(value.str());
}

BooleanConverter::BooleanConverter(
  TypeInfo info, const CustomConverters * custom, std::shared_ptr<const Languages> languages)
: ConverterBase(std::move(info), custom, std::move(languages))
{
  primitive_type_ = TypeKind::Bool;
  static_name_ = "boolean";
  value_types_ = {TypeKind::String, TypeKind::Integer, TypeKind::Float, TypeKind::None};
}

Value BooleanConverter::do_convert(const Value & value) const
{
  const std::string normalized = to_title(value.as_string());
  if (normalized == "None") {
    return Value::none();
  }
  if (languages().is_true(normalized)) {
    return Value::make_bool(true);
  }
  if (languages().is_false(normalized)) {
    return Value::make_bool(false);
  }
  return value;
}

// ============================================================================
// Numbers
// ============================================================================

IntegerConverter::IntegerConverter(
  TypeInfo info, const CustomConverters * custom, std::shared_ptr<const Languages> languages)
: ConverterBase(std::move(info), custom, std::move(languages))
{
  primitive_type_ = TypeKind::Integer;
  static_name_ = "integer";
  value_types_ = {TypeKind::String, TypeKind::Float};
}

Value IntegerConverter::do_convert(const Value & value) const
{
  const auto [text, base] = get_base(to_lower_ascii(remove_number_separators(value.as_string())));
  if (const auto result = parse_int(text, base)) {
    return Value::make_integer(*result);
  }
  if (base == 10) {
    const auto decimal = Decimal::parse(text);
    if (decimal && decimal->is_finite()) {
      if (!decimal->is_integral()) {
        throw ConversionError("Conversion would lose precision.");
      }
      if (const auto result = decimal->to_integer()) {
        return Value::make_integer(*result);
      }
    }
  }
  throw ConversionError();
}

Value IntegerConverter::non_string_convert(const Value & value) const
{
  if (value.is_float()) {
    return float_to_integer(value.as_float());
  }
  if (const auto result = integral_value(value)) {
    return Value::make_integer(*result);
  }
  throw ConversionError();
}

FloatConverter::FloatConverter(
  TypeInfo info, const CustomConverters * custom, std::shared_ptr<const Languages> languages)
: ConverterBase(std::move(info), custom, std::move(languages))
{
  primitive_type_ = TypeKind::Float;
  static_name_ = "float";
  value_types_ = {TypeKind::String, TypeKind::Real};
}

Value FloatConverter::do_convert(const Value & value) const
{
  const std::string text = remove_number_separators(value.as_string());
  // Decimal accepts signaling NaN; float does not.
  if (to_lower_ascii(text).find("snan") != std::string::npos) {
    throw ConversionError();
  }
  const auto decimal = Decimal::parse(text);
  if (!decimal) {
    throw ConversionError();
  }
  return Value::make_float(decimal->to_double());
}

Value FloatConverter::non_string_convert(const Value & value) const
{
  if (value.is_float()) {
    return value;
  }
  if (const auto result = integral_value(value)) {
    return Value::make_float(static_cast<double>(*result));
  }
  throw ConversionError();
}

DecimalConverter::DecimalConverter(
  TypeInfo info, const CustomConverters * custom, std::shared_ptr<const Languages> languages)
: ConverterBase(std::move(info), custom, std::move(languages))
{
  primitive_type_ = TypeKind::Decimal;
  static_name_ = "decimal";
  value_types_ = {TypeKind::String, TypeKind::Integer, TypeKind::Float};
}

Value DecimalConverter::do_convert(const Value & value) const
{
  const auto decimal = Decimal::parse(remove_number_separators(value.as_string()));
  if (!decimal) {
    throw ConversionError();
  }
  return Value::make_decimal(*decimal);
}

Value DecimalConverter::non_string_convert(const Value & value) const
{
  if (value.is_float()) {
    return Value::make_decimal(Decimal::from_double(value.as_float()));
  }
  if (const auto result = integral_value(value)) {
    return Value::make_decimal(Decimal::from_integer(*result));
  }
  throw ConversionError();
}

// ============================================================================
// Bytes
// ============================================================================

BytesConverter::BytesConverter(
  TypeInfo info, const CustomConverters * custom, std::shared_ptr<const Languages> languages)
: ConverterBase(std::move(info), custom, std::move(languages))
{
  primitive_type_ = TypeKind::Bytes;
  static_name_ = "bytes";
  value_types_ = {TypeKind::String, TypeKind::ByteArray};
}

Value BytesConverter::do_convert(const Value & value) const
{
  return Value::make_bytes(encode_latin1(value.as_string()));
}

Value BytesConverter::non_string_convert(const Value & value) const
{
  return Value::make_bytes(value.as_string());
}

ByteArrayConverter::ByteArrayConverter(
  TypeInfo info, const CustomConverters * custom, std::shared_ptr<const Languages> languages)
: ConverterBase(std::move(info), custom, std::move(languages))
{
  primitive_type_ = TypeKind::ByteArray;
  static_name_ = "bytearray";
  value_types_ = {TypeKind::String, TypeKind::Bytes};
}

Value ByteArrayConverter::do_convert(const Value & value) const
{
  return Value::make_bytearray(encode_latin1(value.as_string()));
}

Value ByteArrayConverter::non_string_convert(const Value & value) const
{
  return Value::make_bytearray(value.as_string());
}

// ============================================================================
// Dates and Durations
// ============================================================================

DateTimeConverter::DateTimeConverter(
  TypeInfo info, const CustomConverters * custom, std::shared_ptr<const Languages> languages)
: ConverterBase(std::move(info), custom, std::move(languages))
{
  primitive_type_ = TypeKind::DateTime;
  static_name_ = "datetime";
  value_types_ = {TypeKind::String, TypeKind::Integer, TypeKind::Float};
}

Value DateTimeConverter::do_convert(const Value & value) const
{
  return Value::make_datetime(convert_date(value));
}

DateConverter::DateConverter(
  TypeInfo info, const CustomConverters * custom, std::shared_ptr<const Languages> languages)
: ConverterBase(std::move(info), custom, std::move(languages))
{
  primitive_type_ = TypeKind::Date;
  static_name_ = "date";
}

Value DateConverter::do_convert(const Value & value) const
{
  const DateTime dt = convert_date(value);
  if (dt.has_time()) {
    throw ConversionError("Value is datetime, not date.");
  }
  return Value::make_date(dt.date);
}

TimeDeltaConverter::TimeDeltaConverter(
  TypeInfo info, const CustomConverters * custom, std::shared_ptr<const Languages> languages)
: ConverterBase(std::move(info), custom, std::move(languages))
{
  primitive_type_ = TypeKind::TimeDelta;
  static_name_ = "timedelta";
  value_types_ = {TypeKind::String, TypeKind::Integer, TypeKind::Float};
}

Value TimeDeltaConverter::do_convert(const Value & value) const
{
  return Value::make_timedelta(convert_time(value));
}

// ============================================================================
// Path / None
// ============================================================================

PathConverter::PathConverter(
  TypeInfo info, const CustomConverters * custom, std::shared_ptr<const Languages> languages)
: ConverterBase(std::move(info), custom, std::move(languages))
{
  primitive_type_ = TypeKind::Path;
  static_name_ = "Path";
  value_types_ = {TypeKind::String, TypeKind::Path};
}

Value PathConverter::do_convert(const Value & value) const
{
  return Value::make_path(normalize_path(value.as_string()));
}

NoneConverter::NoneConverter(
  TypeInfo info, const CustomConverters * custom, std::shared_ptr<const Languages> languages)
: ConverterBase(std::move(info), custom, std::move(languages))
{
  primitive_type_ = TypeKind::None;
  static_name_ = "None";
}

Value NoneConverter::do_convert(const Value & value) const
{
  if (to_upper_ascii(value.as_string()) == "NONE") {
    return Value::none();
  }
  throw ConversionError();
}

}  // namespace argconv
