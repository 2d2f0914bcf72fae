#include <gtest/gtest.h>

#include <cmath>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "argconv/basic/errors.hpp"
#include "argconv/convert/converter.hpp"
#include "argconv/vocabulary/languages.hpp"

using argconv::ConversionError;
using argconv::Converter;
using argconv::ConverterKind;
using argconv::Languages;
using argconv::TypeInfo;
using argconv::TypeKind;
using argconv::Value;
using argconv::ValueKind;

namespace
{

Value convert(TypeKind kind, const Value & value)
{
  return Converter::converter_for(TypeInfo::of(kind))->convert(value);
}

Value convert(TypeKind kind, const char * text) { return convert(kind, Value::make_string(text)); }

std::string error_of(TypeKind kind, const Value & value)
{
  try {
    (void)convert(kind, value);
  } catch (const ConversionError & e) {
    return e.what();
  }
  return "<no error>";
}

std::string error_of(TypeKind kind, const char * text)
{
  return error_of(kind, Value::make_string(text));
}

}  // namespace

// ============================================================================
// Integer
// ============================================================================

TEST(ConvertInteger, DecimalText)
{
  EXPECT_EQ(convert(TypeKind::Integer, "42").as_integer(), 42);
  EXPECT_EQ(convert(TypeKind::Integer, "-7").as_integer(), -7);
  EXPECT_EQ(convert(TypeKind::Integer, "+7").as_integer(), 7);
  EXPECT_EQ(convert(TypeKind::Integer, "1 000 000").as_integer(), 1000000);
  EXPECT_EQ(convert(TypeKind::Integer, "1_000").as_integer(), 1000);
}

TEST(ConvertInteger, BasePrefixes)
{
  EXPECT_EQ(convert(TypeKind::Integer, "0xFF").as_integer(), 255);
  EXPECT_EQ(convert(TypeKind::Integer, "0XFF").as_integer(), 255);
  EXPECT_EQ(convert(TypeKind::Integer, "-0b101").as_integer(), -5);
  EXPECT_EQ(convert(TypeKind::Integer, "0o17").as_integer(), 15);
  EXPECT_EQ(convert(TypeKind::Integer, "+0x1_0").as_integer(), 16);
}

TEST(ConvertInteger, WholeDecimalTextIsAccepted)
{
  EXPECT_EQ(convert(TypeKind::Integer, "1e3").as_integer(), 1000);
  EXPECT_EQ(convert(TypeKind::Integer, "10.0").as_integer(), 10);
}

TEST(ConvertInteger, PrecisionLoss)
{
  EXPECT_EQ(
    error_of(TypeKind::Integer, "1.5"),
    "Argument '1.5' cannot be converted to integer: Conversion would lose precision.");
  EXPECT_EQ(
    error_of(TypeKind::Integer, Value::make_float(2.5)),
    "Argument '2.5' (float) cannot be converted to integer: Conversion would lose precision.");
}

TEST(ConvertInteger, InvalidText)
{
  EXPECT_EQ(error_of(TypeKind::Integer, "abc"), "Argument 'abc' cannot be converted to integer.");
  EXPECT_EQ(error_of(TypeKind::Integer, "0x1g"), "Argument '0x1g' cannot be converted to integer.");
  EXPECT_EQ(error_of(TypeKind::Integer, "inf"), "Argument 'inf' cannot be converted to integer.");
  EXPECT_EQ(
    error_of(TypeKind::Integer, "99999999999999999999"),
    "Argument '99999999999999999999' cannot be converted to integer.");
}

TEST(ConvertInteger, NativeInput)
{
  EXPECT_EQ(convert(TypeKind::Integer, Value::make_float(2.0)).as_integer(), 2);

  // bool is an integer already
  const Value flag = convert(TypeKind::Integer, Value::make_bool(true));
  EXPECT_EQ(flag.kind(), ValueKind::Bool);

  EXPECT_EQ(
    error_of(TypeKind::Integer, Value::make_list({Value::make_integer(1)})),
    "Argument '[1]' (list) cannot be converted to integer.");
}

// ============================================================================
// Float / Decimal
// ============================================================================

TEST(ConvertFloat, Text)
{
  EXPECT_DOUBLE_EQ(convert(TypeKind::Float, "1.5").as_float(), 1.5);
  EXPECT_DOUBLE_EQ(convert(TypeKind::Float, "1_000.5").as_float(), 1000.5);
  EXPECT_DOUBLE_EQ(convert(TypeKind::Float, "-1e-3").as_float(), -0.001);
  EXPECT_TRUE(std::isinf(convert(TypeKind::Float, "inf").as_float()));
  EXPECT_TRUE(std::isnan(convert(TypeKind::Float, "nan").as_float()));
  EXPECT_EQ(error_of(TypeKind::Float, "abc"), "Argument 'abc' cannot be converted to float.");
  EXPECT_EQ(error_of(TypeKind::Float, "sNaN"), "Argument 'sNaN' cannot be converted to float.");
}

TEST(ConvertFloat, HugeExponents)
{
  const double big = convert(TypeKind::Float, "1e1000000001").as_float();
  EXPECT_TRUE(std::isinf(big));
  EXPECT_GT(big, 0.0);
  EXPECT_TRUE(std::isinf(convert(TypeKind::Float, "-2E99999999999999999999").as_float()));
  EXPECT_EQ(convert(TypeKind::Float, "1e-1000000001").as_float(), 0.0);
}

TEST(ConvertFloat, NativeInput)
{
  const Value result = convert(TypeKind::Float, Value::make_integer(3));
  EXPECT_EQ(result.kind(), ValueKind::Float);
  EXPECT_DOUBLE_EQ(result.as_float(), 3.0);

  const auto decimal = argconv::Decimal::parse("1.5");
  ASSERT_TRUE(decimal.has_value());
  EXPECT_EQ(
    error_of(TypeKind::Float, Value::make_decimal(*decimal)),
    "Argument '1.5' (Decimal) cannot be converted to float.");
}

TEST(ConvertDecimal, KeepsDigits)
{
  const Value result = convert(TypeKind::Decimal, "1.10");
  ASSERT_EQ(result.kind(), ValueKind::Decimal);
  EXPECT_EQ(result.str(), "1.10");

  EXPECT_EQ(convert(TypeKind::Decimal, Value::make_integer(3)).str(), "3");
  EXPECT_EQ(error_of(TypeKind::Decimal, "1.2.3"), "Argument '1.2.3' cannot be converted to decimal.");
}

// ============================================================================
// Boolean
// ============================================================================

TEST(ConvertBoolean, EnglishWords)
{
  EXPECT_EQ(convert(TypeKind::Bool, "True"), Value::make_bool(true));
  EXPECT_EQ(convert(TypeKind::Bool, "yes").kind(), ValueKind::Bool);
  EXPECT_TRUE(convert(TypeKind::Bool, "yes").as_bool());
  EXPECT_TRUE(convert(TypeKind::Bool, "ON").as_bool());
  EXPECT_FALSE(convert(TypeKind::Bool, "off").as_bool());
  EXPECT_FALSE(convert(TypeKind::Bool, "0").as_bool());
  EXPECT_FALSE(convert(TypeKind::Bool, "").as_bool());
  EXPECT_TRUE(convert(TypeKind::Bool, "none").is_none());
}

TEST(ConvertBoolean, UnrecognizedTextIsReturnedAsIs)
{
  const Value result = convert(TypeKind::Bool, "maybe");
  ASSERT_TRUE(result.is_string());
  EXPECT_EQ(result.as_string(), "maybe");
}

TEST(ConvertBoolean, NonTextIsReturnedAsIs)
{
  const Value result = convert(TypeKind::Bool, Value::make_integer(2));
  ASSERT_TRUE(result.is_integer());
  EXPECT_EQ(result.as_integer(), 2);
  EXPECT_TRUE(convert(TypeKind::Bool, Value::none()).is_none());
}

TEST(ConvertBoolean, ConfiguredLanguages)
{
  auto languages = std::make_shared<const Languages>(std::vector<std::string>{"fi"});
  const auto conv = Converter::converter_for(TypeInfo::of(TypeKind::Bool), nullptr, languages);
  EXPECT_TRUE(conv->convert(Value::make_string("kyllä")).as_bool());
  EXPECT_FALSE(conv->convert(Value::make_string("EI")).as_bool());
  EXPECT_TRUE(conv->convert(Value::make_string("yes")).as_bool());
}

// ============================================================================
// String / Any / None
// ============================================================================

TEST(ConvertString, UsesStrForm)
{
  EXPECT_EQ(convert(TypeKind::String, Value::make_integer(42)).as_string(), "42");
  EXPECT_EQ(convert(TypeKind::String, Value::make_float(1.0)).as_string(), "1.0");
  const Value list = Value::make_list({Value::make_integer(1), Value::make_string("a")});
  EXPECT_EQ(convert(TypeKind::String, list).as_string(), "[1, 'a']");
}

TEST(ConvertAny, NeverConverts)
{
  const Value list = Value::make_list({Value::make_integer(1)});
  EXPECT_EQ(convert(TypeKind::Any, list), list);
  EXPECT_EQ(convert(TypeKind::Any, "42").as_string(), "42");
}

TEST(ConvertNone, OnlyNoneText)
{
  EXPECT_TRUE(convert(TypeKind::None, "none").is_none());
  EXPECT_TRUE(convert(TypeKind::None, "NONE").is_none());
  EXPECT_EQ(error_of(TypeKind::None, "x"), "Argument 'x' cannot be converted to None.");
}

// ============================================================================
// Bytes
// ============================================================================

TEST(ConvertBytes, Latin1Text)
{
  const Value result = convert(TypeKind::Bytes, "abc\xc3\xa4");
  ASSERT_EQ(result.kind(), ValueKind::Bytes);
  EXPECT_EQ(result.as_string(), std::string("abc\xe4"));
  EXPECT_EQ(result.repr(), "b'abc\\xe4'");
}

TEST(ConvertBytes, CharacterOutsideLatin1)
{
  EXPECT_EQ(
    error_of(TypeKind::Bytes, "ab\xe2\x82\xac"),
    "Argument 'ab\xe2\x82\xac' cannot be converted to bytes: "
    "Character '\xe2\x82\xac' at position 2 cannot be mapped to a byte.");
}

TEST(ConvertBytes, ByteArrayRoundTrip)
{
  const Value bytes = convert(TypeKind::Bytes, Value::make_bytearray("xy"));
  EXPECT_EQ(bytes.kind(), ValueKind::Bytes);
  const Value array = convert(TypeKind::ByteArray, Value::make_bytes("xy"));
  EXPECT_EQ(array.kind(), ValueKind::ByteArray);
  EXPECT_EQ(array.repr(), "bytearray(b'xy')");
}

// ============================================================================
// Dates and Durations
// ============================================================================

TEST(ConvertDateTime, Timestamps)
{
  const Value result = convert(TypeKind::DateTime, "2024-01-31 12:30");
  ASSERT_EQ(result.kind(), ValueKind::DateTime);
  const auto & dt = result.as_datetime();
  EXPECT_EQ(dt.date.year, 2024);
  EXPECT_EQ(dt.date.month, 1);
  EXPECT_EQ(dt.date.day, 31);
  EXPECT_EQ(dt.hour, 12);
  EXPECT_EQ(dt.minute, 30);

  const Value epoch = convert(TypeKind::DateTime, Value::make_integer(0));
  EXPECT_EQ(epoch.as_datetime().date.year, 1970);

  EXPECT_EQ(
    error_of(TypeKind::DateTime, "yesterday"),
    "Argument 'yesterday' cannot be converted to datetime: Invalid timestamp 'yesterday'.");
}

TEST(ConvertDate, RejectsTimeOfDay)
{
  const Value result = convert(TypeKind::Date, "2024-01-31");
  ASSERT_EQ(result.kind(), ValueKind::Date);
  EXPECT_EQ(result.as_date().day, 31);

  EXPECT_EQ(
    error_of(TypeKind::Date, "2024-01-31 12:00"),
    "Argument '2024-01-31 12:00' cannot be converted to date: Value is datetime, not date.");
  EXPECT_EQ(
    error_of(TypeKind::Date, Value::make_integer(0)),
    "Argument '0' (integer) cannot be converted to date.");
}

TEST(ConvertTimeDelta, Forms)
{
  EXPECT_EQ(convert(TypeKind::TimeDelta, "1 minute 30 s").as_timedelta().microseconds, 90000000);
  EXPECT_EQ(convert(TypeKind::TimeDelta, "01:30").as_timedelta().microseconds, 90000000);
  EXPECT_EQ(convert(TypeKind::TimeDelta, "1.5").as_timedelta().microseconds, 1500000);
  EXPECT_EQ(
    convert(TypeKind::TimeDelta, Value::make_float(0.25)).as_timedelta().microseconds, 250000);
  EXPECT_EQ(
    error_of(TypeKind::TimeDelta, "soon"),
    "Argument 'soon' cannot be converted to timedelta: Invalid time string 'soon'.");
}

// ============================================================================
// Path
// ============================================================================

TEST(ConvertPath, Normalizes)
{
  const Value result = convert(TypeKind::Path, "a//b/./c/");
  ASSERT_EQ(result.kind(), ValueKind::Path);
  EXPECT_EQ(result.as_string(), "a/b/c");
  EXPECT_EQ(convert(TypeKind::Path, "/tmp/x").as_string(), "/tmp/x");
  EXPECT_EQ(convert(TypeKind::Path, "").as_string(), ".");
}

TEST(ConvertPath, PathInputNeedsNoConversion)
{
  const Value path = Value::make_path("x/./y");
  EXPECT_EQ(convert(TypeKind::Path, path).as_string(), "x/./y");
}

// ============================================================================
// Idempotence
// ============================================================================

TEST(ConvertScalar, IdempotentOnConvertedValues)
{
  const std::vector<std::pair<TypeKind, const char *>> cases{
    {TypeKind::Integer, "0x1F"},
    {TypeKind::Integer, "1 000"},
    {TypeKind::Float, "1.5e3"},
    {TypeKind::Float, "-inf"},
    {TypeKind::Decimal, "1.50"},
    {TypeKind::Bool, "yes"},
    {TypeKind::Bool, "maybe"},
    {TypeKind::String, "text"},
    {TypeKind::Bytes, "abc"},
    {TypeKind::ByteArray, "abc"},
    {TypeKind::DateTime, "2024-01-31 12:30"},
    {TypeKind::Date, "2024-01-31"},
    {TypeKind::TimeDelta, "1 min 30 s"},
    {TypeKind::Path, "a//b/./c"},
    {TypeKind::None, "none"},
  };
  for (const auto & [kind, text] : cases) {
    SCOPED_TRACE(text);
    const Value once = convert(kind, text);
    const Value twice = convert(kind, once);
    EXPECT_EQ(twice.kind(), once.kind());
    EXPECT_EQ(twice, once);
  }
}
