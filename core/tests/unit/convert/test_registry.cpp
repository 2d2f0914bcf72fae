#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>

#include "argconv/basic/errors.hpp"
#include "argconv/convert/container_converters.hpp"
#include "argconv/convert/converter.hpp"
#include "argconv/convert/custom_converter.hpp"
#include "argconv/convert/resolution_converters.hpp"
#include "argconv/convert/scalar_converters.hpp"

using argconv::ClassType;
using argconv::ConversionError;
using argconv::Converter;
using argconv::ConverterInfo;
using argconv::ConverterKind;
using argconv::CustomConverters;
using argconv::DeclaredType;
using argconv::TypeInfo;
using argconv::TypeKind;
using argconv::UnrecognizedTypeError;
using argconv::Value;
using argconv::ValueKind;

namespace
{

std::shared_ptr<const ClassType> make_class(std::string name, std::vector<TypeKind> bases = {})
{
  return std::make_shared<const ClassType>(ClassType{std::move(name), std::move(bases), {}});
}

ConverterKind kind_for(const TypeInfo & info)
{
  return Converter::converter_for(info)->get_kind();
}

std::string error_of(const Converter & conv, const Value & value)
{
  try {
    (void)conv.convert(value);
  } catch (const ConversionError & e) {
    return e.what();
  }
  return "<no error>";
}

/// Registers a converter parsing "x,y" into a Point object.
CustomConverters point_converters(const std::shared_ptr<const ClassType> & point)
{
  CustomConverters custom;
  custom.add(ConverterInfo{
    DeclaredType::of_class(point), "Point", "Point as 'x,y'.", {TypeKind::String},
    [point](const Value & value) {
      const std::string & text = value.as_string();
      const auto comma = text.find(',');
      if (comma == std::string::npos) {
        throw ConversionError("Expected 'x,y'.");
      }
      if (text.substr(0, comma).empty()) {
        throw std::invalid_argument("empty x");
      }
      return Value::make_object(point, "Point(" + text + ")");
    }});
  return custom;
}

}  // namespace

// ============================================================================
// Lookup
// ============================================================================

TEST(ConverterRegistry, BuiltinKinds)
{
  EXPECT_EQ(kind_for(TypeInfo::of(TypeKind::Integer)), ConverterKind::Integer);
  EXPECT_EQ(kind_for(TypeInfo::of(TypeKind::Bool)), ConverterKind::Boolean);
  EXPECT_EQ(kind_for(TypeInfo::of(TypeKind::String)), ConverterKind::String);
  EXPECT_EQ(kind_for(TypeInfo::of(TypeKind::Dict)), ConverterKind::Dictionary);
  EXPECT_EQ(kind_for(TypeInfo::of(TypeKind::None)), ConverterKind::None);
  EXPECT_EQ(kind_for(TypeInfo::any()), ConverterKind::Any);
}

TEST(ConverterRegistry, AbstractBases)
{
  EXPECT_EQ(kind_for(TypeInfo::of(TypeKind::Integral)), ConverterKind::Integer);
  EXPECT_EQ(kind_for(TypeInfo::of(TypeKind::Real)), ConverterKind::Float);
  EXPECT_EQ(kind_for(TypeInfo::of(TypeKind::Sequence)), ConverterKind::List);
  EXPECT_EQ(kind_for(TypeInfo::of(TypeKind::Mapping)), ConverterKind::Dictionary);
  EXPECT_EQ(kind_for(TypeInfo::of(TypeKind::AbstractSet)), ConverterKind::Set);
  EXPECT_EQ(kind_for(TypeInfo::of(TypeKind::PathLike)), ConverterKind::Path);
}

TEST(ConverterRegistry, ApplicationClassesMatchByBase)
{
  EXPECT_EQ(
    kind_for(TypeInfo::of_class(make_class("Counter", {TypeKind::Integer}))),
    ConverterKind::Integer);
  EXPECT_EQ(
    kind_for(TypeInfo::of_class(make_class("Rows", {TypeKind::Sequence}))), ConverterKind::List);
  EXPECT_EQ(kind_for(TypeInfo::of_class(make_class("Widget"))), ConverterKind::Unknown);
}

TEST(ConverterRegistry, IntBackedEnumIsEnum)
{
  const auto level = argconv::make_int_enum("Level", {{"LOW", 1}, {"HIGH", 2}});
  EXPECT_EQ(kind_for(TypeInfo::enumeration(level)), ConverterKind::Enum);
}

TEST(ConverterRegistry, BareEnumKindIsUnknown)
{
  EXPECT_EQ(kind_for(TypeInfo::of(TypeKind::Enum)), ConverterKind::Unknown);
}

TEST(ConverterRegistry, NestedConverters)
{
  const auto conv =
    Converter::converter_for(TypeInfo::dict_of(TypeInfo::of(TypeKind::String), TypeInfo::list_of(TypeInfo::of(TypeKind::Integer))));
  ASSERT_TRUE(argconv::isa<argconv::DictionaryConverter>(conv.get()));
  ASSERT_EQ(conv->nested().size(), 2U);
  EXPECT_EQ(conv->nested()[0]->get_kind(), ConverterKind::String);
  EXPECT_EQ(conv->nested()[1]->get_kind(), ConverterKind::List);
  EXPECT_EQ(conv->nested()[1]->nested()[0]->type_name(), "integer");
  EXPECT_EQ(conv->type_name(), "dict[str, list[int]]");
}

TEST(ConverterRegistry, SequenceKeepsValidTuple)
{
  const TypeInfo info("Sequence", TypeKind::Sequence, {TypeInfo::of(TypeKind::Integer)});
  const auto conv = Converter::converter_for(info);
  ASSERT_EQ(conv->get_kind(), ConverterKind::List);

  const Value valid = Value::make_tuple({Value::make_integer(1), Value::make_integer(2)});
  EXPECT_TRUE(conv->no_conversion_needed(valid));
  const Value result = conv->convert(valid);
  EXPECT_EQ(result.kind(), ValueKind::Tuple);
  EXPECT_EQ(result.repr(), "(1, 2)");

  const Value mixed = Value::make_tuple({Value::make_integer(1), Value::make_string("2")});
  EXPECT_FALSE(conv->no_conversion_needed(mixed));
  EXPECT_EQ(conv->convert(mixed).repr(), "[1, 2]");
}

TEST(ConverterRegistry, KindNames)
{
  EXPECT_EQ(argconv::to_string(ConverterKind::TypedDict), "typeddict");
  EXPECT_EQ(argconv::to_string(ConverterKind::Integer), "integer");
  EXPECT_EQ(argconv::to_string(ConverterKind::Unknown), "unknown");
}

// ============================================================================
// Unknown Types
// ============================================================================

TEST(ConverterRegistry, UnknownPassesThroughAndFailsValidation)
{
  const auto conv = Converter::converter_for(TypeInfo::unknown("Widget"));
  ASSERT_TRUE(argconv::isa<argconv::UnknownConverter>(conv.get()));
  EXPECT_EQ(conv->convert(Value::make_string("x")).as_string(), "x");

  try {
    conv->validate();
    FAIL() << "expected UnrecognizedTypeError";
  } catch (const UnrecognizedTypeError & e) {
    EXPECT_STREQ(e.what(), "Unrecognized type 'Widget'.");
  }
}

TEST(ConverterRegistry, ValidateReachesNestedTypes)
{
  const auto conv = Converter::converter_for(TypeInfo::list_of(TypeInfo::unknown("Widget")));
  EXPECT_THROW(conv->validate(), UnrecognizedTypeError);
  EXPECT_NO_THROW(Converter::converter_for(TypeInfo::list_of(TypeInfo::of(TypeKind::Integer)))->validate());
}

// ============================================================================
// Error Messages
// ============================================================================

TEST(ConverterRegistry, NamedArgumentMessage)
{
  const auto conv = Converter::converter_for(TypeInfo::of(TypeKind::Integer));
  try {
    (void)conv->convert(Value::make_string("x"), "count");
    FAIL() << "expected ConversionError";
  } catch (const ConversionError & e) {
    EXPECT_STREQ(e.what(), "Argument 'count' got value 'x' that cannot be converted to integer.");
  }
}

TEST(ConverterRegistry, LowercaseKindIsCapitalized)
{
  const auto conv = Converter::converter_for(TypeInfo::of(TypeKind::Integer));
  try {
    (void)conv->convert(Value::make_float(1.5), std::nullopt, "return value");
    FAIL() << "expected ConversionError";
  } catch (const ConversionError & e) {
    EXPECT_STREQ(
      e.what(),
      "Return value '1.5' (float) cannot be converted to integer: Conversion would lose precision.");
  }
}

// ============================================================================
// Custom Converters
// ============================================================================

TEST(CustomConverters, RegisteredTypeUsesCustomConverter)
{
  const auto point = make_class("Point");
  const auto custom = point_converters(point);
  const auto conv = Converter::converter_for(TypeInfo::of_class(point), &custom);
  EXPECT_EQ(conv->get_kind(), ConverterKind::Custom);
  EXPECT_EQ(conv->type_name(), "Point");
  ASSERT_TRUE(conv->doc().has_value());
  EXPECT_EQ(*conv->doc(), "Point as 'x,y'.");

  const Value result = conv->convert(Value::make_string("1,2"));
  ASSERT_EQ(result.kind(), ValueKind::Object);
  EXPECT_EQ(result.str(), "Point(1,2)");
  EXPECT_TRUE(conv->no_conversion_needed(result));
}

TEST(CustomConverters, ErrorsFromConversionFunction)
{
  const auto point = make_class("Point");
  const auto custom = point_converters(point);
  const auto conv = Converter::converter_for(TypeInfo::of_class(point), &custom);

  EXPECT_EQ(
    error_of(*conv, Value::make_string("12")),
    "Argument '12' cannot be converted to Point: Expected 'x,y'.");
  EXPECT_EQ(
    error_of(*conv, Value::make_string(",2")), "Argument ',2' cannot be converted to Point.");
  EXPECT_EQ(
    error_of(*conv, Value::make_integer(1)),
    "Argument '1' (integer) cannot be converted to Point.");
}

TEST(CustomConverters, UsedForNestedTypes)
{
  const auto point = make_class("Point");
  const auto custom = point_converters(point);
  const auto conv = Converter::converter_for(TypeInfo::list_of(TypeInfo::of_class(point)), &custom);
  EXPECT_EQ(conv->get_kind(), ConverterKind::List);

  const Value result = conv->convert(Value::make_list({Value::make_string("1,2")}));
  ASSERT_EQ(result.size(), 1U);
  EXPECT_EQ(result.items()[0].str(), "Point(1,2)");
}

TEST(CustomConverters, OverrideBuiltinAndReplace)
{
  CustomConverters custom;
  custom.add(ConverterInfo{
    TypeKind::Integer, "hex", "", {}, [](const Value &) { return Value::make_integer(1); }});
  custom.add(ConverterInfo{
    TypeKind::Integer, "hex", "", {}, [](const Value &) { return Value::make_integer(2); }});
  EXPECT_EQ(custom.size(), 1U);

  const auto conv = Converter::converter_for(TypeInfo::of(TypeKind::Integer), &custom);
  EXPECT_EQ(conv->get_kind(), ConverterKind::Custom);
  EXPECT_FALSE(conv->doc().has_value());
  EXPECT_EQ(conv->convert(Value::make_string("ff")).as_integer(), 2);
  EXPECT_EQ(Converter::converter_for(TypeInfo::of(TypeKind::Float), &custom)->get_kind(), ConverterKind::Float);
}
