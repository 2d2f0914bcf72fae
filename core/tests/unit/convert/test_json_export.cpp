#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "argconv/convert/custom_converter.hpp"
#include "argconv/convert/json_export.hpp"

using argconv::Converter;
using argconv::ConverterInfo;
using argconv::CustomConverters;
using argconv::TypeInfo;
using argconv::TypeKind;
using argconv::Value;
using nlohmann::json;

namespace
{

json describe(const TypeInfo & info, const CustomConverters * custom = nullptr)
{
  return argconv::to_json(*Converter::converter_for(info, custom));
}

}  // namespace

// ============================================================================
// Converters
// ============================================================================

TEST(JsonExport, ScalarConverter)
{
  const json j = describe(TypeInfo::of(TypeKind::Integer));
  EXPECT_EQ(j["name"], "integer");
  EXPECT_EQ(j["kind"], "integer");
  EXPECT_EQ(j["accepts"], json::array({"str", "float"}));
  EXPECT_TRUE(j["nested"].empty());
}

TEST(JsonExport, NestedConverters)
{
  const json j = describe(TypeInfo::list_of(TypeInfo::of(TypeKind::Integer)));
  EXPECT_EQ(j["name"], "list[int]");
  EXPECT_EQ(j["kind"], "list");
  EXPECT_EQ(j["accepts"], json::array({"str", "Sequence"}));
  ASSERT_EQ(j["nested"].size(), 1U);
  EXPECT_EQ(j["nested"][0]["name"], "integer");
}

TEST(JsonExport, TypedDictFields)
{
  const auto info = TypeInfo::typed_dict(
    "Point", {{"x", TypeInfo::of(TypeKind::Integer)}, {"label", TypeInfo::of(TypeKind::String)}},
    {"x"});
  const json j = describe(info);
  EXPECT_EQ(j["kind"], "typeddict");
  EXPECT_FALSE(j.contains("nested"));
  EXPECT_EQ(j["fields"]["x"]["name"], "integer");
  EXPECT_EQ(j["fields"]["label"]["name"], "string");
  EXPECT_EQ(j["required"], json::array({"x"}));
}

TEST(JsonExport, EnumAndLiteralMembers)
{
  const auto color = argconv::make_int_enum("Color", {{"RED", 1}, {"GREEN", 2}});
  EXPECT_EQ(describe(TypeInfo::enumeration(color))["members"], json::array({"RED", "GREEN"}));

  const auto literal = TypeInfo::literal({Value::make_string("a"), Value::make_integer(1)});
  EXPECT_EQ(describe(literal)["members"], json::array({"'a'", "1"}));
}

TEST(JsonExport, CustomConverterDoc)
{
  CustomConverters custom;
  custom.add(ConverterInfo{
    TypeKind::Integer, "hex", "Hexadecimal digits.", {}, [](const Value & v) { return v; }});
  const json j = describe(TypeInfo::of(TypeKind::Integer), &custom);
  EXPECT_EQ(j["kind"], "custom");
  EXPECT_EQ(j["name"], "hex");
  EXPECT_EQ(j["accepts"], json::array({"Any"}));
  EXPECT_EQ(j["doc"], "Hexadecimal digits.");
}

// ============================================================================
// Values
// ============================================================================

TEST(JsonExport, ScalarValues)
{
  EXPECT_TRUE(argconv::to_json(Value::none()).is_null());
  EXPECT_EQ(argconv::to_json(Value::make_bool(true)), true);
  EXPECT_EQ(argconv::to_json(Value::make_integer(-3)), -3);
  EXPECT_EQ(argconv::to_json(Value::make_float(0.25)), 0.25);
  EXPECT_EQ(
    argconv::to_json(Value::make_float(std::numeric_limits<double>::infinity())), "inf");
  EXPECT_EQ(argconv::to_json(Value::make_bytes("\xe4")), "\xc3\xa4");
  EXPECT_EQ(argconv::to_json(Value::make_decimal(*argconv::Decimal::parse("1.10"))), "1.10");
}

TEST(JsonExport, Containers)
{
  const Value list = Value::make_list({Value::make_integer(1), Value::make_string("a")});
  EXPECT_EQ(argconv::to_json(list), json::array({1, "a"}));

  const Value dict = Value::make_dict({{Value::make_string("k"), Value::make_integer(1)}});
  EXPECT_EQ(argconv::to_json(dict), json({{"k", 1}}));

  const Value int_keys = Value::make_dict({{Value::make_integer(1), Value::make_string("one")}});
  EXPECT_EQ(argconv::to_json(int_keys), json::array({json::array({1, "one"})}));
}
