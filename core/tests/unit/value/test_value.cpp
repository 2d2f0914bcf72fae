#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>

#include "argconv/types/declared_type.hpp"
#include "argconv/value/value.hpp"

using argconv::DeclaredType;
using argconv::TypeKind;
using argconv::Value;
using argconv::ValueKind;

namespace
{

Value s(const char * text) { return Value::make_string(text); }
Value i(int64_t v) { return Value::make_integer(v); }

}  // namespace

// ============================================================================
// Text forms
// ============================================================================

TEST(Value, ReprOfScalars)
{
  EXPECT_EQ(Value::none().repr(), "None");
  EXPECT_EQ(Value::make_bool(false).repr(), "False");
  EXPECT_EQ(i(-3).repr(), "-3");
  EXPECT_EQ(Value::make_float(1.0).repr(), "1.0");
  EXPECT_EQ(Value::make_float(0.1).repr(), "0.1");
  EXPECT_EQ(Value::make_float(1e16).repr(), "1e+16");
  EXPECT_EQ(s("it's").repr(), "\"it's\"");
  EXPECT_EQ(s("a\n'\"").repr(), "'a\\n\\'\"'");
  EXPECT_EQ(Value::make_bytes("\x01\xff").repr(), "b'\\x01\\xff'");
  EXPECT_EQ(Value::make_bytearray("ab").repr(), "bytearray(b'ab')");
  EXPECT_EQ(Value::make_path("/tmp").repr(), "Path('/tmp')");
}

TEST(Value, ReprOfContainers)
{
  EXPECT_EQ(Value::make_list({i(1), s("a")}).repr(), "[1, 'a']");
  EXPECT_EQ(Value::make_tuple({i(1)}).repr(), "(1,)");
  EXPECT_EQ(Value::make_tuple({}).repr(), "()");
  EXPECT_EQ(Value::make_set({}).repr(), "set()");
  EXPECT_EQ(Value::make_frozenset({i(2)}).repr(), "frozenset({2})");
  EXPECT_EQ(Value::make_dict({{s("k"), Value::none()}}).repr(), "{'k': None}");
}

TEST(Value, StrDiffersFromReprForText)
{
  EXPECT_EQ(s("x").str(), "x");
  EXPECT_EQ(Value::make_list({s("x")}).str(), "['x']");
  EXPECT_EQ(Value::make_path("a/b").str(), "a/b");
}

TEST(Value, TemporalForms)
{
  const argconv::DateTime dt{{2024, 1, 31}, 12, 30, 0, 0};
  EXPECT_EQ(Value::make_datetime(dt).str(), "2024-01-31 12:30:00");
  EXPECT_EQ(Value::make_datetime(dt).repr(), "datetime.datetime(2024, 1, 31, 12, 30)");
  EXPECT_EQ(Value::make_date({2024, 2, 29}).repr(), "datetime.date(2024, 2, 29)");

  const argconv::TimeDelta td{-1500000};
  EXPECT_EQ(Value::make_timedelta(td).str(), "-1 day, 23:59:58.500000");
  EXPECT_EQ(
    Value::make_timedelta(td).repr(), "datetime.timedelta(days=-1, seconds=86398, microseconds=500000)");
  EXPECT_EQ(Value::make_timedelta({}).repr(), "datetime.timedelta(0)");
}

TEST(Value, TypeNames)
{
  EXPECT_EQ(s("").type_name(), "string");
  EXPECT_EQ(Value::make_bool(true).type_name(), "boolean");
  EXPECT_EQ(Value::make_dict({}).type_name(), "dictionary");
  EXPECT_EQ(Value::none().type_name(), "None");
}

// ============================================================================
// Equality and hashing
// ============================================================================

TEST(Value, NumericEqualityCrossesKinds)
{
  EXPECT_EQ(i(1), Value::make_float(1.0));
  EXPECT_EQ(i(1), Value::make_bool(true));
  EXPECT_EQ(Value::make_float(0.5), Value::make_decimal(*argconv::Decimal::parse("0.50")));
  EXPECT_NE(i(1), s("1"));
  EXPECT_NE(Value::make_float(0.1), Value::make_decimal(*argconv::Decimal::parse("0.1")));
}

TEST(Value, ContainerEquality)
{
  EXPECT_EQ(Value::make_set({i(1), i(2)}), Value::make_frozenset({i(2), i(1)}));
  EXPECT_NE(Value::make_list({i(1)}), Value::make_tuple({i(1)}));
  EXPECT_EQ(Value::make_bytes("a"), Value::make_bytearray("a"));
  EXPECT_EQ(
    Value::make_dict({{s("a"), i(1)}, {s("b"), i(2)}}),
    Value::make_dict({{s("b"), i(2)}, {s("a"), i(1)}}));
}

TEST(Value, Hashability)
{
  EXPECT_TRUE(Value::make_tuple({i(1), s("a")}).is_hashable());
  EXPECT_FALSE(Value::make_tuple({Value::make_list({})}).is_hashable());
  EXPECT_FALSE(Value::make_bytearray("").is_hashable());
  EXPECT_FALSE(Value::make_dict({}).is_hashable());
}

TEST(Value, SetsDeduplicate)
{
  EXPECT_EQ(Value::make_set({i(1), Value::make_float(1.0), i(2)}).size(), 2U);
}

// ============================================================================
// Enumerations and iteration
// ============================================================================

TEST(Value, EnumMembers)
{
  const auto color = argconv::make_int_enum("Color", {{"RED", 1}});
  const Value red = argconv::enum_member(color, "RED");
  EXPECT_EQ(red.str(), "Color.RED");
  EXPECT_EQ(red.repr(), "<Color.RED: 1>");
  EXPECT_EQ(red.type_name(), "Color");
  EXPECT_THROW((void)argconv::enum_member(color, "BLUE"), std::out_of_range);
}

TEST(Value, Iterate)
{
  const auto chars = argconv::iterate(s("a\xc3\xa4"));
  ASSERT_TRUE(chars.has_value());
  ASSERT_EQ(chars->size(), 2U);
  EXPECT_EQ((*chars)[1].as_string(), "\xc3\xa4");

  const auto keys = argconv::iterate(Value::make_dict({{s("k"), i(1)}}));
  ASSERT_TRUE(keys.has_value());
  EXPECT_EQ((*keys)[0].as_string(), "k");

  EXPECT_FALSE(argconv::iterate(i(1)).has_value());
}

// ============================================================================
// Runtime types
// ============================================================================

TEST(DeclaredType, SubclassRelations)
{
  EXPECT_TRUE(argconv::is_subclass(TypeKind::Bool, TypeKind::Integer));
  EXPECT_TRUE(argconv::is_subclass(TypeKind::Integer, TypeKind::Integral));
  EXPECT_TRUE(argconv::is_subclass(TypeKind::List, TypeKind::Sequence));
  EXPECT_FALSE(argconv::is_subclass(TypeKind::Integer, TypeKind::Float));
  EXPECT_FALSE(argconv::is_subclass(TypeKind::Any, TypeKind::Any));

  const auto color = argconv::make_int_enum("Color", {{"RED", 1}});
  EXPECT_TRUE(argconv::is_subclass(DeclaredType::of_enum(color), TypeKind::Integer));
  EXPECT_TRUE(argconv::is_instance(argconv::enum_member(color, "RED"), DeclaredType::of_enum(color)));
}

TEST(DeclaredType, ConstantsCompareByKindAndValue)
{
  EXPECT_EQ(DeclaredType::of_constant(i(1)), DeclaredType::of_constant(i(1)));
  EXPECT_NE(DeclaredType::of_constant(i(1)), DeclaredType::of_constant(Value::make_bool(true)));
  EXPECT_EQ(DeclaredType::of_constant(s("a")).name(), "'a'");
}
