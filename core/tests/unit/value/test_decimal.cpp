#include <gtest/gtest.h>

#include <cmath>
#include <string>

#include "argconv/value/decimal.hpp"

using argconv::Decimal;

namespace
{

Decimal dec(const char * text)
{
  const auto d = Decimal::parse(text);
  EXPECT_TRUE(d.has_value()) << text;
  return d.value_or(Decimal());
}

}  // namespace

TEST(Decimal, ParseAndDisplay)
{
  EXPECT_EQ(dec("1.50").to_string(), "1.50");
  EXPECT_EQ(dec(" -0.5 ").to_string(), "-0.5");
  EXPECT_EQ(dec("1e3").to_string(), "1E+3");
  EXPECT_EQ(dec("0.0001").to_string(), "0.0001");
  EXPECT_EQ(dec("1e-7").to_string(), "1E-7");
  EXPECT_EQ(dec(".5").to_string(), "0.5");
  EXPECT_EQ(dec("Infinity").to_string(), "Infinity");
  EXPECT_EQ(dec("-inf").to_string(), "-Infinity");
  EXPECT_EQ(dec("nan").to_string(), "NaN");
}

TEST(Decimal, RejectsMalformedText)
{
  EXPECT_FALSE(Decimal::parse("").has_value());
  EXPECT_FALSE(Decimal::parse("1.2.3").has_value());
  EXPECT_FALSE(Decimal::parse("abc").has_value());
  EXPECT_FALSE(Decimal::parse("1e").has_value());
  EXPECT_FALSE(Decimal::parse("--1").has_value());
}

TEST(Decimal, HugeExponents)
{
  EXPECT_EQ(dec("1e1000000001").to_string(), "1E+1000000001");
  EXPECT_TRUE(std::isinf(dec("1e1000000001").to_double()));
  EXPECT_EQ(dec("-1e-1000000001").to_double(), 0.0);
  EXPECT_GT(dec("1e99999999999999999999").compare(dec("1e1000")), 0);
}

TEST(Decimal, ComparisonIgnoresTrailingZeros)
{
  EXPECT_EQ(dec("1.0"), dec("1"));
  EXPECT_EQ(dec("100"), dec("1e2"));
  EXPECT_LT(dec("-2").compare(dec("1.5")), 0);
  EXPECT_GT(dec("Infinity").compare(dec("1e100")), 0);
  EXPECT_NE(dec("NaN"), dec("NaN"));
}

TEST(Decimal, IntegralValues)
{
  EXPECT_TRUE(dec("2.00").is_integral());
  EXPECT_FALSE(dec("2.01").is_integral());
  EXPECT_FALSE(dec("Infinity").is_integral());

  EXPECT_EQ(dec("1e3").to_integer(), 1000);
  EXPECT_EQ(dec("-42.0").to_integer(), -42);
  EXPECT_FALSE(dec("1.5").to_integer().has_value());
  EXPECT_FALSE(dec("1e30").to_integer().has_value());
}

TEST(Decimal, Conversions)
{
  EXPECT_DOUBLE_EQ(dec("2.5").to_double(), 2.5);
  EXPECT_TRUE(std::isinf(dec("-Infinity").to_double()));
  EXPECT_EQ(Decimal::from_integer(-7).to_string(), "-7");
  EXPECT_EQ(
    Decimal::from_double(0.1).to_string(),
    "0.1000000000000000055511151231257827021181583404541015625");
  EXPECT_EQ(Decimal::from_double(2.0).to_string(), "2");
}
