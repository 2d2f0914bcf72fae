#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "argconv/basic/diagnostic.hpp"
#include "argconv/convert/argument_converter.hpp"
#include "argconv/vocabulary/languages.hpp"

using argconv::ArgumentConverter;
using argconv::ArgumentSpec;
using argconv::DiagnosticBag;
using argconv::Languages;
using argconv::NamedValue;
using argconv::TypeInfo;
using argconv::TypeKind;
using argconv::Value;

namespace
{

Value text(const char * s) { return Value::make_string(s); }

std::vector<ArgumentSpec> keyword_specs()
{
  return {
    {"count", TypeInfo::of(TypeKind::Integer), std::nullopt},
    {"ratio", TypeInfo::of(TypeKind::Float), Value::make_float(0.5)},
    {"flag", TypeInfo(), Value::make_bool(false)},
    {"label", TypeInfo(), Value::none()},
  };
}

}  // namespace

TEST(ArgumentConverter, ConvertsNamedValuesInOrder)
{
  DiagnosticBag diags;
  ArgumentConverter conv(keyword_specs(), &diags);

  const auto result = conv.convert(std::vector<NamedValue>{
    {"ratio", text("1.25")}, {"count", text("3")}, {"extra", text("x")}});
  ASSERT_EQ(result.size(), 3U);
  EXPECT_EQ(result[0].name, "ratio");
  EXPECT_DOUBLE_EQ(result[0].value.as_float(), 1.25);
  EXPECT_EQ(result[1].value.as_integer(), 3);
  EXPECT_EQ(result[2].value.as_string(), "x");
  EXPECT_FALSE(conv.has_errors());
  EXPECT_TRUE(diags.empty());
}

TEST(ArgumentConverter, UntypedArgumentUsesDefaultType)
{
  ArgumentConverter conv(keyword_specs());
  const Value flag = conv.convert("flag", text("yes"));
  ASSERT_TRUE(flag.is_bool());
  EXPECT_TRUE(flag.as_bool());

  const Value label = conv.convert("label", text("none"));
  ASSERT_TRUE(label.is_string());
  EXPECT_EQ(label.as_string(), "none");
}

TEST(ArgumentConverter, DefaultValueIsKept)
{
  ArgumentConverter conv(keyword_specs());
  const Value ratio = conv.convert("ratio", Value::make_float(0.5));
  ASSERT_TRUE(ratio.is_float());
  EXPECT_DOUBLE_EQ(ratio.as_float(), 0.5);

  std::vector<ArgumentSpec> specs{
    {"limit", TypeInfo::of(TypeKind::Integer), Value::none()}};
  ArgumentConverter nullable(std::move(specs));
  EXPECT_TRUE(nullable.convert("limit", Value::none()).is_none());
  EXPECT_FALSE(nullable.has_errors());
}

TEST(ArgumentConverter, RetriesWithDefaultType)
{
  std::vector<ArgumentSpec> specs{
    {"size", TypeInfo::of(TypeKind::Integer), Value::make_float(1.5)}};
  DiagnosticBag diags;
  ArgumentConverter conv(std::move(specs), &diags);

  const Value size = conv.convert("size", text("2.5"));
  ASSERT_TRUE(size.is_float());
  EXPECT_DOUBLE_EQ(size.as_float(), 2.5);
  EXPECT_TRUE(diags.empty());
}

TEST(ArgumentConverter, FailureReportsDeclaredTypeError)
{
  std::vector<ArgumentSpec> specs{
    {"size", TypeInfo::of(TypeKind::Integer), Value::make_float(1.5)}};
  DiagnosticBag diags;
  ArgumentConverter conv(std::move(specs), &diags);

  const Value size = conv.convert("size", text("big"));
  ASSERT_TRUE(size.is_string());
  EXPECT_EQ(size.as_string(), "big");

  EXPECT_EQ(conv.error_count(), 1U);
  ASSERT_EQ(diags.size(), 1U);
  const auto & diag = diags.all()[0];
  EXPECT_EQ(diag.code, argconv::diag_code::k_conversion_failed);
  EXPECT_EQ(diag.subject, "size");
  EXPECT_EQ(diag.message, "Argument 'size' got value 'big' that cannot be converted to integer.");
}

TEST(ArgumentConverter, ValidateReportsUnrecognizedTypes)
{
  std::vector<ArgumentSpec> specs{
    {"a", TypeInfo::of(TypeKind::Integer), std::nullopt},
    {"b", TypeInfo::unknown("Widget"), std::nullopt},
    {"c", TypeInfo(), std::nullopt},
  };
  DiagnosticBag diags;
  ArgumentConverter conv(std::move(specs), &diags);

  EXPECT_FALSE(conv.validate());
  ASSERT_EQ(diags.size(), 1U);
  const auto & diag = diags.all()[0];
  EXPECT_EQ(diag.code, argconv::diag_code::k_unrecognized_type);
  EXPECT_EQ(diag.subject, "b");
  EXPECT_EQ(diag.message, "Unrecognized type 'Widget'.");
  ASSERT_TRUE(diag.help_message.has_value());

  // Unknown types pass values through without an error.
  EXPECT_EQ(conv.convert("b", text("w")).as_string(), "w");
  EXPECT_EQ(conv.error_count(), 1U);
}

TEST(ArgumentConverter, WorksWithoutDiagnosticBag)
{
  std::vector<ArgumentSpec> specs{{"n", TypeInfo::of(TypeKind::Integer), std::nullopt}};
  ArgumentConverter conv(std::move(specs));
  EXPECT_EQ(conv.diagnostics(), nullptr);
  EXPECT_EQ(conv.convert("n", text("x")).as_string(), "x");
  EXPECT_TRUE(conv.has_errors());
}

TEST(ArgumentConverter, SharedLanguages)
{
  const auto languages = std::make_shared<const Languages>(std::vector<std::string>{"fi"});
  std::vector<ArgumentSpec> specs{{"on", TypeInfo::of(TypeKind::Bool), std::nullopt}};
  ArgumentConverter conv(std::move(specs), nullptr, nullptr, languages);

  const Value on = conv.convert("on", text("Kyllä"));
  ASSERT_TRUE(on.is_bool());
  EXPECT_TRUE(on.as_bool());
}
