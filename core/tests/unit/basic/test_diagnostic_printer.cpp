#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "argconv/basic/diagnostic.hpp"
#include "argconv/basic/diagnostic_printer.hpp"

using argconv::DiagnosticBag;
using argconv::DiagnosticPrinter;
using argconv::Severity;

TEST(DiagnosticBag, BuilderAddsOnDestruction)
{
  DiagnosticBag diags;
  diags.report_error("count", "bad value").with_code("E0200").with_help("use a number");
  diags.report_warning("ratio", "looks odd");

  ASSERT_EQ(diags.size(), 2U);
  EXPECT_TRUE(diags.has_errors());
  EXPECT_EQ(diags.errors().size(), 1U);

  const auto & first = diags.all()[0];
  EXPECT_EQ(first.severity, Severity::Error);
  EXPECT_EQ(first.code, "E0200");
  EXPECT_EQ(first.subject, "count");
  ASSERT_TRUE(first.help_message.has_value());
  EXPECT_EQ(*first.help_message, "use a number");
  EXPECT_EQ(diags.all()[1].severity, Severity::Warning);
}

TEST(DiagnosticBag, Merge)
{
  DiagnosticBag a;
  DiagnosticBag b;
  a.report_warning("x", "one");
  b.report_error("y", "two");
  a.merge(std::move(b));
  ASSERT_EQ(a.size(), 2U);
  EXPECT_EQ(a.all()[1].message, "two");
}

TEST(DiagnosticPrinter, PlainOutput)
{
  DiagnosticBag diags;
  diags.report_error("count", "Argument 'count' got value 'x' that cannot be converted to integer.")
    .with_code("E0200");
  diags.report_error("b", "Unrecognized type 'Widget'.")
    .with_code("E0100")
    .with_help("declare a supported type");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(diags);

  EXPECT_EQ(
    out.str(),
    "error[E0200]: Argument 'count' got value 'x' that cannot be converted to integer.\n"
    "  --> count\n"
    "\n"
    "error[E0100]: Unrecognized type 'Widget'.\n"
    "  --> b\n"
    "      |\n"
    "      = help: declare a supported type\n"
    "\n");
}

TEST(DiagnosticPrinter, WarningWithoutCode)
{
  DiagnosticBag diags;
  diags.report_warning("", "nothing to convert");

  std::ostringstream out;
  DiagnosticPrinter(out, false).print_all(diags);
  EXPECT_EQ(out.str(), "warning: nothing to convert\n\n");
}
