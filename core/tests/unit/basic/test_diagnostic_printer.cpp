// tests/unit/basic/test_diagnostic_printer.cpp - Plain-text diagnostic rendering
//
#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "thingtalk/basic/diagnostic_printer.hpp"

namespace thingtalk
{

namespace
{

const std::string k_program = "now => @com.twitter.post(foo=\"x\");\n";

bool contains(const std::string & haystack, const std::string & needle)
{
  return haystack.find(needle) != std::string::npos;
}

}  // namespace

TEST(DiagnosticPrinterTest, PrintsSourceContext)
{
  DiagnosticBag diags;
  diags.report_error(SourceRange(25, 32), "unknown parameter 'foo'", "not an input of this function")
    .with_code("T004")
    .with_help("the function accepts: status");

  const SourceManager sources("rules.tt", k_program);
  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(diags, &sources);

  const std::string text = out.str();
  EXPECT_TRUE(contains(text, "error[T004]: unknown parameter 'foo'\n")) << text;
  EXPECT_TRUE(contains(text, "  --> rules.tt:1:26\n")) << text;
  EXPECT_TRUE(contains(text, "    1 | now => @com.twitter.post(foo=\"x\");\n")) << text;
  EXPECT_TRUE(contains(
    text, "      | " + std::string(25, ' ') + "^^^^^^^ not an input of this function\n"))
    << text;
  EXPECT_TRUE(contains(text, "   = help: the function accepts: status\n")) << text;
}

TEST(DiagnosticPrinterTest, ProgramWithoutSource)
{
  DiagnosticBag diags;
  diags.report_warning(SourceRange(), "function poll has no arguments", "declared here")
    .with_code("M002");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(diags, nullptr, "<builder>");

  const std::string text = out.str();
  EXPECT_TRUE(contains(text, "warning[M002]: function poll has no arguments\n")) << text;
  EXPECT_TRUE(contains(text, "  --> <builder>\n")) << text;
  EXPECT_TRUE(contains(text, "   = note: declared here\n")) << text;
  EXPECT_FALSE(contains(text, "^")) << text;
}

TEST(DiagnosticPrinterTest, Summary)
{
  DiagnosticBag diags;
  std::ostringstream empty_out;
  DiagnosticPrinter(empty_out, false).print_summary(diags);
  EXPECT_TRUE(empty_out.str().empty());

  diags.report_error(SourceRange(), "first").with_code("T001");
  diags.report_warning(SourceRange(), "second");
  diags.report_warning(SourceRange(), "third");

  std::ostringstream out;
  DiagnosticPrinter(out, false).print_summary(diags);
  EXPECT_EQ(out.str(), "1 error, 2 warnings\n");
}

}  // namespace thingtalk
