#include "common/trace.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace
{
trace::FormattingOptions make_test_options()
{
  auto opts = trace::get_formatting_options("trace-format-test");
  opts.set_color_output(trace::FormattingOptions::ColorOptions::no);
  return opts;
}
} // namespace

TEST(TraceFormatting, FloatingPointPrecision)
{
  auto opts = make_test_options();
  opts.fp_precision = 4;

  EXPECT_EQ("3.142", trace::formatValue(3.14159f, opts));
  EXPECT_EQ("2.718", trace::formatValue(2.718281828, opts));
  EXPECT_EQ("1e+20", trace::formatValue(1e20, opts));
}

TEST(TraceFormatting, NullRepresentations)
{
  auto opts = make_test_options();
  const char* null_ptr = nullptr;
  EXPECT_EQ("(null)", trace::formatValue(null_ptr, opts));
}

TEST(TraceFormatting, ContainerFormatting)
{
  auto opts = make_test_options();
  std::vector<double> values{1.5, 2.0, -0.25};
  EXPECT_EQ("[ 1.5, 2, -0.25 ]", trace::formatValue(values, opts));
  EXPECT_EQ("[  ]", trace::formatValue(std::vector<int>{}, opts));
}

TEST(TraceFormatting, StringsAreNotContainers)
{
  auto opts = make_test_options();
  EXPECT_EQ("abc", trace::formatValue(std::string("abc"), opts));
}

TEST(TraceFormatting, ParseNamesSplitsAtTopLevelCommas)
{
  auto names = trace::parseNames("\"emitting step\", f(a, b), x[1, 2], 'c'");
  ASSERT_EQ(names.size(), 4u);
  EXPECT_EQ(names[0].first, "\"emitting step\"");
  EXPECT_TRUE(names[0].second);
  EXPECT_EQ(names[1].first, "f(a, b)");
  EXPECT_FALSE(names[1].second);
  EXPECT_EQ(names[2].first, "x[1, 2]");
  EXPECT_FALSE(names[2].second);
  EXPECT_TRUE(names[3].second);
}

TEST(TraceFormatting, ParameterListPairsNamesWithValues)
{
  auto opts = make_test_options();
  int arity = 2;
  EXPECT_EQ("registering rule, arity = 2", trace::formatParameterList("\"registering rule\", arity", opts,
                                                                      "registering rule", arity));
  EXPECT_EQ("", trace::formatParameterList("", opts));
}

TEST(TraceFormatting, StylesAreSkippedWithoutColor)
{
  auto opts = make_test_options();
  EXPECT_FALSE(opts.should_show_color());
  EXPECT_EQ("text", opts.format_style("text", "TRACE"));
}

TEST(TraceFormatting, StylesAreAppliedWithColor)
{
  auto opts = make_test_options();
  opts.set_color_output(trace::FormattingOptions::ColorOptions::yes);
  opts.Styles["TRACE"] = terminal::TerminalStyle("Cyan");
  EXPECT_EQ("\033[36mtext\033[0m", opts.format_style("text", "TRACE"));
  EXPECT_EQ("text", opts.format_style("text", "NO_SUCH_KIND"));
}
