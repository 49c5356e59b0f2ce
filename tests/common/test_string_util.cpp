#include "common/string_util.hpp"
#include "gtest/gtest.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace
{
struct Tagged
{
    explicit Tagged(std::string_view s) : tag(s) {}
    std::string tag;
};
} // namespace

TEST(StringUtilTest, IEqualsMatchesCaseInsensitive)
{
  EXPECT_TRUE(iequals("Hello", "heLLo"));
  EXPECT_FALSE(iequals("Hello", "World"));
  EXPECT_FALSE(iequals("Hello", "Hell"));
}

TEST(StringUtilTest, TrimRemovesSurroundingWhitespace)
{
  EXPECT_EQ(trim("  parallel\t\n"), "parallel");
  EXPECT_EQ(trim("   "), "");
  EXPECT_EQ(trim("a b"), "a b");
}

TEST(StringUtilTest, JoinSeparatesItems)
{
  std::vector<std::string> items{"x", "y", "dx", "dy"};
  EXPECT_EQ(join(items, ", "), "x, y, dx, dy");
  EXPECT_EQ(join(std::vector<std::string>{}, ", "), "");
}

TEST(StringUtilTest, FromStringArithmeticSuccess)
{
  EXPECT_EQ(from_string<int>("42"), 42);
  EXPECT_EQ(from_string<int>(" 17 "), 17);
  EXPECT_DOUBLE_EQ(from_string<double>("3.125"), 3.125);
}

TEST(StringUtilTest, FromStringArithmeticInvalidInput)
{
  EXPECT_THROW(from_string<int>("abc"), std::runtime_error);
  EXPECT_THROW(from_string<int>("12abc"), std::runtime_error);
}

TEST(StringUtilTest, FromStringBool)
{
  EXPECT_TRUE(from_string<bool>("Yes"));
  EXPECT_TRUE(from_string<bool>("1"));
  EXPECT_FALSE(from_string<bool>("false"));
  EXPECT_THROW(from_string<bool>("maybe"), std::runtime_error);
}

TEST(StringUtilTest, FromStringConstructsFromStringView)
{
  EXPECT_EQ(from_string<std::string>("direct"), "direct");
  EXPECT_EQ(from_string<Tagged>("serial").tag, "serial");
}
