#include "common/terminal.hpp"

#include "gtest/gtest.h"

#include <cstdlib>
#include <optional>
#include <string>

using namespace terminal;

namespace
{

class EnvVarGuard {
  public:
    explicit EnvVarGuard(std::string name) : name_(std::move(name))
    {
      if (char const* value = std::getenv(name_.c_str()))
      {
        original_ = value;
      }
    }

    EnvVarGuard(EnvVarGuard const&) = delete;
    EnvVarGuard& operator=(EnvVarGuard const&) = delete;

    ~EnvVarGuard()
    {
      if (original_)
      {
        ::setenv(name_.c_str(), original_->c_str(), 1);
      }
      else
      {
        ::unsetenv(name_.c_str());
      }
    }

    void set(std::string const& value) const { ::setenv(name_.c_str(), value.c_str(), 1); }

    void unset() const { ::unsetenv(name_.c_str()); }

  private:
    std::string name_;
    std::optional<std::string> original_;
};

} // namespace

TEST(TerminalStyleTest, NamedColorOnly)
{
  TerminalStyle style("Red");
  EXPECT_EQ(style.to_string(), "\033[31m");
}

TEST(TerminalStyleTest, NamedColorWithAttribute)
{
  // attributes come before the colour
  TerminalStyle style("Red;Bold");
  EXPECT_EQ(style.to_string(), "\033[1;31m");
}

TEST(TerminalStyleTest, CaseInsensitiveNames)
{
  TerminalStyle style("lightcyan; UNDERLINE");
  EXPECT_EQ(style.to_string(), "\033[4;96m");
}

TEST(TerminalStyleTest, LoneAttribute)
{
  TerminalStyle style("Bold");
  EXPECT_EQ(style.to_string(), "\033[1m");
}

TEST(TerminalStyleTest, EmptyStyleIsPlain)
{
  TerminalStyle style("");
  EXPECT_TRUE(style.is_plain());
  EXPECT_EQ(style.to_string(), "");
  EXPECT_EQ(color_text("text", style), "text");
}

TEST(TerminalStyleTest, UnknownTokensAreIgnored)
{
  TerminalStyle style("Chartreuse;Blue");
  EXPECT_EQ(style.to_string(), "\033[34m");
}

TEST(TerminalStyleTest, ColorTextResetsAfterward)
{
  EXPECT_EQ(color_text("warn", TerminalStyle(Color::Yellow)), "\033[33mwarn\033[0m");
}

TEST(TerminalUtilsTest, GetenvOrDefaultIntReturnsConvertedValue)
{
  EnvVarGuard guard("FWDIFF_TEST_ENV_INT_VALUE");
  guard.set("42");

  EXPECT_EQ(getenv_or_default<int>("FWDIFF_TEST_ENV_INT_VALUE", 7), 42);
}

TEST(TerminalUtilsTest, GetenvOrDefaultIntFallsBackWhenMissing)
{
  EnvVarGuard guard("FWDIFF_TEST_ENV_INT_MISSING");
  guard.unset();

  EXPECT_EQ(getenv_or_default<int>("FWDIFF_TEST_ENV_INT_MISSING", 5), 5);
  EXPECT_FALSE(env_exists("FWDIFF_TEST_ENV_INT_MISSING"));
}

TEST(TerminalUtilsTest, GetenvOrDefaultIntIgnoresUnparsableInput)
{
  EnvVarGuard guard("FWDIFF_TEST_ENV_INT_BAD");
  guard.set("not-a-number");

  EXPECT_EQ(getenv_or_default<int>("FWDIFF_TEST_ENV_INT_BAD", 9), 9);
}

TEST(TerminalUtilsTest, GetenvOrDefaultString)
{
  EnvVarGuard guard("FWDIFF_TEST_ENV_STRING");
  guard.unset();
  EXPECT_STREQ(getenv_or_default("FWDIFF_TEST_ENV_STRING", "fallback"), "fallback");
  guard.set("value");
  EXPECT_STREQ(getenv_or_default("FWDIFF_TEST_ENV_STRING", "fallback"), "value");
}

TEST(TerminalUtilsTest, ColumnsFollowsEnvironment)
{
  EnvVarGuard guard("COLUMNS");
  guard.set("132");
  EXPECT_EQ(columns(), 132);
}

TEST(TerminalUtilsTest, ToggleParsesAffirmativeTokens)
{
  EXPECT_TRUE(toggle("yes", false));
  EXPECT_TRUE(toggle("true", false));
  EXPECT_TRUE(toggle("1", false));
}

TEST(TerminalUtilsTest, ToggleParsesNegativeTokens)
{
  EXPECT_FALSE(toggle("no", true));
  EXPECT_FALSE(toggle("false", true));
  EXPECT_FALSE(toggle("0", true));
}

TEST(TerminalUtilsTest, ToggleUsesDefaultForEmptyString)
{
  EXPECT_FALSE(toggle("", false));
  EXPECT_TRUE(toggle("", true));
}

TEST(TerminalUtilsTest, ToggleUsesDefaultForUnknownToken)
{
  EXPECT_TRUE(toggle("maybe", true));
  EXPECT_FALSE(toggle("maybe", false));
}
