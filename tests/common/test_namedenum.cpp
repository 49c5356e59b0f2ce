#include "common/namedenum.hpp"
#include "gtest/gtest.h"

#include <array>
#include <fmt/core.h>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace
{
struct ExampleEnumTraits
{
    enum Enum
    {
      Alpha,
      Beta,
      Gamma
    };

    inline static constexpr Enum Default = Beta;
    inline static constexpr const char* StaticName = "example enumeration";
    inline static constexpr std::array<const char*, 3> Names = {"alpha", "beta", "gamma"};
};

using ExampleNamedEnumeration = NamedEnumeration<ExampleEnumTraits>;
} // namespace

TEST(NamedEnumerationTest, DefaultConstructionAndOperators)
{
  ExampleNamedEnumeration value;
  EXPECT_TRUE(value == ExampleEnumTraits::Default);

  ++value;
  EXPECT_TRUE(value == ExampleEnumTraits::Gamma);

  ExampleNamedEnumeration other(ExampleEnumTraits::Gamma);
  EXPECT_TRUE(value == other);
  EXPECT_EQ(value.value(), ExampleEnumTraits::Gamma);
}

TEST(NamedEnumerationTest, IteratesInDeclarationOrder)
{
  std::vector<std::string> names;
  for (auto e : ExampleNamedEnumeration())
  {
    names.push_back(e.Name());
  }
  EXPECT_EQ(names, (std::vector<std::string>{"alpha", "beta", "gamma"}));
  EXPECT_EQ(ExampleNamedEnumeration::size(), 3u);
}

TEST(NamedEnumerationTest, ListAndEnumerate)
{
  EXPECT_EQ(ExampleNamedEnumeration::ListAll(), "alpha, beta, gamma");

  std::vector<std::string> expected{"alpha", "beta", "gamma"};
  EXPECT_EQ(ExampleNamedEnumeration::EnumerateAll(), expected);
}

TEST(NamedEnumerationTest, CaseInsensitiveConstructionAndError)
{
  ExampleNamedEnumeration uppercase{"GAMMA"};
  EXPECT_TRUE(uppercase == ExampleEnumTraits::Gamma);

  ExampleNamedEnumeration padded{"  alpha "};
  EXPECT_TRUE(padded == ExampleEnumTraits::Alpha);

  try
  {
    [[maybe_unused]] ExampleNamedEnumeration invalid{"unknown"};
    FAIL() << "Expected runtime_error when constructing with invalid name";
  }
  catch (const std::runtime_error& err)
  {
    std::string_view msg{err.what()};
    EXPECT_NE(msg.find("Unknown initializer 'unknown' for example enumeration"), std::string_view::npos) << msg;
    EXPECT_NE(msg.find("alpha, beta, gamma"), std::string_view::npos) << msg;
  }
}

TEST(NamedEnumerationTest, FormatterUsesFriendlyName)
{
  ExampleNamedEnumeration value{ExampleEnumTraits::Alpha};
  EXPECT_EQ(fmt::format("{}", value), "alpha");
}
