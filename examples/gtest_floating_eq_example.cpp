#include "ad/ad.hpp"
#include "common/gtest.hpp"
#include <gtest/gtest.h>

#include <array>
#include <bit>
#include <cmath>
#include <cstdint>

using namespace fwdiff;

// Demonstrates EXPECT_FLOATING_EQ on derivatives computed by the two evaluation paths
TEST(FloatingEqExample, BothPathsAgreeToTheUlp)
{
  auto f = [](auto x) { return exp(x) * sin(x); };
  ir::FunctionDef def{"f",
                      {"x"},
                      {ir::assign("e", ops::exp, {"x"}), ir::assign("s", ops::sin, {"x"}),
                       ir::assign("y", ops::mul, {"e", "s"}), ir::ret("y")}};

  std::array<double, 1> x{0.75}, seed{1.0};
  Dual a = evaluate_with_tangent(f, Dual::variable(x[0]));
  Dual b = transform(def)(x, seed);

  EXPECT_FLOATING_EQ(a.tangent(), b.tangent(), 0); // identical rules, identical results
  EXPECT_FLOATING_EQ(a.value(), b.value());                                  // default tolerance of 4 ULPs
  EXPECT_NEAR(a.tangent(), std::exp(0.75) * (std::sin(0.75) + std::cos(0.75)), 1e-12);
}

TEST(FloatingEqExample, ExpectFailButContinue)
{
  double a = 1.0;
  double b = std::bit_cast<double>(std::bit_cast<std::uint64_t>(a) + 100);
  EXPECT_FLOATING_EQ(a, b, 1); // will fail, but test continues
  EXPECT_TRUE(true);           // still executes
}

TEST(FloatingEqExample, AssertFailStopsTest)
{
  double a = 1.0;
  double b = std::bit_cast<double>(std::bit_cast<std::uint64_t>(a) + 1000);

  // ASSERT_ will stop execution of this test immediately
  ASSERT_FLOATING_EQ(a, b, 1);
  // This line will never run
  EXPECT_TRUE(false);
}

// Standard GTest main
int main(int argc, char** argv)
{
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
