#include "ad/ad_errors.hpp"
#include "ad/evaluator.hpp"
#include <gtest/gtest.h>

#include <cmath>
#include <vector>

using namespace fwdiff;

TEST(Evaluator, Arithmetic)
{
  Dual x = Dual::variable(3.0);
  Dual y(2.0);

  EXPECT_EQ(x + y, Dual(5.0, 1.0));
  EXPECT_EQ(x - y, Dual(1.0, 1.0));
  EXPECT_EQ(x * y, Dual(6.0, 2.0));
  EXPECT_EQ(y - x, Dual(-1.0, -1.0));
  EXPECT_EQ(-x, Dual(-3.0, -1.0));

  // d/dx (2/x) = -2/x^2
  Dual q = y / x;
  EXPECT_DOUBLE_EQ(q.value(), 2.0 / 3.0);
  EXPECT_DOUBLE_EQ(q.tangent(), -2.0 / 9.0);
}

TEST(Evaluator, MixedScalarOperands)
{
  Dual x = Dual::variable(3.0);
  EXPECT_EQ(x * 2.0, Dual(6.0, 2.0));
  EXPECT_EQ(2.0 * x, Dual(6.0, 2.0));
  EXPECT_EQ(1.0 + x, Dual(4.0, 1.0));
  EXPECT_EQ(x - 1.0, Dual(2.0, 1.0));
}

TEST(Evaluator, ProductRule)
{
  Dual x = Dual::variable(1.5);
  Dual r = x * sin(x);
  EXPECT_DOUBLE_EQ(r.value(), 1.5 * std::sin(1.5));
  EXPECT_DOUBLE_EQ(r.tangent(), std::sin(1.5) + 1.5 * std::cos(1.5));
}

TEST(Evaluator, ElementaryFunctions)
{
  double v = 0.7;
  Dual x = Dual::variable(v);

  EXPECT_EQ(sin(x), Dual(std::sin(v), std::cos(v)));
  EXPECT_EQ(cos(x), Dual(std::cos(v), -std::sin(v)));
  EXPECT_EQ(exp(x), Dual(std::exp(v), std::exp(v)));
  EXPECT_EQ(log(x), Dual(std::log(v), 1.0 / v));
}

TEST(Evaluator, IntegerPower)
{
  Dual x = Dual::variable(2.0);
  EXPECT_EQ(pow(x, 3), Dual(8.0, 12.0));
  EXPECT_EQ(pow(x, 1), Dual(2.0, 1.0));
  EXPECT_EQ(pow(x, 0), Dual(1.0, 0.0));

  Dual r = pow(x, -2);
  EXPECT_DOUBLE_EQ(r.value(), 0.25);
  EXPECT_DOUBLE_EQ(r.tangent(), -0.25);
}

TEST(Evaluator, NonIntegerPowerIsUnsupported)
{
  Dual x = Dual::variable(2.0);
  EXPECT_THROW(pow(x, Dual(0.5)), unsupported_operation);
}

TEST(Evaluator, ScalarExponentIsNotTruncated)
{
  Dual x = Dual::variable(4.0);
  EXPECT_THROW(pow(x, 2.5), unsupported_operation);
  EXPECT_THROW(pow(x, 2.5f), unsupported_operation);

  auto f = [](auto x) { return pow(x, 2.5); };
  EXPECT_THROW(evaluate_with_tangent(f, x), unsupported_operation);

  Dual r = pow(x, 3.0);
  EXPECT_DOUBLE_EQ(r.value(), 64.0);
  EXPECT_DOUBLE_EQ(r.tangent(), 48.0);

  Dual s = pow(x, 2L);
  EXPECT_DOUBLE_EQ(s.value(), 16.0);
  EXPECT_DOUBLE_EQ(s.tangent(), 8.0);

  // an exponent beyond the range of int
  Dual one = pow(Dual::variable(1.0), 1e10);
  EXPECT_DOUBLE_EQ(one.value(), 1.0);
  EXPECT_DOUBLE_EQ(one.tangent(), 1e10);
}

TEST(Evaluator, EvaluateWithTangent)
{
  auto f = [](auto x, auto y) { return pow(x, 2) + sin(x + y); };

  Dual dx = evaluate_with_tangent(f, Dual::variable(1.0), Dual(2.0));
  EXPECT_DOUBLE_EQ(dx.value(), 1.0 + std::sin(3.0));
  EXPECT_DOUBLE_EQ(dx.tangent(), 2.0 + std::cos(3.0));

  Dual dy = evaluate_with_tangent(f, Dual(1.0), Dual::variable(2.0));
  EXPECT_DOUBLE_EQ(dy.tangent(), std::cos(3.0));
}

TEST(Evaluator, ZeroSeedGivesZeroTangent)
{
  auto f = [](Dual const& x, Dual const& y) { return exp(x) * y - cos(y); };
  Dual r = evaluate_with_tangent(f, Dual(0.3), Dual(1.2));
  EXPECT_EQ(r.tangent(), 0.0);
}

TEST(Evaluator, SpanFunction)
{
  auto f = [](std::span<Dual const> x) { return x[0] * x[1] * x[2]; };
  std::vector<Dual> x{Dual(2.0), Dual::variable(3.0), Dual(4.0)};
  EXPECT_EQ(evaluate_with_tangent(f, std::span<Dual const>(x)), Dual(24.0, 8.0));
}

TEST(Evaluator, IncompatibleSignature)
{
  auto scalar_only = [](double x) { return x * x; };
  EXPECT_THROW(evaluate_with_tangent(scalar_only, Dual::variable(1.0)), incompatible_function_signature);

  auto wrong_arity = [](Dual const& x, Dual const& y) { return x + y; };
  EXPECT_THROW(evaluate_with_tangent(wrong_arity, Dual::variable(1.0)), incompatible_function_signature);
}

TEST(Evaluator, ResultMustBeDual)
{
  auto value_only = [](Dual const& x) { return x.value(); };
  try
  {
    evaluate_with_tangent(value_only, Dual::variable(1.0));
    FAIL() << "a function returning a scalar should be rejected";
  }
  catch (incompatible_function_signature const& e)
  {
    EXPECT_NE(std::string(e.what()).find("does not return a Dual"), std::string::npos) << e.what();
  }
}

TEST(Evaluator, NumericalInstability)
{
  EXPECT_THROW(log(Dual::variable(0.0)), numerical_instability);
  EXPECT_THROW(Dual::variable(1.0) / Dual(0.0), numerical_instability);
  EXPECT_THROW(exp(Dual::variable(1000.0)), numerical_instability);

  auto f = [](Dual const& x) { return log(x - 1.0); };
  try
  {
    evaluate_with_tangent(f, Dual::variable(1.0));
    FAIL() << "log(0) should be reported as unstable";
  }
  catch (numerical_instability const& e)
  {
    EXPECT_EQ(e.operation(), "log");
  }
}

TEST(Evaluator, UnregisteredOperation)
{
  try
  {
    call(OpId("tanh"), Dual::variable(0.5));
    FAIL() << "an operation without a rule should be rejected";
  }
  catch (unsupported_operation const& e)
  {
    EXPECT_EQ(e.operation(), "tanh");
  }
}

TEST(Evaluator, CallRegisteredOperation)
{
  RuleRegistry registry;
  register_builtin_rules(registry);
  registry.register_rule(OpId("square"), 1, [](double, std::span<double const> t, std::span<double const> v) {
    return Dual(v[0] * v[0], 2.0 * v[0] * t[0]);
  });
  ScopedRuleRegistry scope(registry);

  EXPECT_EQ(call(OpId("square"), Dual::variable(3.0)), Dual(9.0, 6.0));
  EXPECT_EQ(call(ops::add, Dual::variable(1.0), 2.0), Dual(3.0, 1.0));
}

TEST(Evaluator, CallWithState)
{
  RuleRegistry registry;
  registry.register_rule(OpId("drift"), 1, [](double callee, std::span<double const> t, std::span<double const> v) {
    return Dual(v[0], t[0] + callee);
  });
  ScopedRuleRegistry scope(registry);

  EXPECT_EQ(call_with_state(OpId("drift"), 2.0, Dual(1.0, 0.5)), Dual(1.0, 2.5));
  EXPECT_EQ(call(OpId("drift"), Dual(1.0, 0.5)), Dual(1.0, 0.5));
}
