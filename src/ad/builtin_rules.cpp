#include "ad_errors.hpp"
#include "registry.hpp"

#include <cmath>

namespace fwdiff
{

namespace
{

// (x, k) -> x^k for integer k. A nonzero tangent on the exponent contributes x^k ln(x) dk.
Dual pow_rule(double, std::span<double const> t, std::span<double const> v)
{
  double x = v[0];
  double k = v[1];
  if (std::trunc(k) != k)
  {
    throw unsupported_operation(ops::pow.name(), fmt::format("requires an integer exponent, but was given {}", k));
  }
  double value = std::pow(x, k);
  double dfdx = (k == 0.0) ? 0.0 : k * std::pow(x, k - 1.0);
  double tangent = dfdx * t[0];
  if (t[1] != 0.0) tangent += value * std::log(x) * t[1];
  return {value, tangent};
}

} // namespace

void register_builtin_rules(RuleRegistry& registry)
{
  registry.register_rule(ops::add, 2, [](double, std::span<double const> t, std::span<double const> v) {
    return Dual(v[0] + v[1], t[0] + t[1]);
  });

  registry.register_rule(ops::sub, 2, [](double, std::span<double const> t, std::span<double const> v) {
    return Dual(v[0] - v[1], t[0] - t[1]);
  });

  registry.register_rule(ops::mul, 2, [](double, std::span<double const> t, std::span<double const> v) {
    return Dual(v[0] * v[1], t[0] * v[1] + v[0] * t[1]);
  });

  registry.register_rule(ops::div, 2, [](double, std::span<double const> t, std::span<double const> v) {
    double q = v[0] / v[1];
    return Dual(q, (t[0] - q * t[1]) / v[1]);
  });

  registry.register_rule(ops::neg, 1,
                         [](double, std::span<double const> t, std::span<double const> v) { return Dual(-v[0], -t[0]); });

  registry.register_rule(ops::pow, 2, pow_rule);

  registry.register_rule(ops::sin, 1, [](double, std::span<double const> t, std::span<double const> v) {
    return Dual(std::sin(v[0]), std::cos(v[0]) * t[0]);
  });

  registry.register_rule(ops::cos, 1, [](double, std::span<double const> t, std::span<double const> v) {
    return Dual(std::cos(v[0]), -std::sin(v[0]) * t[0]);
  });

  registry.register_rule(ops::exp, 1, [](double, std::span<double const> t, std::span<double const> v) {
    double e = std::exp(v[0]);
    return Dual(e, e * t[0]);
  });

  registry.register_rule(ops::log, 1, [](double, std::span<double const> t, std::span<double const> v) {
    return Dual(std::log(v[0]), t[0] / v[0]);
  });
}

} // namespace fwdiff
