#include "ad/ad.hpp"
#include "common/trace.hpp"

#include <array>
#include <cmath>
#include <numbers>
#include <vector>

using namespace fwdiff;

// Normal log-density, log p(x | mu, sigma) = -(x - mu)^2 / (2 sigma^2) - log(sigma) - log(2 pi) / 2,
// differentiated with respect to its parameters on both evaluation paths.

Dual normal_log_density(Dual x, Dual mu, Dual sigma)
{
  Dual z = (x - mu) / sigma;
  return -0.5 * pow(z, 2) - log(sigma) - 0.5 * std::log(2.0 * std::numbers::pi);
}

ir::FunctionDef normal_log_density_statements()
{
  using namespace ir;
  return FunctionDef{"normal_lpdf",
                     {"x", "mu", "sigma"},
                     {assign("r", ops::sub, {"x", "mu"}), assign("z", ops::div, {"r", "sigma"}),
                      assign("z2", ops::pow, {"z", 2.0}), assign("q", ops::mul, {-0.5, "z2"}),
                      assign("ls", ops::log, {"sigma"}), assign("a", ops::sub, {"q", "ls"}),
                      assign("lp", ops::sub, {"a", 0.5 * std::log(2.0 * std::numbers::pi)}), ret("lp")}};
}

int main()
{
  std::array<double, 3> point{1.3, 0.5, 2.0};

  auto by_evaluator = value_and_gradient(normal_log_density, point);

  TransformedFunction lpdf = transform(normal_log_density_statements());
  fmt::print("{}\n", lpdf.source());
  auto by_transform = value_and_gradient(lpdf, point, GradientExecution::parallel);

  TRACE(by_evaluator.value, by_evaluator.gradient);
  TRACE(by_transform.value, by_transform.gradient);

  // closed forms: d/dmu = (x - mu) / sigma^2, d/dsigma = ((x - mu)^2 / sigma^2 - 1) / sigma
  double r = point[0] - point[1];
  double s = point[2];
  fmt::print("d/dmu    = {} (expected {})\n", by_transform.gradient[1], r / (s * s));
  fmt::print("d/dsigma = {} (expected {})\n", by_transform.gradient[2], (r * r / (s * s) - 1.0) / s);

  try
  {
    std::array<double, 3> degenerate{1.0, 0.0, 0.0};
    value_and_gradient(lpdf, degenerate);
  }
  catch (numerical_instability const& e)
  {
    fmt::print("sigma = 0 is rejected: {}\n", e.what());
  }
}
