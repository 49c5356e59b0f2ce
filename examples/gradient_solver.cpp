#include "ad/ad.hpp"
#include "common/trace.hpp"

#include <array>
#include <cmath>
#include <vector>

using namespace fwdiff;

// minimize a loss function of one variable by gradient descent
Dual loss_fn(Dual x) { return 0.5 * (x - 3.0) * sin(x - 4.5); }

double gradient_descent(double x_in)
{
  Dual loss = evaluate_with_tangent(loss_fn, Dual::variable(x_in));
  TRACE(x_in, loss.value(), loss.tangent());
  return x_in - loss.tangent() * 0.1;
}

double solve(double InitialValue)
{
  double x = InitialValue;
  for (int i = 0; i < 100; ++i)
  {
    x = gradient_descent(x);
  }
  return x;
}

// Rosenbrock function, minimized with the gradient driver
auto rosenbrock = [](auto x, auto y) { return pow(1.0 - x, 2) + 100.0 * pow(y - pow(x, 2), 2); };

std::array<double, 2> solve_rosenbrock(std::array<double, 2> p, int steps, double rate)
{
  for (int i = 0; i < steps; ++i)
  {
    std::vector<double> g = gradient(rosenbrock, p);
    p[0] -= rate * g[0];
    p[1] -= rate * g[1];
  }
  return p;
}

int main()
{
  auto x = solve(10.0);

  TRACE("finished");

  fmt::print("Solution is: {}\n", x);

  auto p = solve_rosenbrock({-1.2, 1.0}, 50000, 5e-4);
  auto vg = value_and_gradient(rosenbrock, p);
  fmt::print("Rosenbrock minimum near ({}, {}), f = {}, |grad| = {}\n", p[0], p[1], vg.value,
             std::hypot(vg.gradient[0], vg.gradient[1]));
}
