#include "gradient.hpp"
#include "common/terminal.hpp"

#include <atomic>
#include <oneapi/tbb/parallel_for.h>

namespace fwdiff
{

namespace
{

std::atomic<GradientExecution::Enum>& default_execution()
{
  static std::atomic<GradientExecution::Enum> exec{
      terminal::getenv_or_default<GradientExecution>("FWDIFF_GRADIENT_EXECUTION", GradientExecution()).value()};
  return exec;
}

} // namespace

GradientExecution default_gradient_execution() { return default_execution().load(std::memory_order_relaxed); }

void set_default_gradient_execution(GradientExecution exec)
{
  TRACE_MODULE(GRADIENT, "setting default gradient execution", exec);
  default_execution().store(exec.value(), std::memory_order_relaxed);
}

namespace detail
{

ValueAndGradient seeded_passes(std::size_t n, std::function<Dual(std::size_t)> const& pass, GradientExecution exec)
{
  TRACE_MODULE(GRADIENT, "gradient", n, exec);

  if (n == 0) return {pass(0).value(), {}};

  ValueAndGradient result{0.0, std::vector<double>(n, 0.0)};
  auto run = [&](std::size_t i) {
    Dual r = pass(i);
    result.gradient[i] = r.tangent();
    if (i == 0) result.value = r.value();
  };

  if (exec == GradientExecution::parallel)
  {
    // the first exception thrown by any pass is rethrown here by oneTBB
    oneapi::tbb::parallel_for(std::size_t(0), n, run);
  }
  else
  {
    for (std::size_t i = 0; i < n; ++i)
    {
      run(i);
    }
  }
  return result;
}

} // namespace detail

ValueAndGradient value_and_gradient(TransformedFunction const& f, std::span<double const> point,
                                    GradientExecution exec)
{
  PRECONDITION_EQUAL(point.size(), f.arity(), f.name());
  return detail::seeded_passes(
      point.size(),
      [&f, point](std::size_t i) {
        std::vector<double> seed(point.size(), 0.0);
        if (i < seed.size()) seed[i] = 1.0;
        return f(point, seed);
      },
      exec);
}

Dual directional_derivative(TransformedFunction const& f, std::span<double const> point,
                            std::span<double const> direction)
{
  PRECONDITION_EQUAL(point.size(), direction.size(), f.name());
  return f(point, direction);
}

} // namespace fwdiff
