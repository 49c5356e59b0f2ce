#include "ad/ad.hpp"
#include <benchmark/benchmark.h>

#include <array>
#include <cmath>
#include <vector>

using namespace fwdiff;

namespace
{

auto const f = [](auto x, auto y) { return pow(x, 2) + sin(x + y); };

ir::FunctionDef f_statements()
{
  using namespace ir;
  return FunctionDef{"f",
                     {"x", "y"},
                     {assign("a", ops::pow, {"x", 2.0}), assign("b", ops::add, {"x", "y"}), assign("c", ops::sin, {"b"}),
                      assign("d", ops::add, {"a", "c"}), ret("d")}};
}

Dual chain(std::span<Dual const> x)
{
  Dual r = 0.0;
  for (std::size_t i = 0; i + 1 < x.size(); ++i)
  {
    r = r + x[i] * sin(x[i + 1]);
  }
  return r;
}

} // namespace

static void Baseline(benchmark::State& state)
{
  using std::sin;
  double x = 1.0, y = 2.0;
  for (auto _ : state)
  {
    double r = x * x + sin(x + y);
    benchmark::DoNotOptimize(r);
  }
}

BENCHMARK(Baseline);

static void Evaluator(benchmark::State& state)
{
  for (auto _ : state)
  {
    Dual r = evaluate_with_tangent(f, Dual::variable(1.0), Dual(2.0));
    benchmark::DoNotOptimize(r);
  }
}

BENCHMARK(Evaluator);

static void Transformed(benchmark::State& state)
{
  TransformedFunction g = transform(f_statements());
  std::array<double, 2> point{1.0, 2.0}, seed{1.0, 0.0};
  for (auto _ : state)
  {
    Dual r = g(point, seed);
    benchmark::DoNotOptimize(r);
  }
}

BENCHMARK(Transformed);

static void Transform(benchmark::State& state)
{
  ir::FunctionDef def = f_statements();
  for (auto _ : state)
  {
    TransformedFunction g = transform(def);
    benchmark::DoNotOptimize(g);
  }
}

BENCHMARK(Transform);

// --------------------- gradients, one pass per input ---------------------

static void GradientSerial(benchmark::State& state)
{
  std::vector<double> x(state.range(0), 0.5);
  for (auto _ : state)
  {
    auto g = gradient(chain, x, GradientExecution::serial);
    benchmark::DoNotOptimize(g);
  }
}

BENCHMARK(GradientSerial)->RangeMultiplier(4)->Range(4, 256);

static void GradientParallel(benchmark::State& state)
{
  std::vector<double> x(state.range(0), 0.5);
  for (auto _ : state)
  {
    auto g = gradient(chain, x, GradientExecution::parallel);
    benchmark::DoNotOptimize(g);
  }
}

BENCHMARK(GradientParallel)->RangeMultiplier(4)->Range(4, 256)->UseRealTime();

BENCHMARK_MAIN();
