#include "ad/ad.hpp"
#include "common/trace.hpp"

#include <string>
#include <vector>

int add(int a, int b) { return a + b; }

int main()
{
  int foo = 42;
  std::string bar = "example";
  std::vector<int> vec(5, 0);
  std::vector<double> tangents{1.0, 0.25, -3.5};

  // A simple trace of variables.
  TRACE(foo, bar, vec);

  // A trace with a literal string as the first parameter.
  TRACE("Literal string", foo, bar);

  // A trace with expressions.
  TRACE(foo + 1, bar + "_suffix", std::vector<int, std::allocator<int>>{1, 2, 3});

  // A trace with a function call and an expression involving a literal.
  TRACE(add(foo, 3), "Result: " + std::to_string(add(foo, 3)));

  // Duals and operation identifiers format themselves
  fwdiff::Dual x = fwdiff::Dual::variable(0.5);
  TRACE(x, fwdiff::ops::sin, sin(x));

  // change the precision
  trace::get_formatting_options().fp_precision = 4;
  TRACE("Modified number of digits displayed", tangents, cos(x));

  DEBUG_TRACE("Only in debug builds", tangents);

  // per-module tracing is compiled in with -DFWDIFF_TRACE_TRANSFORM=ON
  using namespace fwdiff::ir;
  FunctionDef def{"g", {"x"}, {assign("y", fwdiff::ops::exp, {"x"}), ret("y")}};
  auto g = fwdiff::transform(def);
  TRACE(g.name(), g.tangent_parameters());

  return 0;
}
