#include "rule.hpp"
#include "ad_errors.hpp"
#include "common/trace.hpp"

#include <array>
#include <cmath>
#include <vector>

namespace fwdiff
{

Rule::Rule(OpId op, std::size_t arity, RuleFunction compute)
    : op_(std::move(op)), arity_(arity), compute_(std::move(compute))
{
  PRECONDITION(!op_.empty(), "an operation identifier must have a name");
  PRECONDITION(compute_, "a rule needs a compute function", op_);
}

Dual Rule::apply(double callee_tangent, std::span<double const> tangents, std::span<double const> values) const
{
  if (tangents.size() != arity_ || values.size() != arity_)
  {
    throw unsupported_operation(op_.name(), fmt::format("expects {} operand(s), but was given {}", arity_,
                                                        values.size()));
  }
  Dual result = compute_(callee_tangent, tangents, values);
  check_finite(op_.name(), result);
  return result;
}

Dual Rule::apply(std::span<Dual const> operands, double callee_tangent) const
{
  // most operations are unary or binary; avoid the allocation for those
  constexpr std::size_t SmallArity = 4;
  if (operands.size() <= SmallArity)
  {
    std::array<double, SmallArity> tangents{}, values{};
    for (std::size_t i = 0; i < operands.size(); ++i)
    {
      tangents[i] = operands[i].tangent();
      values[i] = operands[i].value();
    }
    return this->apply(callee_tangent, std::span(tangents.data(), operands.size()),
                       std::span(values.data(), operands.size()));
  }

  std::vector<double> tangents, values;
  tangents.reserve(operands.size());
  values.reserve(operands.size());
  for (Dual const& x : operands)
  {
    tangents.push_back(x.tangent());
    values.push_back(x.value());
  }
  return this->apply(callee_tangent, tangents, values);
}

void check_finite(std::string const& source, Dual x)
{
  if (!std::isfinite(x.value()) || !std::isfinite(x.tangent()))
  {
    throw numerical_instability(source, x.value(), x.tangent());
  }
}

} // namespace fwdiff
