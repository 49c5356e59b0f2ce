#pragma once

/// \file rule.hpp
/// \brief Differentiation rules: the derivative formula of one elementary operation.

#include "dual.hpp"
#include "op.hpp"
#include <cstddef>
#include <functional>
#include <span>
#include <string>

namespace fwdiff
{

/// \brief Signature of a rule's compute function.
///
/// `compute(callee_tangent, tangents, values)` receives the tangent of the callee and the tangents
/// and values of the operands (both spans have length `arity`), and returns the output value and
/// tangent. For stateless elementary functions the callee tangent is 0 and can be ignored; it is
/// nonzero only for parameterized callables whose internal state is itself being differentiated.
///
/// A compute function must be pure: no hidden state and no I/O.
using RuleFunction =
    std::function<Dual(double callee_tangent, std::span<double const> tangents, std::span<double const> values)>;

/// \brief A differentiation rule: the arity of an operation and its compute function.
class Rule {
  public:
    Rule(OpId op, std::size_t arity, RuleFunction compute);

    OpId const& op() const { return op_; }

    std::size_t arity() const { return arity_; }

    /// \brief Apply the rule to operands given as separate tangent and value spans.
    /// \throws unsupported_operation if the number of operands does not match the arity
    /// \throws numerical_instability if the output value or tangent is not finite
    Dual apply(double callee_tangent, std::span<double const> tangents, std::span<double const> values) const;

    /// \brief Apply the rule to Dual operands.
    Dual apply(std::span<Dual const> operands, double callee_tangent = 0.0) const;

  private:
    OpId op_;
    std::size_t arity_;
    RuleFunction compute_;
};

/// \brief Throws numerical_instability if x has a non-finite value or tangent.
/// \param source The operation or function reported in the error.
void check_finite(std::string const& source, Dual x);

} // namespace fwdiff
