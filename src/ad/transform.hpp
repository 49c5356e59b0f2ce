#pragma once

/// \file transform.hpp
/// \brief Source-to-source forward-mode transformation of straight-line functions.
///
/// transform() rewrites a function definition (see ir.hpp) into a TransformedFunction that
/// propagates a tangent alongside every value:
///   - each parameter `v` gains a tangent parameter `dv`;
///   - each `lhs = op(args)` becomes a step computing both `lhs` and `dlhs` with the rule for `op`;
///   - `return var` becomes `return (var, dvar)`.
///
/// Rules are resolved once, at transform time, so calling the result performs no dispatch.
/// The result owns copies of its rules and has no reference back to the definition or the
/// registry it was built from.

#include "dual.hpp"
#include "ir.hpp"
#include "registry.hpp"
#include "rule.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace fwdiff
{

class TransformedFunction {
  public:
    std::string const& name() const { return name_; }

    /// \brief The primal parameters, in order.
    std::vector<std::string> const& parameters() const { return params_; }

    /// \brief The synthesized tangent parameters, paired with parameters().
    std::vector<std::string> const& tangent_parameters() const { return tangent_params_; }

    std::size_t arity() const { return params_.size(); }

    /// \brief Evaluate at `values`, propagating the tangent seeds `seeds`.
    /// \pre values.size() == arity() and seeds.size() == arity()
    /// \throws numerical_instability if any produced value or tangent is not finite
    Dual operator()(std::span<double const> values, std::span<double const> seeds) const;

    /// \brief The tangent-propagating function as readable source text.
    std::string source() const;

  private:
    friend TransformedFunction transform(ir::FunctionDef const& def, RuleRegistry const& registry);

    struct Step
    {
        Rule rule;
        std::vector<std::size_t> args;
        std::optional<std::size_t> callee;
        std::size_t out;
    };

    TransformedFunction() = default;

    std::size_t add_slot(std::string name, double initial, bool literal);

    std::string name_;
    std::vector<std::string> params_;
    std::vector<std::string> tangent_params_;

    // Slot layout: the parameters, then literals and assignment results in statement order.
    std::vector<std::string> slot_names_;
    std::vector<double> initial_values_;
    std::vector<bool> is_literal_;
    std::vector<Step> steps_;
    std::size_t result_ = 0;
};

/// \brief Rewrite a function definition into a tangent-propagating function.
/// \throws unsupported_expression if the definition contains a statement that cannot be rewritten:
///         a branch, an operation without a rule, an arity mismatch, an unbound or rebound variable,
///         or a missing or non-terminal return.
TransformedFunction transform(ir::FunctionDef const& def, RuleRegistry const& registry);

/// \brief Rewrite a function definition using the process-wide registry.
inline TransformedFunction transform(ir::FunctionDef const& def) { return transform(def, global_registry()); }

} // namespace fwdiff
