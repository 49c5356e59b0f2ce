#include "transform.hpp"
#include "ad_errors.hpp"
#include "common/string_util.hpp"
#include "common/trace.hpp"

#include <fmt/core.h>
#include <unordered_map>
#include <variant>

namespace fwdiff
{

namespace
{

std::string tangent_name(std::string const& var) { return "d" + var; }

} // namespace

Dual TransformedFunction::operator()(std::span<double const> values, std::span<double const> seeds) const
{
  PRECONDITION_EQUAL(values.size(), this->arity(), name_);
  PRECONDITION_EQUAL(seeds.size(), this->arity(), name_);

  std::vector<double> v = initial_values_;
  std::vector<double> t(v.size(), 0.0);
  for (std::size_t i = 0; i < values.size(); ++i)
  {
    v[i] = values[i];
    t[i] = seeds[i];
  }

  std::vector<double> arg_values, arg_tangents;
  for (Step const& step : steps_)
  {
    arg_values.clear();
    arg_tangents.clear();
    for (std::size_t slot : step.args)
    {
      arg_values.push_back(v[slot]);
      arg_tangents.push_back(t[slot]);
    }
    double callee_tangent = step.callee ? t[*step.callee] : 0.0;
    Dual out = step.rule.apply(callee_tangent, arg_tangents, arg_values);
    DEBUG_TRACE_MODULE(TRANSFORM, name_, step.rule.op(), arg_values, arg_tangents, out);
    v[step.out] = out.value();
    t[step.out] = out.tangent();
  }

  Dual result(v[result_], t[result_]);
  check_finite(name_, result);
  return result;
}

std::string TransformedFunction::source() const
{
  auto tangent_of = [this](std::size_t slot) {
    return is_literal_[slot] ? std::string("0") : tangent_name(slot_names_[slot]);
  };

  std::vector<std::string> signature = params_;
  signature.insert(signature.end(), tangent_params_.begin(), tangent_params_.end());

  std::string result = fmt::format("function {}_fwd({})\n", name_, join(signature, ", "));
  for (Step const& step : steps_)
  {
    std::vector<std::string> args, tangents;
    for (std::size_t slot : step.args)
    {
      args.push_back(slot_names_[slot]);
      tangents.push_back(tangent_of(slot));
    }
    std::string callee = step.callee ? fmt::format("[{}]", tangent_of(*step.callee)) : "";
    result += fmt::format("  {}, {} = {}{}({}; {})\n", slot_names_[step.out], tangent_of(step.out), step.rule.op(),
                          callee, join(args, ", "), join(tangents, ", "));
  }
  result += fmt::format("  return ({}, {})\n", slot_names_[result_], tangent_of(result_));
  return result;
}

std::size_t TransformedFunction::add_slot(std::string name, double initial, bool literal)
{
  slot_names_.push_back(std::move(name));
  initial_values_.push_back(initial);
  is_literal_.push_back(literal);
  return slot_names_.size() - 1;
}

TransformedFunction transform(ir::FunctionDef const& def, RuleRegistry const& registry)
{
  TransformedFunction f;
  f.name_ = def.name;
  f.params_ = def.params;

  std::unordered_map<std::string, std::size_t> bound;
  for (std::string const& p : def.params)
  {
    if (bound.contains(p))
    {
      throw unsupported_expression(fmt::format("function '{}' declares parameter '{}' more than once", def.name, p));
    }
    bound.emplace(p, f.add_slot(p, 0.0, false));
    f.tangent_params_.push_back(tangent_name(p));
  }

  auto bound_slot = [&](std::string const& var, std::string const& context) {
    auto it = bound.find(var);
    if (it == bound.end())
    {
      throw unsupported_expression(
          fmt::format("in function '{}', {} refers to unbound variable '{}'", def.name, context, var));
    }
    return it->second;
  };

  bool returned = false;
  for (std::size_t i = 0; i < def.body.size(); ++i)
  {
    if (returned)
    {
      throw unsupported_expression(
          fmt::format("in function '{}', statement {} follows the return statement", def.name, i));
    }

    if (auto const* b = std::get_if<ir::Branch>(&def.body[i]))
    {
      throw unsupported_expression(fmt::format("in function '{}', the branch on '{}' cannot be differentiated; only "
                                               "straight-line code can be transformed",
                                               def.name, b->condition));
    }

    if (auto const* r = std::get_if<ir::Return>(&def.body[i]))
    {
      f.result_ = bound_slot(r->var, "the return statement");
      returned = true;
      continue;
    }

    ir::Assign const& a = std::get<ir::Assign>(def.body[i]);
    if (!registry.contains(a.op))
    {
      throw unsupported_expression(
          fmt::format("in function '{}', operation '{}' has no differentiation rule", def.name, a.op), a.op.name());
    }
    Rule const& rule = registry.lookup(a.op);
    if (rule.arity() != a.args.size())
    {
      throw unsupported_expression(fmt::format("in function '{}', operation '{}' expects {} operand(s) but is given {}",
                                               def.name, a.op, rule.arity(), a.args.size()),
                                   a.op.name());
    }

    std::vector<std::size_t> args;
    for (ir::Arg const& arg : a.args)
    {
      if (auto const* var = std::get_if<std::string>(&arg))
        args.push_back(bound_slot(*var, fmt::format("the assignment to '{}'", a.lhs)));
      else
        args.push_back(f.add_slot(ir::to_string(arg), std::get<double>(arg), true));
    }

    std::optional<std::size_t> callee;
    if (a.callee) callee = bound_slot(*a.callee, fmt::format("the callee of '{}'", a.lhs));

    if (bound.contains(a.lhs))
    {
      throw unsupported_expression(
          fmt::format("in function '{}', variable '{}' is assigned more than once", def.name, a.lhs));
    }
    std::size_t out = f.add_slot(a.lhs, 0.0, false);
    bound.emplace(a.lhs, out);

    TRACE_MODULE(TRANSFORM, "emitting step", def.name, a.lhs, a.op, args, out);
    f.steps_.push_back(TransformedFunction::Step{rule, std::move(args), callee, out});
  }

  if (!returned)
  {
    throw unsupported_expression(fmt::format("function '{}' has no return statement", def.name));
  }

  // the rendered tangent of each variable must not name another variable
  for (auto const& entry : bound)
  {
    if (bound.contains(tangent_name(entry.first)))
    {
      throw unsupported_expression(fmt::format("in function '{}', variable '{}' clashes with the tangent of '{}'",
                                               def.name, tangent_name(entry.first), entry.first));
    }
  }

  TRACE_MODULE(TRANSFORM, "transformed function", def.name, f.steps_.size(), f.slot_names_.size());
  return f;
}

} // namespace fwdiff
