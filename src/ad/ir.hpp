#pragma once

/// \file ir.hpp
/// \brief Statement-list representation of a straight-line function, the input of the transformer.
///
/// A function is a list of parameters and a body of statements in static single-assignment
/// form:
/// \code
/// function f(x, y)
///   a = pow(x, 2)
///   b = add(x, y)
///   c = sin(b)
///   d = add(a, c)
///   return d
/// \endcode
/// The operands of an assignment are variables bound earlier (or parameters) and numeric
/// literals. Branch statements can be represented, but are rejected by the transformer.

#include "op.hpp"
#include <initializer_list>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace fwdiff::ir
{

/// \brief An operand: the name of a bound variable, or a numeric literal (a constant with zero tangent).
using Arg = std::variant<std::string, double>;

/// \brief `lhs = op(args...)`, optionally passing the tangent of the variable `callee` as the callee tangent.
struct Assign
{
    std::string lhs;
    OpId op;
    std::vector<Arg> args;
    std::optional<std::string> callee;
};

/// \brief The terminal `return var`.
struct Return
{
    std::string var;
};

struct Branch;

using Statement = std::variant<Assign, Return, Branch>;

/// \brief `if condition then ... else ...`; representable, but not differentiable.
struct Branch
{
    std::string condition;
    std::vector<Statement> then_body;
    std::vector<Statement> else_body;
};

struct FunctionDef
{
    std::string name;
    std::vector<std::string> params;
    std::vector<Statement> body;
};

inline Statement assign(std::string lhs, OpId op, std::initializer_list<Arg> args)
{
  return Assign{std::move(lhs), std::move(op), std::vector<Arg>(args), std::nullopt};
}

inline Statement assign_with_callee(std::string lhs, OpId op, std::string callee, std::initializer_list<Arg> args)
{
  return Assign{std::move(lhs), std::move(op), std::vector<Arg>(args), std::move(callee)};
}

inline Statement ret(std::string var) { return Return{std::move(var)}; }

inline Statement branch(std::string condition, std::vector<Statement> then_body, std::vector<Statement> else_body)
{
  return Branch{std::move(condition), std::move(then_body), std::move(else_body)};
}

/// \brief Render an operand as source text.
std::string to_string(Arg const& arg);

/// \brief Render a statement as source text, indented by `indent` spaces.
std::string to_string(Statement const& s, int indent = 0);

/// \brief Render a function definition as source text.
std::string to_string(FunctionDef const& def);

} // namespace fwdiff::ir
