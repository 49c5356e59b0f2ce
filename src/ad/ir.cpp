#include "ir.hpp"
#include "common/string_util.hpp"

#include <fmt/core.h>

namespace fwdiff::ir
{

namespace
{

template <class... Ts> struct overloaded : Ts...
{
    using Ts::operator()...;
};

std::string render_body(std::vector<Statement> const& body, int indent)
{
  std::string result;
  for (auto const& s : body)
  {
    result += to_string(s, indent);
    result += '\n';
  }
  return result;
}

} // namespace

std::string to_string(Arg const& arg)
{
  return std::visit(overloaded{[](std::string const& var) { return var; },
                               [](double literal) { return fmt::format("{}", literal); }},
                    arg);
}

std::string to_string(Statement const& s, int indent)
{
  std::string pad(indent, ' ');
  return std::visit(overloaded{[&](Assign const& a) {
                                 std::vector<std::string> args;
                                 for (auto const& arg : a.args)
                                   args.push_back(to_string(arg));
                                 std::string callee = a.callee ? fmt::format(" [callee {}]", *a.callee) : "";
                                 return fmt::format("{}{} = {}({}){}", pad, a.lhs, a.op.name(), join(args, ", "),
                                                    callee);
                               },
                               [&](Return const& r) { return fmt::format("{}return {}", pad, r.var); },
                               [&](Branch const& b) {
                                 return fmt::format("{}if {}\n{}{}else\n{}{}end", pad, b.condition,
                                                    render_body(b.then_body, indent + 2), pad,
                                                    render_body(b.else_body, indent + 2), pad);
                               }},
                    s);
}

std::string to_string(FunctionDef const& def)
{
  return fmt::format("function {}({})\n{}", def.name, join(def.params, ", "), render_body(def.body, 2));
}

} // namespace fwdiff::ir
