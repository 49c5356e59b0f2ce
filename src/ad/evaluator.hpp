#pragma once

/// \file evaluator.hpp
/// \brief Forward-mode evaluation by operator overloading.
///
/// Arithmetic on Dual operands is dispatched, one elementary operation at a time, to the rules
/// of the process-wide registry (see registry.hpp). A function written generically, eg
/// \code
/// auto f = [](auto x, auto y) { return pow(x, 2) + sin(x + y); };
/// Dual r = evaluate_with_tangent(f, Dual::variable(1.0), Dual(2.0));
/// // r.value() == f(1, 2), r.tangent() == df/dx at (1, 2)
/// \endcode
/// computes its value together with its directional derivative along the seeded input.
/// Each call evaluates the function once; a full gradient with respect to n inputs takes n calls
/// (see gradient.hpp).

#include "ad_errors.hpp"
#include "common/demangle.hpp"
#include "dual.hpp"
#include "registry.hpp"

#include <concepts>
#include <functional>
#include <initializer_list>
#include <span>
#include <type_traits>

namespace fwdiff
{

namespace detail
{

inline Dual dispatch(OpId const& op, std::initializer_list<Dual> operands, double callee_tangent = 0.0)
{
  return global_registry().apply(op, std::span(operands.begin(), operands.size()), callee_tangent);
}

} // namespace detail

inline Dual operator+(Dual const& a, Dual const& b) { return detail::dispatch(ops::add, {a, b}); }
inline Dual operator-(Dual const& a, Dual const& b) { return detail::dispatch(ops::sub, {a, b}); }
inline Dual operator*(Dual const& a, Dual const& b) { return detail::dispatch(ops::mul, {a, b}); }
inline Dual operator/(Dual const& a, Dual const& b) { return detail::dispatch(ops::div, {a, b}); }
inline Dual operator-(Dual const& a) { return detail::dispatch(ops::neg, {a}); }

// A scalar exponent is forwarded unchanged; the pow rule rejects a non-integral one.
template <std::integral I> Dual pow(Dual const& x, I k)
{
  return detail::dispatch(ops::pow, {x, Dual(static_cast<double>(k))});
}
inline Dual pow(Dual const& x, double k) { return detail::dispatch(ops::pow, {x, Dual(k)}); }
inline Dual pow(Dual const& x, Dual const& k) { return detail::dispatch(ops::pow, {x, k}); }

inline Dual sin(Dual const& x) { return detail::dispatch(ops::sin, {x}); }
inline Dual cos(Dual const& x) { return detail::dispatch(ops::cos, {x}); }
inline Dual exp(Dual const& x) { return detail::dispatch(ops::exp, {x}); }
inline Dual log(Dual const& x) { return detail::dispatch(ops::log, {x}); }

/// \brief Apply an arbitrary registered operation to Dual operands.
///
/// This is how a function reaches an operation that has no operator or named overload, in
/// particular one that was added with register_rule().
template <typename... Operands>
  requires(std::convertible_to<Operands const&, Dual> && ...)
Dual call(OpId const& op, Operands const&... operands)
{
  return detail::dispatch(op, {Dual(operands)...});
}

/// \brief Apply a parameterized operation, passing the tangent of the callee's own state.
template <typename... Operands>
  requires(std::convertible_to<Operands const&, Dual> && ...)
Dual call_with_state(OpId const& op, double callee_tangent, Operands const&... operands)
{
  return detail::dispatch(op, {Dual(operands)...}, callee_tangent);
}

namespace detail
{

template <typename F, typename... Args> Dual checked_invoke(F& f, Args&&... args)
{
  using FunctionType = std::remove_cvref_t<F>;
  if constexpr (!std::is_invocable_v<F&, Args...>)
  {
    throw incompatible_function_signature(demangle::type_name<FunctionType>(),
                                          "cannot be called with Dual operands; its parameters must accept Dual");
  }
  else if constexpr (!std::same_as<std::remove_cvref_t<std::invoke_result_t<F&, Args...>>, Dual>)
  {
    throw incompatible_function_signature(demangle::type_name<FunctionType>(), "does not return a Dual");
  }
  else
  {
    Dual result = std::invoke(f, std::forward<Args>(args)...);
    check_finite("result of " + demangle::type_name<FunctionType>(), result);
    return result;
  }
}

} // namespace detail

/// \brief Evaluate f over Dual operands, returning its value and directional derivative.
/// \throws incompatible_function_signature if f cannot take Dual operands or does not return a Dual
/// \throws unsupported_operation if f uses an operation with no registered rule
/// \throws numerical_instability if any intermediate or final result is not finite
template <typename F, typename... Args>
  requires(std::same_as<std::remove_cvref_t<Args>, Dual> && ...)
Dual evaluate_with_tangent(F&& f, Args const&... inputs)
{
  return detail::checked_invoke(f, inputs...);
}

/// \brief Evaluate a function that takes its operands as a span of Duals.
template <typename F> Dual evaluate_with_tangent(F&& f, std::span<Dual const> inputs)
{
  return detail::checked_invoke(f, inputs);
}

} // namespace fwdiff
