#pragma once

/// \file gradient.hpp
/// \brief Gradients by one-hot seeding.
///
/// The gradient of a scalar function of n inputs is assembled from n forward passes: pass i
/// seeds input i with tangent 1 and every other input with 0, and the output tangent of that
/// pass is the i-th partial derivative. The passes are independent, and can be run one after
/// another or concurrently with oneTBB (see GradientExecution).
///
/// Three kinds of function are accepted:
///   - a TransformedFunction (see transform.hpp);
///   - a callable taking `std::span<Dual const>`, evaluated by operator overloading;
///   - with a `std::array<double, N>` point, a callable taking N Dual operands (a callable that
///     cannot take N Duals is passed the point as a span instead).
///
/// Errors raised by any pass propagate unchanged.

#include "dual.hpp"
#include "evaluator.hpp"
#include "transform.hpp"
#include "common/namedenum.hpp"
#include "common/trace.hpp"

#include <array>
#include <concepts>
#include <cstddef>
#include <functional>
#include <span>
#include <type_traits>
#include <utility>
#include <vector>

namespace fwdiff
{

struct GradientExecutionTraits
{
    enum Enum
    {
      serial,
      parallel
    };
    static constexpr Enum Default = serial;
    static constexpr char const* StaticName = "gradient execution policy";
    static constexpr std::array<char const*, 2> Names = {"serial", "parallel"};
};

/// \brief How the seeded passes of a gradient are run: one after another, or concurrently.
using GradientExecution = NamedEnumeration<GradientExecutionTraits>;

/// \brief The policy used when none is given. Initially read from FWDIFF_GRADIENT_EXECUTION.
GradientExecution default_gradient_execution();

void set_default_gradient_execution(GradientExecution exec);

struct ValueAndGradient
{
    double value;
    std::vector<double> gradient;
};

namespace detail
{

/// \brief Run pass(i) for i in [0, n), where pass i seeds input i, and collect the tangents.
/// The value is taken from pass 0. If n == 0 a single pass with no seed gives the value.
ValueAndGradient seeded_passes(std::size_t n, std::function<Dual(std::size_t)> const& pass, GradientExecution exec);

/// \brief Duals at `point`, with tangent 1 at index `seed` and 0 elsewhere.
inline std::vector<Dual> seeded_point(std::span<double const> point, std::size_t seed)
{
  std::vector<Dual> x;
  x.reserve(point.size());
  for (std::size_t j = 0; j < point.size(); ++j)
  {
    x.emplace_back(point[j], j == seed ? 1.0 : 0.0);
  }
  return x;
}

template <typename F>
concept SpanCallable = !std::same_as<std::remove_cvref_t<F>, TransformedFunction>;

template <typename F, typename Seq> struct invocable_with_duals;

template <typename F, std::size_t... I> struct invocable_with_duals<F, std::index_sequence<I...>>
{
    template <std::size_t> using dual_t = Dual;
    static constexpr bool value = std::is_invocable_v<F&, dual_t<I>...>;
};

/// \brief True if f can be called with N separate Dual operands.
template <typename F, std::size_t N>
inline constexpr bool FixedArityCallable = invocable_with_duals<F, std::make_index_sequence<N>>::value;

template <typename F, std::size_t N, std::size_t... I>
Dual invoke_unpacked(F& f, std::vector<Dual> const& x, std::index_sequence<I...>)
{
  return evaluate_with_tangent(f, x[I]...);
}

} // namespace detail

// TransformedFunction

ValueAndGradient value_and_gradient(TransformedFunction const& f, std::span<double const> point,
                                    GradientExecution exec = default_gradient_execution());

/// \brief The value and derivative of f at `point` along `direction`.
Dual directional_derivative(TransformedFunction const& f, std::span<double const> point,
                            std::span<double const> direction);

// callables taking std::span<Dual const>

template <detail::SpanCallable F>
ValueAndGradient value_and_gradient(F&& f, std::span<double const> point,
                                    GradientExecution exec = default_gradient_execution())
{
  return detail::seeded_passes(
      point.size(),
      [&f, point](std::size_t i) {
        std::vector<Dual> x = detail::seeded_point(point, i);
        return evaluate_with_tangent(f, std::span<Dual const>(x));
      },
      exec);
}

template <detail::SpanCallable F>
Dual directional_derivative(F&& f, std::span<double const> point, std::span<double const> direction)
{
  PRECONDITION_EQUAL(point.size(), direction.size());
  std::vector<Dual> x;
  x.reserve(point.size());
  for (std::size_t j = 0; j < point.size(); ++j)
  {
    x.emplace_back(point[j], direction[j]);
  }
  return evaluate_with_tangent(f, std::span<Dual const>(x));
}

// fixed-arity callables, f(Dual, Dual, ...)

template <typename F, std::size_t N>
ValueAndGradient value_and_gradient(F&& f, std::array<double, N> const& point,
                                    GradientExecution exec = default_gradient_execution())
{
  if constexpr (std::same_as<std::remove_cvref_t<F>, TransformedFunction> || !detail::FixedArityCallable<F, N>)
  {
    return value_and_gradient(f, std::span<double const>(point), exec);
  }
  else
  {
    return detail::seeded_passes(
        N,
        [&f, &point](std::size_t i) {
          return detail::invoke_unpacked<F, N>(f, detail::seeded_point(point, i), std::make_index_sequence<N>());
        },
        exec);
  }
}

template <typename F, std::size_t N>
Dual directional_derivative(F&& f, std::array<double, N> const& point, std::array<double, N> const& direction)
{
  if constexpr (std::same_as<std::remove_cvref_t<F>, TransformedFunction> || !detail::FixedArityCallable<F, N>)
  {
    return directional_derivative(f, std::span<double const>(point), std::span<double const>(direction));
  }
  else
  {
    std::vector<Dual> x;
    x.reserve(N);
    for (std::size_t j = 0; j < N; ++j)
    {
      x.emplace_back(point[j], direction[j]);
    }
    return detail::invoke_unpacked<F, N>(f, x, std::make_index_sequence<N>());
  }
}

/// \brief The gradient of f at `point`: one forward pass per input, seeded with e_i.
template <typename F, typename Point>
std::vector<double> gradient(F&& f, Point const& point, GradientExecution exec = default_gradient_execution())
{
  return value_and_gradient(std::forward<F>(f), point, exec).gradient;
}

} // namespace fwdiff
