#pragma once

/// \file dual.hpp
/// \brief Dual number for forward-mode automatic differentiation.
///
/// A Dual carries a primal value \f$ v \f$ together with its tangent \f$ \dot v \f$, the
/// directional derivative of \f$ v \f$ along whichever input direction was seeded:
/// \f[
///   \dot v = \sum_i \frac{\partial v}{\partial x_i} \, s_i
/// \f]
/// where \f$ s \f$ is the seed vector. With a one-hot seed \f$ s = e_i \f$ the tangent is the
/// partial derivative with respect to \f$ x_i \f$; with a zero seed it is identically 0.
///
/// Duals are immutable and carry no identity beyond their two numbers. New Duals are produced
/// by rule application (see rule.hpp) or by seeding an input.

#include <fmt/core.h>

namespace fwdiff
{

class Dual {
  public:
    using value_type = double;

    constexpr Dual() = default;

    /// \brief A constant: the tangent is zero.
    constexpr Dual(double value) : value_(value) {}

    constexpr Dual(double value, double tangent) : value_(value), tangent_(tangent) {}

    /// \brief An input seeded with tangent 1.
    static constexpr Dual variable(double value) { return Dual(value, 1.0); }

    constexpr double value() const { return value_; }
    constexpr double tangent() const { return tangent_; }

    constexpr bool operator==(Dual const&) const = default;

  private:
    double value_ = 0.0;
    double tangent_ = 0.0;
};

} // namespace fwdiff

template <> struct fmt::formatter<fwdiff::Dual>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext> auto format(fwdiff::Dual const& x, FormatContext& ctx) const
    {
      return fmt::format_to(ctx.out(), "({}, d={})", x.value(), x.tangent());
    }
};
