#pragma once

#include <bit>
#include <cmath>
#include <concepts>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <type_traits>

namespace fwdiff::check
{

/// \brief Return the signed distance in ULPs between two IEEE-754 values.
/// \details
///  * Positive if `b > a`, negative if `a > b`.
///  * Returns 0 if `a == b` (including +0 vs -0).
///  * Returns `max<long long>` if either value is NaN or if infinities differ.
template <std::floating_point T> inline long long float_distance(T a, T b)
{
  static_assert(std::numeric_limits<T>::is_iec559, "float_distance requires IEEE-754 floating point");
  static_assert(sizeof(T) == 4 || sizeof(T) == 8, "float_distance supports float and double");

  using UInt = std::conditional_t<sizeof(T) == 4, std::uint32_t, std::uint64_t>;
  using Int = std::make_signed_t<UInt>;

  if (std::isnan(a) || std::isnan(b)) return std::numeric_limits<long long>::max();
  if (std::isinf(a) || std::isinf(b)) return (a == b) ? 0 : std::numeric_limits<long long>::max();
  if (a == b) return 0;

  // map the sign-magnitude representation onto a monotonic two's complement line
  auto ordered = [](T x) -> Int {
    auto i = std::bit_cast<Int>(x);
    return i < 0 ? std::numeric_limits<Int>::min() - i : i;
  };
  return static_cast<long long>(ordered(b)) - static_cast<long long>(ordered(a));
}

/// \brief Compare floating point values within a given ULP tolerance.
/// \note Default tolerance is 4 ULPs, matching GoogleTest's `EXPECT_DOUBLE_EQ`.
template <std::floating_point T> inline bool floating_eq(T a, T b, unsigned max_ulps = 4)
{
  auto dist = float_distance(a, b);
  return dist != std::numeric_limits<long long>::max() && std::llabs(dist) <= static_cast<long long>(max_ulps);
}

} // namespace fwdiff::check
