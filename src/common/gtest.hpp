#pragma once

/// \file gtest.hpp
/// \brief GoogleTest integration for ULP-based floating-point comparisons.
///
/// `EXPECT_FLOATING_EQ(a, b)` and `ASSERT_FLOATING_EQ(a, b)` compare with a default tolerance of
/// 4 ULPs; an optional third argument gives the tolerance explicitly:
/// \code
/// EXPECT_FLOATING_EQ(a, b);     // 4 ULPs
/// EXPECT_FLOATING_EQ(a, b, 0);  // bitwise equal (up to the sign of zero)
/// \endcode
///
/// Failure output shows the compared expressions, their values, the tolerance, and the
/// actual ULP distance from `fwdiff::check::float_distance`.

#include "floating_eq.hpp"
#include <gtest/gtest.h>
#include <type_traits>

namespace fwdiff::check::detail
{
inline unsigned ulps_or_default() { return 4; }
inline unsigned ulps_or_default(unsigned ulps) { return ulps; }
} // namespace fwdiff::check::detail

#define FWDIFF_FLOATING_EQ_IMPL(a, b, on_failure, name, ...)                                                           \
  do                                                                                                                   \
  {                                                                                                                    \
    auto va = (a);                                                                                                     \
    auto vb = (b);                                                                                                     \
    using T = std::decay_t<decltype(va)>;                                                                              \
    static_assert(std::is_floating_point_v<T>, name " requires a floating point type");                                \
    unsigned ulps = ::fwdiff::check::detail::ulps_or_default(__VA_ARGS__);                                             \
    if (!::fwdiff::check::floating_eq<T>(va, vb, ulps))                                                                \
    {                                                                                                                  \
      on_failure() << name " failed at " << __FILE__ << ":" << __LINE__ << "\n  " #a " = " << va << "\n  " #b " = "    \
                   << vb << "\n  allowed tolerance: " << ulps << " ULPs"                                               \
                   << "\n  actual distance: " << ::fwdiff::check::float_distance<T>(va, vb);                           \
    }                                                                                                                  \
  }                                                                                                                    \
  while (0)

#define EXPECT_FLOATING_EQ(a, b, ...) FWDIFF_FLOATING_EQ_IMPL(a, b, ADD_FAILURE, "EXPECT_FLOATING_EQ", __VA_ARGS__)

#define ASSERT_FLOATING_EQ(a, b, ...) FWDIFF_FLOATING_EQ_IMPL(a, b, FAIL, "ASSERT_FLOATING_EQ", __VA_ARGS__)
