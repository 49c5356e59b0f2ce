#pragma once

/// \file op.hpp
/// \brief Operation identifiers, the keys of the rule registry.

#include <compare>
#include <fmt/core.h>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace fwdiff
{

/// \brief Identifies an elementary operation by name.
///
/// Two identifiers are equal iff their names are equal, so distinct operations never collide.
/// Identifiers are cheap to copy and usable as hash keys.
class OpId {
  public:
    OpId() = default;

    explicit OpId(std::string name) : name_(std::move(name)) {}

    explicit OpId(char const* name) : name_(name) {}

    std::string const& name() const { return name_; }

    bool empty() const { return name_.empty(); }

    auto operator<=>(OpId const&) const = default;

  private:
    std::string name_;
};

/// \brief Identifiers for the operations that have built-in rules.
namespace ops
{
inline OpId const add{"add"};
inline OpId const sub{"sub"};
inline OpId const mul{"mul"};
inline OpId const div{"div"};
inline OpId const neg{"neg"};
inline OpId const pow{"pow"};
inline OpId const sin{"sin"};
inline OpId const cos{"cos"};
inline OpId const exp{"exp"};
inline OpId const log{"log"};
} // namespace ops

} // namespace fwdiff

template <> struct std::hash<fwdiff::OpId>
{
    std::size_t operator()(fwdiff::OpId const& op) const noexcept { return std::hash<std::string>{}(op.name()); }
};

template <> struct fmt::formatter<fwdiff::OpId> : fmt::formatter<std::string_view>
{
    template <typename FormatContext> auto format(fwdiff::OpId const& op, FormatContext& ctx) const
    {
      return fmt::formatter<std::string_view>::format(op.name(), ctx);
    }
};
