#pragma once

// An enumeration that is iterable and has a string name associated with each item.
//
// To use, define a traits struct with 4 members:
// Enum        - an unscoped enumeration type with consecutive values starting at 0
// Default     - a constexpr value of type Enum, the value of a default-constructed NamedEnumeration
// StaticName  - a static constexpr char const* describing the enumeration, used in error messages
// Names       - a static constexpr std::array of names, of exactly the same size as Enum
//
// Example:
// struct ExecutionTraits
// {
//    enum Enum { serial, parallel };
//    static constexpr Enum Default = serial;
//    static constexpr const char* StaticName = "gradient execution policy";
//    static constexpr std::array<const char*, 2> Names = { "serial", "parallel" };
// };
//
// Construction from a string is not case sensitive. A NamedEnumeration can be read from the
// environment with terminal::getenv_or_default, and printed with fmt.

#include "string_util.hpp"

#include <array>
#include <fmt/core.h>
#include <fmt/format.h>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

template <typename Traits> class NamedEnumeration : public Traits {
  public:
    using Enum = typename Traits::Enum;
    using Traits::StaticName;
    static constexpr std::size_t N = Traits::Names.size();
    static constexpr Enum DEFAULT = Traits::Default;
    static constexpr Enum BEGIN = static_cast<Enum>(0);
    static constexpr Enum END = static_cast<Enum>(N);

    NamedEnumeration() : e(DEFAULT) {}

    NamedEnumeration(Enum a) : e(a) {}

    explicit NamedEnumeration(std::string_view Name);

    // iteration over all of the enumerators, in declaration order
    NamedEnumeration begin() const { return BEGIN; }
    NamedEnumeration end() const { return END; }

    static constexpr std::size_t size() { return N; }

    bool operator==(const NamedEnumeration& Other) const { return e == Other.e; }
    bool operator==(Enum a) const { return e == a; }

    NamedEnumeration& operator++()
    {
      e = static_cast<Enum>(e + 1);
      return *this;
    }
    const NamedEnumeration& operator*() const { return *this; }

    Enum value() const { return e; }

    // returns a comma-separated list of the enumeration names
    static std::string ListAll();

    // returns the names of all of the enumerators
    static std::vector<std::string> EnumerateAll();

    std::string Name() const { return Traits::Names[e]; }

  private:
    Enum e;
};

template <typename Traits> std::vector<std::string> NamedEnumeration<Traits>::EnumerateAll()
{
  std::vector<std::string> Result;
  Result.reserve(N);
  for (auto a : NamedEnumeration())
  {
    Result.push_back(a.Name());
  }
  return Result;
}

template <typename Traits> std::string NamedEnumeration<Traits>::ListAll() { return join(EnumerateAll(), ", "); }

template <typename Traits> NamedEnumeration<Traits>::NamedEnumeration(std::string_view Name)
{
  Name = trim(Name);
  for (auto a : NamedEnumeration())
  {
    if (iequals(a.Name(), Name))
    {
      e = a.e;
      return;
    }
  }
  throw std::runtime_error(std::string("Unknown initializer '") + std::string(Name) + "' for " + StaticName +
                           "; choices are " + ListAll() + '.');
}

template <typename Traits> struct fmt::formatter<NamedEnumeration<Traits>> : fmt::formatter<std::string_view>
{
    template <typename FormatContext> auto format(NamedEnumeration<Traits> const& x, FormatContext& ctx) const
    {
      return fmt::formatter<std::string_view>::format(x.Name(), ctx);
    }
};
