// string_util.hpp
//
// Small string helpers shared by the trace facility and the configuration layer:
//   - iequals: case-insensitive comparison, used when parsing enumeration names from the environment.
//   - trim: strip leading and trailing whitespace.
//   - join: concatenate a range of strings with a separator.
//   - from_string<T>: convert a std::string_view into T.
//       - For bool, accepts yes/no/true/false/1/0 (case-insensitive).
//       - For other arithmetic types, uses std::from_chars.
//       - For types constructible from std::string_view, uses that constructor.
//       - Otherwise a static_assert fires.

#pragma once

#include <algorithm>
#include <cctype>
#include <charconv>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

inline bool iequals(std::string_view a, std::string_view b)
{
  return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](unsigned char ca, unsigned char cb) {
           return std::tolower(ca) == std::tolower(cb);
         });
}

inline std::string_view trim(std::string_view s)
{
  auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  while (!s.empty() && is_space(s.front()))
    s.remove_prefix(1);
  while (!s.empty() && is_space(s.back()))
    s.remove_suffix(1);
  return s;
}

template <typename Range> std::string join(Range const& items, std::string_view sep)
{
  std::string result;
  bool first = true;
  for (auto const& item : items)
  {
    if (!first) result += sep;
    result += item;
    first = false;
  }
  return result;
}

// A helper for static_assert in an uninstantiated branch.
template <typename> inline constexpr bool dependent_false_v = false;

template <typename T> T from_string(std::string_view s)
{
  s = trim(s);
  if constexpr (std::is_same_v<T, bool>)
  {
    if (iequals(s, "yes") || iequals(s, "true") || s == "1") return true;
    if (iequals(s, "no") || iequals(s, "false") || s == "0") return false;
    throw std::runtime_error("from_string: cannot interpret '" + std::string(s) + "' as a boolean");
  }
  else if constexpr (std::is_arithmetic_v<T>)
  {
    T result{};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), result);
    if (ec != std::errc() || ptr != s.data() + s.size())
      throw std::runtime_error("from_string: conversion failed for '" + std::string(s) + "'");
    return result;
  }
  else if constexpr (std::is_constructible_v<T, std::string_view>)
  {
    return T(s);
  }
  else
  {
    static_assert(dependent_false_v<T>, "from_string: No conversion available for type T");
  }
}
