#pragma once

#include "string_util.hpp"
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

namespace terminal
{

// return the number of columns in the output terminal, or 80 if it cannot be determined
int columns();

// returns true if the given stream is a terminal, false otherwise
bool is_a_terminal(std::FILE* stream);

inline bool env_exists(std::string const& str) { return std::getenv(str.c_str()) != nullptr; }

// Get an environment string converted to T, or if the variable is not defined or cannot be
// converted, return default_value.
template <typename T, typename U> T getenv_or_default(const std::string& var, const U& default_value)
{
  if (const char* env = std::getenv(var.c_str()))
  {
    try
    {
      return from_string<T>(env);
    }
    catch (std::exception const&)
    {
      // unparseable setting; the default applies
    }
  }
  return T(default_value);
}

inline char const* getenv_or_default(std::string const& str, char const* Default)
{
  char const* Str = std::getenv(str.c_str());
  return Str ? Str : Default;
}

/// \brief A yes/no toggle that parses from a string.
///
/// Accepts "yes", "true", "1" (case-insensitive) as true and "no", "false", "0" as false.
/// An empty or unrecognized string gives the default value.
struct toggle
{
    bool value;

    toggle(bool value_) : value(value_) {}

    toggle(std::string_view str, bool default_value = true) : value(default_value)
    {
      str = trim(str);
      if (iequals(str, "no") || iequals(str, "false") || str == "0")
        value = false;
      else if (iequals(str, "yes") || iequals(str, "true") || str == "1")
        value = true;
    }

    operator bool() const { return value; }
};

enum class Color
{
  Default = 39,
  Black = 30,
  Red = 31,
  Green = 32,
  Yellow = 33,
  Blue = 34,
  Magenta = 35,
  Cyan = 36,
  LightGray = 37,
  DarkGray = 90,
  LightRed = 91,
  LightGreen = 92,
  LightYellow = 93,
  LightBlue = 94,
  LightMagenta = 95,
  LightCyan = 96,
  White = 97
};

/// \brief Foreground colour plus bold/underline attributes.
///
/// Parsed from strings of the form "Color;Attr;Attr", eg "Cyan;Bold". Color names are
/// case-insensitive. An empty string is the plain style. Unknown tokens are ignored.
class TerminalStyle {
  public:
    std::optional<Color> fg;
    bool bold = false;
    bool underline = false;

    TerminalStyle() = default;

    TerminalStyle(Color c) : fg(c) {}

    TerminalStyle(std::string_view s);

    bool is_plain() const { return !fg && !bold && !underline; }

    // ANSI escape sequence that switches to this style
    std::string to_string() const;
};

inline std::string color_text(std::string_view s, const TerminalStyle& ts)
{
  if (ts.is_plain()) return std::string(s);
  return ts.to_string() + std::string(s) + "\033[0m";
}

} // namespace terminal
