#include "terminal.hpp"

#include <array>
#include <sys/ioctl.h>
#include <unistd.h>
#include <utility>

namespace terminal
{

namespace
{

constexpr std::array<std::pair<std::string_view, Color>, 17> ColorNames = {{{"default", Color::Default},
                                                                             {"black", Color::Black},
                                                                             {"red", Color::Red},
                                                                             {"green", Color::Green},
                                                                             {"yellow", Color::Yellow},
                                                                             {"blue", Color::Blue},
                                                                             {"magenta", Color::Magenta},
                                                                             {"cyan", Color::Cyan},
                                                                             {"lightgray", Color::LightGray},
                                                                             {"darkgray", Color::DarkGray},
                                                                             {"lightred", Color::LightRed},
                                                                             {"lightgreen", Color::LightGreen},
                                                                             {"lightyellow", Color::LightYellow},
                                                                             {"lightblue", Color::LightBlue},
                                                                             {"lightmagenta", Color::LightMagenta},
                                                                             {"lightcyan", Color::LightCyan},
                                                                             {"white", Color::White}}};

std::optional<Color> parse_color(std::string_view token)
{
  for (auto [name, c] : ColorNames)
  {
    if (iequals(name, token)) return c;
  }
  return std::nullopt;
}

} // namespace

TerminalStyle::TerminalStyle(std::string_view s)
{
  while (!s.empty())
  {
    auto pos = s.find(';');
    std::string_view token = trim(s.substr(0, pos));
    s = (pos == std::string_view::npos) ? std::string_view{} : s.substr(pos + 1);

    if (token.empty()) continue;
    if (iequals(token, "bold"))
      bold = true;
    else if (iequals(token, "underline"))
      underline = true;
    else if (auto c = parse_color(token))
      fg = *c;
  }
}

std::string TerminalStyle::to_string() const
{
  std::string codes;
  auto add = [&codes](int code) {
    if (!codes.empty()) codes += ';';
    codes += std::to_string(code);
  };
  if (bold) add(1);
  if (underline) add(4);
  if (fg) add(static_cast<int>(*fg));
  return codes.empty() ? std::string() : "\033[" + codes + "m";
}

int columns()
{
  if (char const* c = std::getenv("COLUMNS"))
  {
    try
    {
      int n = from_string<int>(c);
      if (n > 0) return n;
    }
    catch (std::exception const&)
    {
      // fall back to querying the terminal
    }
  }
  struct winsize w;
  if (ioctl(STDERR_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) return w.ws_col;
  return 80;
}

bool is_a_terminal(std::FILE* stream) { return stream && isatty(fileno(stream)); }

} // namespace terminal
