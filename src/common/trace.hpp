#pragma once

#include "config.hpp"
#include "demangle.hpp"
#include "namedenum.hpp"
#include "terminal.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <fmt/core.h>
#include <fmt/format.h>
#include <functional>
#include <iterator>
#include <map>
#include <mutex>
#include <ranges>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

// TRACE MACROS
// These macros forward both the stringified expression list and the evaluated
// arguments, along with file and line info, to the corresponding trace functions.
// In constant-evaluated context they expand to nothing.
#define TRACE(...)                                                                                                     \
  do                                                                                                                   \
  {                                                                                                                    \
    if consteval                                                                                                       \
    {}                                                                                                                 \
    else                                                                                                               \
    {                                                                                                                  \
      trace::TraceCall(#__VA_ARGS__, __FILE__, __LINE__ __VA_OPT__(, __VA_ARGS__));                                    \
    }                                                                                                                  \
  }                                                                                                                    \
  while (0)

// TRACE_MODULE(m, ...) is compiled in only if ENABLE_TRACE_m is true (see config.hpp)
#define TRACE_MODULE(m, ...)                                                                                           \
  do                                                                                                                   \
  {                                                                                                                    \
    if constexpr (ENABLE_TRACE_##m)                                                                                    \
    {                                                                                                                  \
      trace::TraceModuleCall(#m, #__VA_ARGS__, __FILE__, __LINE__ __VA_OPT__(, __VA_ARGS__));                          \
    }                                                                                                                  \
  }                                                                                                                    \
  while (0)

// CHECK and PRECONDITION MACROS
// These macros check a condition and, if false, print diagnostic information and abort.
#define CHECK(cond, ...)                                                                                               \
  do                                                                                                                   \
  {                                                                                                                    \
    if (!(cond))                                                                                                       \
    {                                                                                                                  \
      trace::CheckCall("CHECK", #cond, #__VA_ARGS__, __FILE__, __LINE__ __VA_OPT__(, __VA_ARGS__));                    \
    }                                                                                                                  \
  }                                                                                                                    \
  while (0)

#define CHECK_EQUAL(a, b, ...)                                                                                         \
  do                                                                                                                   \
  {                                                                                                                    \
    if (!((a) == (b)))                                                                                                 \
    {                                                                                                                  \
      trace::CheckEqualCall("CHECK_EQUAL", #a, #b, (#a "," #b __VA_OPT__("," #__VA_ARGS__)), __FILE__, __LINE__, a,    \
                            b __VA_OPT__(, __VA_ARGS__));                                                              \
    }                                                                                                                  \
  }                                                                                                                    \
  while (0)

#define PRECONDITION(cond, ...)                                                                                        \
  do                                                                                                                   \
  {                                                                                                                    \
    if (!(cond))                                                                                                       \
    {                                                                                                                  \
      trace::CheckCall("PRECONDITION", #cond, #__VA_ARGS__, __FILE__, __LINE__ __VA_OPT__(, __VA_ARGS__));             \
    }                                                                                                                  \
  }                                                                                                                    \
  while (0)

#define PRECONDITION_EQUAL(a, b, ...)                                                                                  \
  do                                                                                                                   \
  {                                                                                                                    \
    if (!((a) == (b)))                                                                                                 \
    {                                                                                                                  \
      trace::CheckEqualCall("PRECONDITION_EQUAL", #a, #b, (#a "," #b __VA_OPT__("," #__VA_ARGS__)), __FILE__,          \
                            __LINE__, a, b __VA_OPT__(, __VA_ARGS__));                                                 \
    }                                                                                                                  \
  }                                                                                                                    \
  while (0)

// PANIC is used to unconditionally abort
#define PANIC(...) trace::PanicCall(#__VA_ARGS__, __FILE__, __LINE__ __VA_OPT__(, __VA_ARGS__));

// ERROR MACROS
// These report an error, then either abort or throw std::runtime_error depending on
// FormattingOptions::errors_abort().
#define ERROR(...) trace::ErrorCall(nullptr, #__VA_ARGS__, __FILE__, __LINE__ __VA_OPT__(, __VA_ARGS__));

#define ERROR_IF(cond, ...)                                                                                            \
  do                                                                                                                   \
  {                                                                                                                    \
    if (cond)                                                                                                          \
    {                                                                                                                  \
      trace::ErrorCall(#cond, #__VA_ARGS__, __FILE__, __LINE__ __VA_OPT__(, __VA_ARGS__));                             \
    }                                                                                                                  \
  }                                                                                                                    \
  while (0)

// DEBUG MACROS (compile to nothing if NDEBUG is defined)
#if defined(NDEBUG)
#define DEBUG_TRACE(...)                                                                                               \
  do                                                                                                                   \
  {}                                                                                                                   \
  while (0)
#define DEBUG_TRACE_MODULE(...)                                                                                        \
  do                                                                                                                   \
  {}                                                                                                                   \
  while (0)
#define DEBUG_CHECK(...)                                                                                               \
  do                                                                                                                   \
  {}                                                                                                                   \
  while (0)
#else
#define DEBUG_TRACE(...) TRACE(__VA_ARGS__)
#define DEBUG_TRACE_MODULE(m, ...) TRACE_MODULE(m __VA_OPT__(, __VA_ARGS__))
#define DEBUG_CHECK(cond, ...) CHECK(cond __VA_OPT__(, __VA_ARGS__))
#endif

namespace trace
{

struct FormattingOptions;

/// \brief get the FormattingOptions object for a given module; use "" (the default) for the global options
inline FormattingOptions& get_formatting_options(const std::string& module = "");

/// \brief Configuration and formatting options for a trace module.
///
/// The global options are read from the environment on first use:
///   - FWDIFF_TRACEFILE          output file ("-" or "stdout", "stderr", or a path; a leading '+' appends)
///   - FWDIFF_TRACE_COLOR        yes/no/auto
///   - FWDIFF_TRACE_TIMESTAMP    prefix each line with a timestamp
///   - FWDIFF_TRACE_THREAD_ID    prefix each line with the thread ID
///   - FWDIFF_FP_PRECISION       digits shown for floating point values
///   - FWDIFF_COLOR_<KIND>       terminal style for each output kind, eg FWDIFF_COLOR_TRACE=Cyan;Bold
///
/// Module options start as a copy of the global options, and are then overridden by the
/// _MODULE_<MODULE> variants, eg FWDIFF_TRACE_COLOR_MODULE_REGISTRY.
struct FormattingOptions
{
    struct ColorOptionTraits
    {
        enum Enum
        {
          yes,
          no,
          autocolor
        };
        static constexpr Enum Default = autocolor;
        static constexpr const char* StaticName = "Color options (yes/no/auto)";
        static constexpr std::array<const char*, 3> Names = {"yes", "no", "auto"};
    };

    using ColorOptions = NamedEnumeration<ColorOptionTraits>;

    /// Floating-point precision for formatting values.
    int fp_precision = 10;

    ColorOptions color;

    /// Whether to actually emit color sequences.
    bool showColor = false;

    /// Abort on error if true, otherwise ERROR throws. This is global.
    inline static bool errorsAbort = false;

    bool timestamp = false;

    bool showThreadId = false;

    FILE* outputStream = stderr;

    using Sink = std::function<void(std::string)>;

    /// Function that actually emits strings (defaults to fputs to stderr).
    Sink sink = [](std::string s) { std::fputs(s.c_str(), stderr); };

    /// Per-kind styles (keys like "TRACE", "TRACE_FILENAME", etc).
    std::map<std::string, terminal::TerminalStyle, std::less<>> Styles;

    FormattingOptions()
    {
      static constexpr std::pair<std::string_view, std::string_view> kDefaults[] = {{"TRACE", "Cyan"},
                                                                                    {"TRACE_MODULE", "Cyan;Bold"},
                                                                                    {"TRACE_EXPR", "Blue"},
                                                                                    {"TRACE_VALUE", ""},
                                                                                    {"TRACE_FILENAME", "Red"},
                                                                                    {"TRACE_LINE", "Bold"},
                                                                                    {"TRACE_STRING", "LightBlue"},
                                                                                    {"CHECK", "Red"},
                                                                                    {"PANIC", "Red"},
                                                                                    {"ERROR", "Red"},
                                                                                    {"TIMESTAMP", "LightGray"},
                                                                                    {"THREAD_ID", "LightMagenta"}};

      for (auto [kind, def] : kDefaults)
      {
        std::string env = "FWDIFF_COLOR_" + std::string(kind);
        Styles[std::string(kind)] = terminal::getenv_or_default<terminal::TerminalStyle>(env, def);
      }

      this->apply_tracefile("FWDIFF_TRACEFILE");

      fp_precision = terminal::getenv_or_default<int>("FWDIFF_FP_PRECISION", fp_precision);
      timestamp = terminal::getenv_or_default<terminal::toggle>("FWDIFF_TRACE_TIMESTAMP", false);
      showThreadId = terminal::getenv_or_default<terminal::toggle>("FWDIFF_TRACE_THREAD_ID", false);
      color = terminal::getenv_or_default<ColorOptions>("FWDIFF_TRACE_COLOR", color);
      this->updateShowColor();
    }

    /// \brief Module-specific constructor: inherits the global settings, then applies module overrides.
    explicit FormattingOptions(std::string_view module)
    {
      *this = trace::get_formatting_options("");
      std::string mod{module};

      // the TRACE style of a module defaults to the global TRACE_MODULE style
      Styles["TRACE"] = Styles["TRACE_MODULE"];
      Styles["TRACE"] =
          terminal::getenv_or_default<terminal::TerminalStyle>("FWDIFF_COLOR_TRACE_MODULE_" + mod, Styles["TRACE"]);

      this->apply_tracefile("FWDIFF_TRACEFILE_MODULE_" + mod);

      fp_precision = terminal::getenv_or_default<int>("FWDIFF_FP_PRECISION_MODULE_" + mod, fp_precision);
      timestamp = terminal::getenv_or_default<terminal::toggle>("FWDIFF_TRACE_TIMESTAMP_MODULE_" + mod, timestamp);
      showThreadId =
          terminal::getenv_or_default<terminal::toggle>("FWDIFF_TRACE_THREAD_ID_MODULE_" + mod, showThreadId);
      color = terminal::getenv_or_default<ColorOptions>("FWDIFF_TRACE_COLOR_MODULE_" + mod, color);
      this->updateShowColor();
    }

    /// Set a custom sink function.
    void set_sink(Sink s)
    {
      sink = std::move(s);
      outputStream = nullptr;
    }

    /// Change the output FILE*.
    void set_output_stream(FILE* f)
    {
      outputStream = f;
      sink = [f](std::string s) { std::fputs(s.c_str(), f); };
      updateShowColor();
    }

    void set_color_output(ColorOptions c)
    {
      color = c;
      updateShowColor();
    }

    bool should_show_color() const { return showColor; }

    static void set_errors_abort(bool b) { errorsAbort = b; }

    static bool errors_abort() { return errorsAbort; }

    /// \brief Format text using the style for the given kind.
    std::string format_style(std::string_view str, std::string_view kind) const
    {
      if (!showColor) return std::string(str);
      auto it = Styles.find(kind);
      return it == Styles.end() ? std::string(str) : terminal::color_text(str, it->second);
    }

  private:
    void updateShowColor()
    {
      using CO = ColorOptions::Enum;
      if (color == CO::yes)
        showColor = true;
      else if (color == CO::no)
        showColor = false;
      else
        showColor = terminal::is_a_terminal(outputStream);
    }

    void apply_tracefile(std::string const& var)
    {
      char const* path = std::getenv(var.c_str());
      if (!path || std::strlen(path) == 0) return;

      FILE* out = nullptr;
      if (std::strcmp(path, "-") == 0 || std::strcmp(path, "stdout") == 0)
      {
        out = stdout;
      }
      else if (std::strcmp(path, "stderr") == 0)
      {
        out = stderr;
      }
      else
      {
        bool append = (path[0] == '+');
        out = std::fopen(append ? path + 1 : path, append ? "a" : "w");
      }
      if (out) this->set_output_stream(out);
    }
};

inline FormattingOptions& get_formatting_options(const std::string& module)
{
  static std::recursive_mutex mtx;
  static std::unordered_map<std::string, FormattingOptions> table;
  std::lock_guard lock(mtx);

  // the global entry must exist before any module entry copies from it
  auto& global = table.try_emplace("").first->second;
  if (module.empty()) return global;

  auto [it, _] = table.try_emplace(module, std::string_view(module));
  return it->second;
}

template <typename T>
concept HasFormatter = fmt::is_formattable<T>::value;

template <typename T>
concept Container = std::ranges::forward_range<T> && (!HasFormatter<T>);

template <typename T>
std::string formatValue(const T& value, const FormattingOptions&)
  requires(!Container<T> && HasFormatter<T> && !std::is_floating_point_v<T>)
{
  return fmt::format("{}", value);
}

inline std::string formatValue(double value, const FormattingOptions& opts)
{
  return fmt::format("{:.{}g}", value, opts.fp_precision);
}

inline std::string formatValue(float value, const FormattingOptions& opts)
{
  return formatValue(static_cast<double>(value), opts);
}

inline std::string formatValue(const char* s, const FormattingOptions&) { return s ? std::string(s) : "(null)"; }

template <typename U>
std::string formatValue(U* ptr, const FormattingOptions&)
  requires(!std::is_same_v<std::remove_cv_t<U>, char>)
{
  return fmt::format("{}* @ {}", fwdiff::demangle::demangle(typeid(U).name()), fmt::ptr(ptr));
}

template <Container ContainerType> std::string formatValue(const ContainerType& c, const FormattingOptions& opts)
{
  std::vector<std::string> items;
  for (auto const& elem : c)
  {
    items.push_back(formatValue(elem, opts));
  }
  return "[ " + join(items, ", ") + " ]";
}

// parseNames: Splits the stringified parameter list into tokens at top-level commas.
// Each token is paired with a flag that is true if it contains a top-level string or character literal,
// in which case it is printed as-is rather than as "name = value".
inline std::vector<std::pair<std::string, bool>> parseNames(std::string_view s)
{
  std::vector<std::pair<std::string, bool>> tokens;
  std::string current;
  bool literal = false;
  int depth = 0;
  char quote = 0;

  for (std::size_t i = 0; i < s.size(); ++i)
  {
    char c = s[i];
    if (quote)
    {
      current.push_back(c);
      if (c == '\\' && i + 1 < s.size())
        current.push_back(s[++i]);
      else if (c == quote)
        quote = 0;
      continue;
    }
    if (c == '"' || c == '\'')
    {
      if (depth == 0) literal = true;
      quote = c;
    }
    else if (c == '(' || c == '[' || c == '{')
    {
      ++depth;
    }
    else if ((c == ')' || c == ']' || c == '}') && depth > 0)
    {
      --depth;
    }
    else if (c == ',' && depth == 0)
    {
      tokens.emplace_back(std::string(trim(current)), literal);
      current.clear();
      literal = false;
      continue;
    }
    current.push_back(c);
  }
  if (!trim(current).empty()) tokens.emplace_back(std::string(trim(current)), literal);
  return tokens;
}

template <typename... Args>
std::string formatParameterList(const char* exprList, const FormattingOptions& opts, const Args&... args)
{
  if constexpr (sizeof...(Args) == 0)
  {
    return std::string();
  }
  else
  {
    auto names = parseNames(exprList);
    std::vector<std::string> items;
    std::size_t i = 0;
    auto add = [&](auto const& value) {
      std::string v = formatValue(value, opts);
      if (i < names.size() && !names[i].second)
        items.push_back(opts.format_style(names[i].first, "TRACE_EXPR") + " = " + opts.format_style(v, "TRACE_VALUE"));
      else
        items.push_back(opts.format_style(v, "TRACE_STRING"));
      ++i;
    };
    (add(args), ...);
    return join(items, ", ");
  }
}

namespace detail
{

// timestamp and thread-id decorations, as configured
inline std::string decorations(const FormattingOptions& opts)
{
  std::string result;
  if (opts.timestamp)
  {
    auto now = std::chrono::system_clock::now();
    auto us_since_epoch = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch());
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(us_since_epoch);
    auto micros = us_since_epoch - seconds;

    std::time_t t = seconds.count();
    std::tm tm = *std::localtime(&t);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%F %T", &tm);
    result += opts.format_style(fmt::format("[{}.{:06}] ", buffer, micros.count()), "TIMESTAMP");
  }
  if (opts.showThreadId)
  {
    auto id = std::hash<std::thread::id>{}(std::this_thread::get_id());
    result += opts.format_style(fmt::format("[TID {:>8x}] ", id), "THREAD_ID");
  }
  return result;
}

inline std::string location(const FormattingOptions& opts, const char* file, int line)
{
  return opts.format_style(file, "TRACE_FILENAME") + opts.format_style(fmt::format(":{}", line), "TRACE_LINE");
}

[[noreturn]] inline void emit_and_abort(const FormattingOptions& opts, std::string const& msg)
{
  opts.sink(msg);
  std::fflush(nullptr);
  std::abort();
}

} // namespace detail

template <typename... Args> void TraceCall(const char* exprList, const char* file, int line, const Args&... args)
{
  auto& opts = get_formatting_options();
  std::string trace_str = formatParameterList(exprList, opts, args...);
  std::string pre = opts.format_style("TRACE", "TRACE") + " at " + detail::location(opts, file, line);
  opts.sink(detail::decorations(opts) + pre + (trace_str.empty() ? "" : " : ") + trace_str + "\n");
}

template <typename... Args>
void TraceModuleCall(const char* module, const char* exprList, const char* file, int line, const Args&... args)
{
  auto& opts = get_formatting_options(module);
  std::string trace_str = formatParameterList(exprList, opts, args...);
  std::string pre = opts.format_style("TRACE", "TRACE") + " in module " + opts.format_style(module, "TRACE") +
                    " at " + detail::location(opts, file, line);
  opts.sink(detail::decorations(opts) + pre + (trace_str.empty() ? "" : " : ") + trace_str + "\n");
}

template <typename... Args>
[[noreturn]] void CheckCall(const char* kind, const char* cond, const char* exprList, const char* file, int line,
                            const Args&... args)
{
  auto& opts = get_formatting_options();
  std::string trace_str = formatParameterList(exprList, opts, args...);
  std::string msg = opts.format_style(kind, "CHECK") + " at " + detail::location(opts, file, line) +
                    fmt::format("\n{} is false!", opts.format_style(cond, "TRACE_EXPR")) +
                    (trace_str.empty() ? "" : "\n : " + trace_str) + "\n";
  detail::emit_and_abort(opts, msg);
}

template <typename A, typename B, typename... Args>
[[noreturn]] void CheckEqualCall(const char* kind, const char* a, const char* b, const char* exprList, const char* file,
                                 int line, const A& va, const B& vb, const Args&... args)
{
  auto& opts = get_formatting_options();
  std::string trace_str = formatParameterList(exprList, opts, va, vb, args...);
  std::string msg = opts.format_style(kind, "CHECK") + " at " + detail::location(opts, file, line) +
                    fmt::format("\n{} is not equal to {}!", opts.format_style(a, "TRACE_EXPR"),
                                opts.format_style(b, "TRACE_EXPR")) +
                    "\n : " + trace_str + "\n";
  detail::emit_and_abort(opts, msg);
}

template <typename... Args>
[[noreturn]] void PanicCall(const char* exprList, const char* file, int line, const Args&... args)
{
  auto& opts = get_formatting_options();
  std::string trace_str = formatParameterList(exprList, opts, args...);
  std::string msg = opts.format_style("PANIC", "PANIC") + " at " + detail::location(opts, file, line) +
                    (trace_str.empty() ? "" : " : " + trace_str) + "\n";
  detail::emit_and_abort(opts, msg);
}

template <typename... Args>
[[noreturn]] void ErrorCall(const char* cond, const char* exprList, const char* file, int line, const Args&... args)
{
  auto& opts = get_formatting_options();
  std::string trace_str = formatParameterList(exprList, opts, args...);
  std::string msg = opts.format_style("ERROR", "ERROR") + " at " + detail::location(opts, file, line) +
                    (trace_str.empty() ? "" : " : " + trace_str);
  if (cond) msg += fmt::format("\n{} is true!", opts.format_style(cond, "TRACE_EXPR"));
  msg += "\n";

  if (opts.errors_abort()) detail::emit_and_abort(opts, msg);
  throw std::runtime_error(msg);
}

} // namespace trace
