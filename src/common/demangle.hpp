#pragma once

#include <cstdlib>
#include <memory>
#include <string>
#include <typeinfo>

#if defined(__GNUG__)
#include <cxxabi.h>
#endif

namespace fwdiff::demangle
{

/// \brief Turn a compiler-mangled name into a human-readable one.
/// \param name  The result of typeid(...).name().
/// \returns     A demangled string if supported; otherwise returns `name`.
inline std::string demangle(const char* name)
{
#if defined(__GNUG__)
  int status = 0;
  std::unique_ptr<char, void (*)(void*)> dem(abi::__cxa_demangle(name, nullptr, nullptr, &status), std::free);
  return (status == 0 && dem) ? std::string(dem.get()) : std::string(name);
#else
  return name;
#endif
}

/// \brief Human-readable name of the type T, used in diagnostics.
template <typename T> std::string type_name() { return demangle(typeid(T).name()); }

} // namespace fwdiff::demangle
