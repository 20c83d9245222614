#pragma once
#include <fmt/format.h>
#include <fmt/printf.h>

#include <iterator>
#include <string>
#include <string_view>
#include <type_traits>

namespace tau
{
namespace slog
{
namespace detail
{

template <typename T>
struct IsStringLike
    : std::integral_constant<bool, std::is_same<T, std::string>::value ||
                                       std::is_same<T, std::string_view>::value ||
                                       std::is_same<T, const char*>::value ||
                                       std::is_same<T, char*>::value>
{
};

template <typename T>
constexpr bool kIsStringLike = IsStringLike<std::decay_t<T>>::value;

inline void SprintAppend(std::string&, bool) {}

template <typename T, typename... Rest>
void SprintAppend(std::string& out, bool prev_string, const T& value, const Rest&... rest)
{
  constexpr bool is_string = kIsStringLike<T>;
  if (!prev_string && !is_string)
  {
    out += ' ';
  }
  fmt::format_to(std::back_inserter(out), "{}", value);
  SprintAppend(out, is_string, rest...);
}

}  // namespace detail

// Concatenates operands, with a space between two adjacent operands when
// neither is a string.
template <typename... Args>
std::string Sprint(const Args&... args)
{
  std::string out;
  detail::SprintAppend(out, true, args...);
  return out;
}

// printf-style substitution. A malformed format yields the format followed by
// a %!(...) marker instead of throwing.
template <typename... Args>
std::string Sprintf(std::string_view format, const Args&... args)
{
  try
  {
    return fmt::sprintf(format, args...);
  }
  catch (const fmt::format_error& e)
  {
    return fmt::format("{}%!({})", format, e.what());
  }
}

}  // namespace slog
}  // namespace tau
