#pragma once

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <charconv>
#include <string>
#include <string_view>
#include <vector>

namespace hini
{
  /// Returns true if the first argument begins with the second argument
  inline constexpr bool
  starts_with(std::string_view str, std::string_view prefix)
  {
    return str.substr(0, prefix.size()) == prefix;
  }

  /// removes a prefix from a string if it exists
  inline constexpr std::string_view
  strip_prefix(std::string_view str, std::string_view prefix)
  {
    if (starts_with(str, prefix))
      return str.substr(prefix.size());
    return str;
  }

  /// Splits a string on some delimiter string and returns a vector of string_view's pointing into
  /// the pieces of the original string.  The pieces are valid only as long as the original string
  /// remains valid.  Leading and trailing empty substrings are not removed.  If `trim` is true
  /// then leading and trailing empty values will be suppressed.
  ///
  ///     auto v = split("foo.bar.baz", "."); // v is {"foo", "bar", "baz"}
  ///     auto v = split(".foo", ".");        // v is {"", "foo"}
  ///     auto v = split("", ".");            // v is {""}
  ///     auto v = split("", ".", true);      // v is {}
  ///
  std::vector<std::string_view>
  split(std::string_view str, std::string_view delim, bool trim = false);

  /// Joins [begin, end) with a delimiter and returns the resulting string.  Elements can be
  /// anything that is fmt formattable.
  template <typename It>
  std::string
  join(std::string_view delimiter, It begin, It end)
  {
    return fmt::format("{}", fmt::join(begin, end, delimiter));
  }

  /// Wrapper around the above that takes a container and passes c.begin(), c.end() to the above.
  template <typename Container>
  std::string
  join(std::string_view delimiter, const Container& c)
  {
    return join(delimiter, c.begin(), c.end());
  }

  /// Parses an integer of some sort from a string, requiring that the entire string be consumed
  /// during parsing.  Return false if parsing failed, sets `value` and returns true if the entire
  /// string was consumed.
  template <typename T>
  bool
  parse_int(const std::string_view str, T& value, int base = 10)
  {
    T tmp;
    auto* strend = str.data() + str.size();
    auto [p, ec] = std::from_chars(str.data(), strend, tmp, base);
    if (ec != std::errc() || p != strend)
      return false;
    value = tmp;
    return true;
  }

  std::string
  lowercase_ascii_string(std::string src);

  /// true for "true", "on", "yes" and "1", ignoring case
  bool
  is_true_value(std::string_view str);

  /// true for "false", "off", "no" and "0", ignoring case
  bool
  is_false_value(std::string_view str);

  std::string_view
  trim_whitespace(std::string_view str);

  std::string_view
  trim_left(std::string_view str);

  std::string_view
  trim_right(std::string_view str);

}  // namespace hini
