#include "str.hpp"

#include <array>

namespace hini
{
  constexpr static char whitespace[] = " \t\n\r\f\v";

  std::string_view
  trim_left(std::string_view str)
  {
    size_t begin = str.find_first_not_of(whitespace);
    if (begin == std::string_view::npos)
    {
      str.remove_prefix(str.size());
      return str;
    }
    str.remove_prefix(begin);
    return str;
  }

  std::string_view
  trim_right(std::string_view str)
  {
    size_t end = str.find_last_not_of(whitespace);
    if (end == std::string_view::npos)
    {
      str.remove_suffix(str.size());
      return str;
    }
    str.remove_suffix(str.size() - end - 1);
    return str;
  }

  std::string_view
  trim_whitespace(std::string_view str)
  {
    return trim_right(trim_left(str));
  }

  using namespace std::literals;

  std::vector<std::string_view>
  split(std::string_view str, const std::string_view delim, bool trim)
  {
    std::vector<std::string_view> results;
    // Special case for empty delimiter: splits on each character boundary:
    if (delim.empty())
    {
      results.reserve(str.size());
      for (size_t i = 0; i < str.size(); i++)
        results.emplace_back(str.data() + i, 1);
      return results;
    }

    for (size_t pos = str.find(delim); pos != std::string_view::npos; pos = str.find(delim))
    {
      if (!trim || !results.empty() || pos > 0)
        results.push_back(str.substr(0, pos));
      str.remove_prefix(pos + delim.size());
    }
    if (!trim || str.size())
      results.push_back(str);
    else
      while (!results.empty() && results.back().empty())
        results.pop_back();
    return results;
  }

  std::string
  lowercase_ascii_string(std::string src)
  {
    for (char& ch : src)
      if (ch >= 'A' && ch <= 'Z')
        ch = ch + ('a' - 'A');
    return src;
  }

  static bool
  matches_any(std::string_view str, const std::array<std::string_view, 4>& words)
  {
    const auto lower = lowercase_ascii_string(std::string{str});
    for (const auto& word : words)
      if (lower == word)
        return true;
    return false;
  }

  bool
  is_true_value(std::string_view str)
  {
    return matches_any(str, {"true"sv, "on"sv, "yes"sv, "1"sv});
  }

  bool
  is_false_value(std::string_view str)
  {
    return matches_any(str, {"false"sv, "off"sv, "no"sv, "0"sv});
  }

}  // namespace hini
