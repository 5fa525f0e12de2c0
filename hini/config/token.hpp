#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <variant>

namespace hini
{
  /// [name] or [name : inherits]
  struct SectionHeader
  {
    std::string name;
    /// dotted path of the section whose keys are copied, resolved from the document root
    std::optional<std::string> inherits;
    size_t line = 0;
  };

  /// key = value, value fully decoded (quotes, escapes, continuations) but not yet substituted
  struct KeyValue
  {
    std::string key;
    std::string value;
    size_t line = 0;
  };

  using Token = std::variant<SectionHeader, KeyValue>;

  /// Returns the line on which the token started.
  size_t
  token_line(const Token& token);

  std::string
  to_string(const Token& token);

}  // namespace hini
