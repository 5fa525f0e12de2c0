#pragma once

#include <fmt/format.h>

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace hini
{
  /// Base of every error raised while reading or querying a document.
  struct ini_error : std::runtime_error
  {
    using std::runtime_error::runtime_error;
  };

  /// The tokenizer hit malformed input.  Scanning stops at the first one.
  struct syntax_error : ini_error
  {
    syntax_error(size_t line_, std::string text_, std::string_view reason)
        : ini_error{fmt::format("line {}: {}: '{}'", line_, reason, text_)}
        , line{line_}
        , text{std::move(text_)}
    {}

    /// 1-based line number of the offending line
    size_t line;
    /// raw text of the offending line
    std::string text;
  };

  /// A dotted path (inheritance target, %lookup% or resolve_section argument) did not lead to an
  /// existing section or key.
  struct lookup_error : ini_error
  {
    lookup_error(std::string path_, std::string origin_)
        : ini_error{fmt::format("cannot resolve '{}' (in {})", path_, origin_)}
        , path{std::move(path_)}
        , origin{std::move(origin_)}
    {}

    std::string path;
    std::string origin;
  };

  struct missing_key : ini_error
  {
    missing_key(std::string section_, std::string key_)
        : ini_error{fmt::format("key '{}' does not exist in [{}]", key_, section_)}
        , section{std::move(section_)}
        , key{std::move(key_)}
    {}

    std::string section;
    std::string key;
  };

  struct missing_section : ini_error
  {
    missing_section(std::string section_, std::string name_)
        : ini_error{fmt::format("section '{}' does not exist in [{}]", name_, section_)}
        , section{std::move(section_)}
        , name{std::move(name_)}
    {}

    std::string section;
    std::string name;
  };

}  // namespace hini
