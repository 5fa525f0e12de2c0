#pragma once

#include "format.hpp"
#include "token.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace hini
{
  /// Line oriented tokenizer.  Pulls one Token at a time out of the input text; the text must
  /// outlive the Reader.
  ///
  ///     Reader reader{text};
  ///     while (auto token = reader.next())
  ///       ...
  ///
  /// Throws syntax_error on the first malformed line, after which the Reader must not be used.
  class Reader
  {
   public:
    explicit Reader(std::string_view data, Format format = {});

    /// Returns the next section header or key/value pair, or nullopt once the input is exhausted.
    std::optional<Token>
    next();

    /// Number of the last line consumed (1-based, 0 before the first call to next()).
    size_t
    line_number() const
    {
      return _lineno;
    }

   private:
    bool
    read_line(std::string_view& line);

    SectionHeader
    parse_header(std::string_view raw, std::string_view line) const;

    KeyValue
    parse_assignment(std::string_view raw, std::string_view line);

    std::string
    parse_value(std::string_view raw, std::string_view value);

    std::string
    read_multiline(std::string_view raw, std::string_view tail);

    std::string
    unquote(std::string_view raw, std::string_view value) const;

    std::string
    read_continued(std::string_view value);

    std::string_view _data;
    size_t _pos = 0;
    size_t _lineno = 0;
    Format _format;
  };

}  // namespace hini
