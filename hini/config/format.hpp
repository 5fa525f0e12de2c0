#pragma once

#include <string>

namespace hini
{
  /// Character classes and optional behaviours of the tokenizer.  A Format is fixed for the
  /// lifetime of a Reader; pick another one by constructing another Reader.
  struct Format
  {
    /// any of these as the first non-blank character makes the line a comment
    std::string comment_markers = "#;";
    char assignment = '=';
    char quote = '"';
    /// trailing marker joining an unquoted value with the next line
    char continuation = '\\';
    char section_open = '[';
    char section_close = ']';
    /// separates a section name from the section it inherits from: [child : parent]
    char inherit = ':';
    char path_separator = '.';
    char lookup_marker = '%';

    /// resolve \n \t \\ \" inside quoted values
    bool process_escapes = true;
    /// """...""" values spanning several lines
    bool multiline_quotes = true;
    bool line_continuation = true;

    bool
    is_comment(char ch) const
    {
      return comment_markers.find(ch) != std::string::npos;
    }

    std::string
    triple_quote() const
    {
      return std::string(3, quote);
    }

    /// Everything optional switched off: values are taken literally.
    static Format
    plain()
    {
      Format f;
      f.process_escapes = false;
      f.multiline_quotes = false;
      f.line_continuation = false;
      return f;
    }
  };

}  // namespace hini
