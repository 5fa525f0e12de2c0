#include "reader.hpp"

#include "errors.hpp"

#include <hini/util/logging.hpp>
#include <hini/util/str.hpp>

namespace hini
{
  static auto logcat = log::Cat("ini.reader");

  Reader::Reader(std::string_view data, Format format) : _data{data}, _format{std::move(format)}
  {}

  bool
  Reader::read_line(std::string_view& line)
  {
    if (_pos >= _data.size())
      return false;
    auto end = _data.find('\n', _pos);
    if (end == std::string_view::npos)
      end = _data.size();
    line = _data.substr(_pos, end - _pos);
    _pos = end + 1;
    if (not line.empty() and line.back() == '\r')
      line.remove_suffix(1);
    ++_lineno;
    return true;
  }

  std::optional<Token>
  Reader::next()
  {
    std::string_view raw;
    while (read_line(raw))
    {
      auto line = trim_whitespace(raw);

      // Skip blank lines and comments; markers only count at the start of the line
      if (line.empty() or _format.is_comment(line.front()))
        continue;

      Token token = line.front() == _format.section_open ? Token{parse_header(raw, line)}
                                                         : Token{parse_assignment(raw, line)};
      log::trace(logcat, "line {}: {}", token_line(token), to_string(token));
      return token;
    }
    return std::nullopt;
  }

  SectionHeader
  Reader::parse_header(std::string_view raw, std::string_view line) const
  {
    if (line.size() < 2 or line.back() != _format.section_close)
      throw syntax_error{_lineno, std::string{raw}, "malformed section header"};

    line.remove_prefix(1);
    line.remove_suffix(1);

    SectionHeader header;
    header.line = _lineno;
    if (auto pos = line.find(_format.inherit); pos != std::string_view::npos)
    {
      auto parent = trim_whitespace(line.substr(pos + 1));
      if (parent.empty())
        throw syntax_error{_lineno, std::string{raw}, "empty inheritance target"};
      header.inherits = std::string{parent};
      line = line.substr(0, pos);
    }

    auto name = trim_whitespace(line);
    if (name.empty())
      throw syntax_error{_lineno, std::string{raw}, "empty section name"};
    header.name = name;
    return header;
  }

  KeyValue
  Reader::parse_assignment(std::string_view raw, std::string_view line)
  {
    KeyValue kv;
    kv.line = _lineno;

    std::string_view rest;
    if (line.front() == _format.quote)
    {
      // "quoted key" = value; the key may contain the assignment marker
      auto close = line.find(_format.quote, 1);
      if (close == std::string_view::npos)
        throw syntax_error{_lineno, std::string{raw}, "unterminated quoted key"};
      kv.key = line.substr(1, close - 1);
      auto after = trim_left(line.substr(close + 1));
      if (not after.empty())
      {
        if (after.front() != _format.assignment)
          throw syntax_error{_lineno, std::string{raw}, "unexpected text after quoted key"};
        rest = after.substr(1);
      }
    }
    else
    {
      // a line without the marker is a key with an empty value
      auto delim = line.find(_format.assignment);
      kv.key = trim_whitespace(line.substr(0, delim));
      if (delim != std::string_view::npos)
        rest = line.substr(delim + 1);
    }

    if (kv.key.empty())
      throw syntax_error{_lineno, std::string{raw}, "empty key"};

    kv.value = parse_value(raw, trim_whitespace(rest));
    return kv;
  }

  std::string
  Reader::parse_value(std::string_view raw, std::string_view value)
  {
    if (value.empty())
      return {};

    const auto triple = _format.triple_quote();
    if (_format.multiline_quotes and starts_with(value, triple))
    {
      // take the rest of the raw line: whitespace after the opening delimiter is content
      const char* tail = value.data() + triple.size();
      return read_multiline(raw, {tail, static_cast<size_t>(raw.data() + raw.size() - tail)});
    }

    if (value.front() == _format.quote)
      return unquote(raw, value);

    return read_continued(value);
  }

  std::string
  Reader::read_multiline(std::string_view raw, std::string_view tail)
  {
    const auto triple = _format.triple_quote();
    const size_t start = _lineno;
    std::string result;
    std::string_view current = tail;
    for (;;)
    {
      if (auto close = current.find(triple); close != std::string_view::npos)
      {
        result.append(current.substr(0, close));
        if (not trim_whitespace(current.substr(close + triple.size())).empty())
          throw syntax_error{
              _lineno, std::string{_lineno == start ? raw : current}, "text after closing quotes"};
        return result;
      }
      result.append(current);

      if (not read_line(current))
        throw syntax_error{start, std::string{raw}, "unterminated multi-line value"};
      result.push_back('\n');
    }
  }

  std::string
  Reader::unquote(std::string_view raw, std::string_view value) const
  {
    std::string result;
    result.reserve(value.size());
    for (size_t i = 1; i < value.size(); ++i)
    {
      char ch = value[i];
      if (ch == _format.quote)
      {
        if (i + 1 != value.size())
          throw syntax_error{_lineno, std::string{raw}, "text after closing quote"};
        return result;
      }
      if (ch == '\\' and _format.process_escapes and i + 1 < value.size())
      {
        ch = value[++i];
        switch (ch)
        {
          case 'n':
            result.push_back('\n');
            break;
          case 't':
            result.push_back('\t');
            break;
          case '\\':
            result.push_back('\\');
            break;
          default:
            if (ch != _format.quote)
              result.push_back('\\');
            result.push_back(ch);
        }
        continue;
      }
      result.push_back(ch);
    }
    throw syntax_error{_lineno, std::string{raw}, "unterminated quoted value"};
  }

  std::string
  Reader::read_continued(std::string_view value)
  {
    std::string result{value};
    while (_format.line_continuation and not result.empty()
           and result.back() == _format.continuation)
    {
      result.pop_back();
      result.resize(trim_right(result).size());

      std::string_view next;
      if (not read_line(next))
        break;
      auto piece = trim_whitespace(next);
      if (not result.empty() and not piece.empty())
        result.push_back(' ');
      result.append(piece);
    }
    return result;
  }

}  // namespace hini
