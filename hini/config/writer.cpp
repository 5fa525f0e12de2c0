#include "section.hpp"

#include <hini/util/file.hpp>
#include <hini/util/logging.hpp>
#include <hini/util/str.hpp>

#include <fmt/std.h>

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace hini
{
  static auto logcat = log::Cat("ini.writer");

  namespace
  {
    bool
    has_outer_whitespace(std::string_view str)
    {
      return trim_whitespace(str).size() != str.size();
    }

    std::string
    escape(std::string_view value, char quote)
    {
      std::string result;
      result.reserve(value.size() + 2);
      for (char ch : value)
      {
        if (ch == '\n')
          result += "\\n";
        else if (ch == '\t')
          result += "\\t";
        else if (ch == '\\' or ch == quote)
        {
          result.push_back('\\');
          result.push_back(ch);
        }
        else
          result.push_back(ch);
      }
      return result;
    }

    std::string
    format_key(std::string_view key, const Format& format)
    {
      if (key.empty() or key.find_first_of("\r\n") != std::string_view::npos)
        throw std::invalid_argument{fmt::format("key '{}' cannot be written", key)};

      const bool needs_quotes = has_outer_whitespace(key)
          or key.find(format.assignment) != std::string_view::npos
          or key.front() == format.quote or key.front() == format.section_open
          or format.is_comment(key.front());
      if (not needs_quotes)
        return std::string{key};
      if (key.find(format.quote) != std::string_view::npos)
        throw std::invalid_argument{fmt::format("key '{}' cannot be written", key)};
      return fmt::format("{0}{1}{0}", format.quote, key);
    }

    std::string
    format_value(std::string_view value, const Format& format)
    {
      if (value.find('\r') != std::string_view::npos)
        throw std::invalid_argument{fmt::format("value '{}' cannot be written", value)};

      const auto triple = format.triple_quote();
      if (value.find('\n') != std::string_view::npos)
      {
        if (format.multiline_quotes and value.find(triple) == std::string_view::npos
            and value.back() != format.quote)
          return fmt::format("{0}{1}{0}", triple, value);
        if (format.process_escapes)
          return fmt::format("{0}{1}{0}", format.quote, escape(value, format.quote));
        throw std::invalid_argument{fmt::format("value '{}' cannot be written", value)};
      }

      const bool needs_quotes = not value.empty()
          and (has_outer_whitespace(value) or value.front() == format.quote
               or (format.line_continuation and value.back() == format.continuation));
      if (not needs_quotes)
        return std::string{value};
      if (format.process_escapes)
        return fmt::format("{0}{1}{0}", format.quote, escape(value, format.quote));
      // without escapes a quote anywhere inside would end the value early
      if (value.find(format.quote) != std::string_view::npos)
        throw std::invalid_argument{fmt::format("value '{}' cannot be written", value)};
      return fmt::format("{0}{1}{0}", format.quote, value);
    }

    void
    write_keys(std::string& out, const KeyMap& section_keys, const Format& format)
    {
      std::vector<std::pair<std::string, std::string>> keys{
          section_keys.begin(), section_keys.end()};
      std::sort(keys.begin(), keys.end());
      for (const auto& [key, value] : keys)
        fmt::format_to(
            std::back_inserter(out),
            "{} {} {}\n",
            format_key(key, format),
            format.assignment,
            format_value(value, format));
    }
  }  // namespace

  std::string
  Document::to_string(const Format& format) const
  {
    const auto& top = node(root_id);
    std::string out;
    write_keys(out, top.keys, format);

    std::vector<std::pair<std::string, SectionID>> children{
        top.children.begin(), top.children.end()};
    std::sort(children.begin(), children.end());
    for (const auto& [name, id] : children)
    {
      if (name.empty() or has_outer_whitespace(name)
          or name.find_first_of("\r\n") != std::string::npos
          or name.find(format.inherit) != std::string::npos
          or name.find(format.section_close) != std::string::npos)
        throw std::invalid_argument{fmt::format("section name '{}' cannot be written", name)};

      const auto& child = node(id);
      if (not out.empty())
        out.push_back('\n');
      fmt::format_to(
          std::back_inserter(out), "{}{}{}\n", format.section_open, name, format.section_close);
      write_keys(out, child.keys, format);

      // headers always open a child of the root, deeper sections have no spelling
      for (const auto& [nested, nested_id] : child.children)
        log::warning(
            logcat, "section [{}.{}] is nested too deeply to be written, skipping", name, nested);
    }
    return out;
  }

  void
  Document::save(const fs::path& filename, const Format& format) const
  {
    util::buffer_to_file(filename, to_string(format));
    log::debug(logcat, "saved {} sections to {}", node(root_id).children.size(), filename);
  }

}  // namespace hini
