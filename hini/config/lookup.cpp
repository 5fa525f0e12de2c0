#include "errors.hpp"
#include "section.hpp"

#include <hini/util/logging.hpp>
#include <hini/util/str.hpp>

namespace hini
{
  static auto logcat = log::Cat("ini.lookup");

  namespace
  {
    /// Fetches the value a %path% marker refers to.  A leading separator anchors the path at the
    /// root, otherwise it starts from `section`; the last element names the key.
    std::string
    lookup_value(
        const Section& section,
        std::string_view key,
        std::string_view path,
        const Format& format)
    {
      const auto origin = fmt::format("[{}]:{}", section.display_name(), key);
      const char sep = format.path_separator;

      Section anchor = section;
      std::string_view rel = path;
      if (not rel.empty() and rel.front() == sep)
      {
        anchor = section.root();
        rel.remove_prefix(1);
      }

      std::string_view sect_path;
      std::string_view name = rel;
      if (auto pos = rel.rfind(sep); pos != std::string_view::npos)
      {
        sect_path = rel.substr(0, pos);
        name = rel.substr(pos + 1);
      }

      std::optional<Section> target;
      try
      {
        target = anchor.resolve_section(sect_path, sep);
      }
      catch (const lookup_error&)
      {
        throw lookup_error{std::string{path}, origin};
      }
      if (not target->has_key(name))
        throw lookup_error{std::string{path}, origin};
      return target->get_key(name);
    }

    /// Replaces every complete %...% in `value`.  Inserted text is never rescanned and an
    /// unmatched trailing marker is kept as is.
    std::string
    substitute(
        const Section& section, std::string_view key, std::string_view value, const Format& format)
    {
      std::string result;
      result.reserve(value.size());
      std::optional<size_t> start;
      for (size_t i = 0; i < value.size(); ++i)
      {
        if (value[i] != format.lookup_marker)
        {
          if (not start)
            result.push_back(value[i]);
          continue;
        }
        if (not start)
        {
          start = i;
          continue;
        }
        auto path = value.substr(*start + 1, i - *start - 1);
        auto replacement = lookup_value(section, key, path, format);
        log::debug(logcat, "[{}]:{} {}{}{} -> '{}'", section.display_name(), key,
            format.lookup_marker, path, format.lookup_marker, replacement);
        result.append(replacement);
        start.reset();
      }
      if (start)
        result.append(value.substr(*start));
      return result;
    }

    void
    resolve_section(Section section, const Format& format)
    {
      // values are rewritten in place: a later key referring to an earlier one sees the
      // substituted text, one referring to a section not yet visited sees the raw text
      for (const auto& [key, value] : section.keys())
      {
        if (value.find(format.lookup_marker) == std::string::npos)
          continue;
        section.set_key(key, substitute(section, key, value, format));
      }
      for (auto& child : section.sections())
        resolve_section(child, format);
    }
  }  // namespace

  void
  Document::resolve_lookups(const Format& format)
  {
    resolve_section(root(), format);
  }

}  // namespace hini
