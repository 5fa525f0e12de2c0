#include "ini.hpp"

#include <hini/util/file.hpp>
#include <hini/util/logging.hpp>

#include <fmt/std.h>


namespace hini
{
  static auto logcat = log::Cat("ini");

  void
  Document::parse_string(std::string_view data, bool do_lookups, Format format)
  {
    Reader reader{data, format};
    Section current = root();

    while (auto token = reader.next())
    {
      if (auto* header = std::get_if<SectionHeader>(&*token))
      {
        // headers always open a section directly below the root
        current = root();
        if (header->inherits)
        {
          std::optional<Section> base;
          try
          {
            base = current.resolve_section(*header->inherits, format.path_separator);
          }
          catch (const lookup_error&)
          {
            throw lookup_error{*header->inherits, fmt::format("line {}", header->line)};
          }
          log::debug(logcat, "[{}] inherits {} keys from [{}]", header->name, base->keys().size(),
              base->display_name());
          current = current.add_section(header->name, *base);
        }
        else
        {
          if (current.has_section(header->name))
            log::debug(logcat, "merging repeated section [{}]", header->name);
          current = current.add_section(header->name);
        }
      }
      else
      {
        auto& kv = std::get<KeyValue>(*token);
        current.set_key(std::move(kv.key), std::move(kv.value));
      }
    }

    log::debug(logcat, "parsed {} lines into {} sections", reader.line_number(), size());
    if (do_lookups)
      resolve_lookups(format);
  }

  void
  Document::parse_file(const fs::path& filename, bool do_lookups, Format format)
  {
    const auto data = util::file_to_string(filename);
    log::debug(logcat, "parsing {}", filename);
    parse_string(data, do_lookups, std::move(format));
  }

  Document
  Document::from_string(std::string_view data, bool do_lookups, Format format)
  {
    Document doc;
    doc.parse_string(data, do_lookups, std::move(format));
    return doc;
  }

  Document
  Document::from_file(const fs::path& filename, bool do_lookups, Format format)
  {
    Document doc;
    doc.parse_file(filename, do_lookups, std::move(format));
    return doc;
  }

}  // namespace hini
