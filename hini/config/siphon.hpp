#pragma once

#include "section.hpp"

#include <hini/util/str.hpp>

#include <fmt/format.h>

#include <functional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace hini
{
  /// Converts the text of [section]:key to a T.  Strings are taken verbatim, bools accept
  /// true/false/on/off/yes/no/1/0, integers must be consumed entirely, anything else goes through
  /// operator>>.
  ///
  /// @throws std::invalid_argument if the text is not a valid T
  template <typename T>
  T
  value_from_string(std::string_view section, std::string_view key, const std::string& input)
  {
    if constexpr (std::is_same_v<T, std::string>)
    {
      return input;
    }
    else if constexpr (std::is_same_v<T, bool>)
    {
      if (is_true_value(input))
        return true;
      if (is_false_value(input))
        return false;
      throw std::invalid_argument{
          fmt::format("[{}]:{} = '{}' is not a valid bool", section, key, input)};
    }
    else if constexpr (std::is_integral_v<T>)
    {
      T value{};
      if (not parse_int(trim_whitespace(input), value))
        throw std::invalid_argument{fmt::format(
            "[{}]:{} = '{}' is not a valid {}integer",
            section,
            key,
            input,
            std::is_signed_v<T> ? "" : "unsigned ")};
      return value;
    }
    else
    {
      std::istringstream iss(input);
      T t;
      iss >> t;
      if (iss.fail() or not(iss >> std::ws).eof())
        throw std::invalid_argument{fmt::format(
            "[{}]:{} = '{}' is not a valid {}",
            section,
            key,
            input,
            std::is_floating_point_v<T> ? "number" : "value")};
      return t;
    }
  }

  /// Maps the keys of one section onto the members of a plain struct through an explicit table.
  ///
  ///     struct Server { std::string host; uint16_t port = 80; bool tls = false; };
  ///
  ///     auto server = hini::Siphon<Server>{"server"}
  ///                       .field("host", &Server::host)
  ///                       .field("port", &Server::port)
  ///                       .field("tls", &Server::tls)(doc);
  ///
  /// A missing section or key leaves the member at its default.
  template <typename Record>
  class Siphon
  {
   public:
    explicit Siphon(std::string section) : _section{std::move(section)}
    {}

    template <typename T>
    Siphon&
    field(std::string key, T Record::*member)
    {
      _fields.push_back(Field{
          std::move(key),
          [member](Record& record, std::string_view section, std::string_view key,
                   const std::string& input) {
            record.*member = value_from_string<T>(section, key, input);
          }});
      return *this;
    }

    const std::string&
    section() const
    {
      return _section;
    }

    /// Assigns every mapped key present in the section below `root` to `record`.
    void
    fill(const Section& root, Record& record) const
    {
      auto section = root.find_section(_section);
      if (not section)
        return;
      for (const auto& field : _fields)
      {
        if (section->has_key(field.key))
          field.assign(record, _section, field.key, section->get_key(field.key));
      }
    }

    Record
    operator()(const Section& root) const
    {
      Record record{};
      fill(root, record);
      return record;
    }

    Record
    operator()(Document& doc) const
    {
      return (*this)(doc.root());
    }

   private:
    struct Field
    {
      std::string key;
      std::function<void(Record&, std::string_view, std::string_view, const std::string&)> assign;
    };

    std::string _section;
    std::vector<Field> _fields;
  };

}  // namespace hini
