#include "section.hpp"

#include "errors.hpp"

#include <hini/util/str.hpp>

#include <stdexcept>

namespace hini
{
  Document::Document()
  {
    _nodes.push_back(Node{"root", std::nullopt, {}, {}, true});
  }

  Document::Node&
  Document::node(SectionID id)
  {
    if (id >= _nodes.size() or not _nodes[id].live)
      throw std::logic_error{fmt::format("section handle {} refers to a removed section", id)};
    return _nodes[id];
  }

  const Document::Node&
  Document::node(SectionID id) const
  {
    if (id >= _nodes.size() or not _nodes[id].live)
      throw std::logic_error{fmt::format("section handle {} refers to a removed section", id)};
    return _nodes[id];
  }

  SectionID
  Document::make_node(std::string name, SectionID parent)
  {
    const SectionID id = _nodes.size();
    auto& children = node(parent).children;
    auto [itr, inserted] = children.emplace(name, id);
    if (not inserted)
      throw std::invalid_argument{fmt::format("section '{}' already exists", name)};
    try
    {
      _nodes.push_back(Node{std::move(name), parent, {}, {}, true});
    }
    catch (const std::exception&)
    {
      // leave no link to a slot that was never created
      children.erase(itr);
      throw;
    }
    return id;
  }

  void
  Document::drop_subtree(SectionID id)
  {
    auto& n = node(id);
    for (const auto& [name, child] : n.children)
      drop_subtree(child);
    n.children.clear();
    n.keys.clear();
    n.live = false;
  }

  size_t
  Document::size() const
  {
    size_t live = 0;
    for (const auto& n : _nodes)
      if (n.live)
        ++live;
    return live;
  }

  const std::string&
  Section::name() const
  {
    return _doc->node(_id).name;
  }

  std::string
  Section::path() const
  {
    std::vector<std::string_view> parts;
    for (auto id = _id; _doc->node(id).parent; id = *_doc->node(id).parent)
      parts.push_back(_doc->node(id).name);
    return join(".", parts.rbegin(), parts.rend());
  }

  std::string
  Section::display_name() const
  {
    auto p = path();
    return p.empty() ? std::string{"root"} : p;
  }

  bool
  Section::has_key(std::string_view name) const
  {
    const auto& keys = _doc->node(_id).keys;
    return keys.find(std::string{name}) != keys.end();
  }

  const std::string&
  Section::get_key(std::string_view name) const
  {
    const auto& keys = _doc->node(_id).keys;
    auto itr = keys.find(std::string{name});
    if (itr == keys.end())
      throw missing_key{display_name(), std::string{name}};
    return itr->second;
  }

  std::string
  Section::get_key(std::string_view name, std::string default_value) const
  {
    const auto& keys = _doc->node(_id).keys;
    auto itr = keys.find(std::string{name});
    if (itr == keys.end())
      return default_value;
    return itr->second;
  }

  void
  Section::set_key(std::string name, std::string value)
  {
    _doc->node(_id).keys[std::move(name)] = std::move(value);
  }

  void
  Section::remove_key(std::string_view name)
  {
    _doc->node(_id).keys.erase(std::string{name});
  }

  const KeyMap&
  Section::keys() const
  {
    return _doc->node(_id).keys;
  }

  bool
  Section::has_section(std::string_view name) const
  {
    return find_section(name).has_value();
  }

  std::optional<Section>
  Section::find_section(std::string_view name) const
  {
    const auto& children = _doc->node(_id).children;
    auto itr = children.find(std::string{name});
    if (itr == children.end())
      return std::nullopt;
    return Section{*_doc, itr->second};
  }

  Section
  Section::get_section(std::string_view name) const
  {
    if (auto child = find_section(name))
      return *child;
    throw missing_section{display_name(), std::string{name}};
  }

  Section
  Section::add_section(std::string name)
  {
    if (auto existing = find_section(name))
      return *existing;
    return Section{*_doc, _doc->make_node(std::move(name), _id)};
  }

  Section
  Section::add_section(std::string name, const Section& source)
  {
    auto child = add_section(std::move(name));
    if (child != source)
      child.inherit(source);
    return child;
  }

  void
  Section::remove_section(std::string_view name)
  {
    auto child = find_section(name);
    if (not child)
      return;
    _doc->node(_id).children.erase(std::string{name});
    _doc->drop_subtree(child->_id);
  }

  std::vector<Section>
  Section::sections() const
  {
    std::vector<Section> result;
    const auto& children = _doc->node(_id).children;
    result.reserve(children.size());
    for (const auto& [name, id] : children)
      result.emplace_back(*_doc, id);
    return result;
  }

  Section
  Section::root() const
  {
    auto id = _id;
    while (auto up = _doc->node(id).parent)
      id = *up;
    return Section{*_doc, id};
  }

  bool
  Section::has_parent() const
  {
    return _doc->node(_id).parent.has_value();
  }

  std::optional<Section>
  Section::parent() const
  {
    if (auto up = _doc->node(_id).parent)
      return Section{*_doc, *up};
    return std::nullopt;
  }

  void
  Section::set_parent(Section new_parent)
  {
    auto& self = _doc->node(_id);
    if (not self.parent)
      throw std::logic_error{"cannot reparent the root section"};
    if (new_parent._doc != _doc)
      throw std::invalid_argument{"cannot move a section to another document"};
    if (*self.parent == new_parent._id)
      return;

    for (std::optional<SectionID> id = new_parent._id; id; id = _doc->node(*id).parent)
      if (*id == _id)
        throw std::logic_error{fmt::format(
            "cannot move [{}] below itself ([{}])", display_name(), new_parent.display_name())};

    auto& target = _doc->node(new_parent._id).children;
    if (target.count(self.name))
      throw std::invalid_argument{fmt::format(
          "[{}] already has a child named '{}'", new_parent.display_name(), self.name)};

    // attach first: if that throws nothing has changed
    target.emplace(self.name, _id);
    _doc->node(*self.parent).children.erase(self.name);
    self.parent = new_parent._id;
  }

  Section
  Section::resolve_section(std::string_view path, char separator) const
  {
    Section current = *this;
    if (path.empty())
      return current;
    for (auto part : split(path, std::string_view{&separator, 1}))
    {
      auto child = current.find_section(part);
      if (not child)
        throw lookup_error{std::string{path}, display_name()};
      current = *child;
    }
    return current;
  }

  void
  Section::inherit(const Section& other)
  {
    if (other == *this)
      return;
    // copy first: `other` may live in the same arena
    KeyMap copy = other.keys();
    auto& keys = _doc->node(_id).keys;
    for (auto& [key, value] : copy)
      keys[key] = std::move(value);
  }

}  // namespace hini
