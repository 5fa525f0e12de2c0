#pragma once

#include "format.hpp"

#include <hini/util/fs.hpp>

#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace hini
{
  class Document;

  using SectionID = size_t;
  using KeyMap = std::unordered_map<std::string, std::string>;

  /// Handle to one section of a Document.  Handles are cheap to copy and stay valid as the
  /// document grows; they are invalidated by removing the section (or an ancestor) and by moving
  /// the Document.  All sections are owned by the Document, a handle owns nothing.
  class Section
  {
   public:
    Section(Document& doc, SectionID id) : _doc{&doc}, _id{id}
    {}

    const std::string&
    name() const;

    /// Dotted path from the root to this section; empty for the root itself.
    std::string
    path() const;

    bool
    has_key(std::string_view name) const;

    /// Throws missing_key if there is no such key.
    const std::string&
    get_key(std::string_view name) const;

    std::string
    get_key(std::string_view name, std::string default_value) const;

    void
    set_key(std::string name, std::string value);

    void
    remove_key(std::string_view name);

    const KeyMap&
    keys() const;

    bool
    has_section(std::string_view name) const;

    /// Throws missing_section if there is no such child.
    Section
    get_section(std::string_view name) const;

    std::optional<Section>
    find_section(std::string_view name) const;

    /// Returns the child called `name`, creating an empty one if needed.
    Section
    add_section(std::string name);

    /// Merges the keys of `source` into the child called `name` (created if needed); keys already
    /// present are overwritten.
    Section
    add_section(std::string name, const Section& source);

    /// Drops the child and everything below it.  Does nothing if there is no such child.
    void
    remove_section(std::string_view name);

    /// Children in container order (unspecified).
    std::vector<Section>
    sections() const;

    Section
    root() const;

    bool
    has_parent() const;

    std::optional<Section>
    parent() const;

    /// Moves this section (with its subtree) under `new_parent`.  Throws, without changing
    /// anything, when this is the root, when `new_parent` is this section or below it, when
    /// `new_parent` belongs to another document, or when `new_parent` already has a child of the
    /// same name.
    void
    set_parent(Section new_parent);

    /// Walks a dotted path of child names ("foo.bar") starting here.  An empty path is this
    /// section.  Throws lookup_error naming the full path.
    Section
    resolve_section(std::string_view path, char separator = '.') const;

    /// path(), or "root" for the root; used in messages.
    std::string
    display_name() const;

    /// Copies every key of `other` into this section.
    void
    inherit(const Section& other);

    bool
    operator==(const Section& other) const
    {
      return _doc == other._doc and _id == other._id;
    }

    bool
    operator!=(const Section& other) const
    {
      return not(*this == other);
    }

   private:
    Document* _doc;
    SectionID _id;
  };

  /// A parsed configuration: a tree of named sections, all stored in one arena.
  ///
  ///     auto doc = hini::Document::from_string("[a]\nx = 1\n[b : a]\ny = %x%\n");
  ///     doc.root().get_section("b").get_key("y");  // "1"
  ///
  class Document
  {
   public:
    Document();

    Document(const Document&) = delete;
    Document&
    operator=(const Document&) = delete;
    Document(Document&&) = default;
    Document&
    operator=(Document&&) = default;

    Section
    root()
    {
      return Section{*this, root_id};
    }

    /// Tokenizes `data` and merges it into this document, then resolves %lookups% unless
    /// `do_lookups` is false.  Throws syntax_error or lookup_error; the document should be
    /// discarded after a throw.
    void
    parse_string(std::string_view data, bool do_lookups = true, Format format = {});

    void
    parse_file(const fs::path& filename, bool do_lookups = true, Format format = {});

    /// Replaces every %path% in every value, depth first from the root.
    void
    resolve_lookups(const Format& format = {});

    /// Serializes the document; reading the result back yields the same sections and keys.
    std::string
    to_string(const Format& format = {}) const;

    void
    save(const fs::path& filename, const Format& format = {}) const;

    static Document
    from_string(std::string_view data, bool do_lookups = true, Format format = {});

    static Document
    from_file(const fs::path& filename, bool do_lookups = true, Format format = {});

    /// Number of live sections, the root included.
    size_t
    size() const;

    static constexpr SectionID root_id = 0;

   private:
    friend class Section;

    struct Node
    {
      std::string name;
      std::optional<SectionID> parent;
      KeyMap keys;
      std::unordered_map<std::string, SectionID> children;
      bool live = true;
    };

    Node&
    node(SectionID id);

    const Node&
    node(SectionID id) const;

    SectionID
    make_node(std::string name, SectionID parent);

    void
    drop_subtree(SectionID id);

    // nodes never move once created; references handed out by keys() and get_key() stay valid
    std::deque<Node> _nodes;
  };

}  // namespace hini
