#pragma once

#include <xt/qname.hpp>
#include <xt/xml_reader.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace xt {

  struct xml_attribute {
    qname name;
    std::string value;

    bool
    operator==(const xml_attribute&) const = default;
  };

  // Element tree node. Character data directly inside the element is
  // concatenated into text(); mixed content ordering is not kept.
  class xml_element {
    qname name_;
    std::vector<xml_attribute> attributes_;
    std::vector<xml_element> children_;
    std::string text_;
    xml_reader::namespace_map namespaces_;
    std::size_t line_ = 0;

  public:
    xml_element() = default;

    // Builds the subtree rooted at the start element the reader is on.
    explicit xml_element(xml_reader& reader);

    const qname&
    name() const {
      return name_;
    }

    const std::vector<xml_attribute>&
    attributes() const {
      return attributes_;
    }

    const std::vector<xml_element>&
    children() const {
      return children_;
    }

    const std::string&
    text() const {
      return text_;
    }

    std::size_t
    line() const {
      return line_;
    }

    std::optional<std::string>
    attribute(const qname& name) const;

    // Unqualified attribute lookup, the common case for schema documents.
    std::optional<std::string>
    attribute(std::string_view local) const;

    // Resolves a prefixed name such as "xs:string" against the namespace
    // bindings in scope at this element. Unprefixed names take the default
    // namespace when `use_default` is set. Returns nullopt for an unbound
    // prefix.
    std::optional<qname>
    resolve_qname(std::string_view prefixed, bool use_default = true) const;

    bool
    has_text() const;
  };

  xml_element
  parse_xml(std::string_view xml);

  // Throws std::runtime_error when the file cannot be read or is malformed.
  xml_element
  load_xml_file(const std::filesystem::path& path);

  std::string
  read_text_file(const std::filesystem::path& path);

} // namespace xt
