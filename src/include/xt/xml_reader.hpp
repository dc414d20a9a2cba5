#pragma once

#include <xt/qname.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace xt {

  enum class xml_node_type {
    start_element,
    end_element,
    characters,
  };

  // Forward-only pull interface over an XML document. Accessors describe the
  // node the last successful read() stopped on.
  class xml_reader {
  public:
    using namespace_map = std::map<std::string, std::string, std::less<>>;

    virtual ~xml_reader() = default;

    virtual bool
    read() = 0;

    virtual xml_node_type
    node_type() const = 0;

    virtual const qname&
    name() const = 0;

    virtual std::size_t
    attribute_count() const = 0;

    virtual const qname&
    attribute_name(std::size_t index) const = 0;

    virtual std::string_view
    attribute_value(std::size_t index) const = 0;

    virtual std::string_view
    text() const = 0;

    virtual std::size_t
    depth() const = 0;

    // 1-based source line of the current node, 0 when unknown.
    virtual std::size_t
    line() const = 0;

    // Empty when the prefix is not bound at the current node.
    virtual std::string_view
    namespace_uri_for_prefix(std::string_view prefix) const = 0;

    // Prefix bindings in scope at the current node; "" is the default
    // namespace.
    virtual namespace_map
    in_scope_namespaces() const = 0;
  };

} // namespace xt
