#include <xt/expat_reader.hpp>
#include <xt/xml_element.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace xt {

  xml_element::xml_element(xml_reader& reader)
      : name_(reader.name()), namespaces_(reader.in_scope_namespaces()),
        line_(reader.line()) {
    for (std::size_t i = 0; i < reader.attribute_count(); ++i) {
      attributes_.push_back(
          {reader.attribute_name(i), std::string(reader.attribute_value(i))});
    }

    std::size_t start_depth = reader.depth();
    while (reader.read()) {
      switch (reader.node_type()) {
        case xml_node_type::start_element:
          children_.emplace_back(reader);
          break;
        case xml_node_type::characters:
          text_ += reader.text();
          break;
        case xml_node_type::end_element:
          if (reader.depth() == start_depth) { return; }
          break;
      }
    }
    throw std::runtime_error("unexpected end of input while parsing element '" +
                             name_.local_name() + "'");
  }

  std::optional<std::string>
  xml_element::attribute(const qname& name) const {
    for (const auto& attr : attributes_) {
      if (attr.name == name) return attr.value;
    }
    return std::nullopt;
  }

  std::optional<std::string>
  xml_element::attribute(std::string_view local) const {
    for (const auto& attr : attributes_) {
      if (attr.name.namespace_uri().empty() && attr.name.local_name() == local)
        return attr.value;
    }
    return std::nullopt;
  }

  std::optional<qname>
  xml_element::resolve_qname(std::string_view prefixed,
                             bool use_default) const {
    auto colon = prefixed.find(':');
    std::string_view prefix;
    std::string_view local = prefixed;
    if (colon != std::string_view::npos) {
      prefix = prefixed.substr(0, colon);
      local = prefixed.substr(colon + 1);
    } else if (!use_default) {
      return qname{"", std::string(local)};
    }

    auto it = namespaces_.find(prefix);
    if (it == namespaces_.end()) {
      // An unbound default namespace means "no namespace"
      if (prefix.empty()) return qname{"", std::string(local)};
      return std::nullopt;
    }
    return qname{it->second, std::string(local)};
  }

  bool
  xml_element::has_text() const {
    return text_.find_first_not_of(" \t\r\n") != std::string::npos;
  }

  xml_element
  parse_xml(std::string_view xml) {
    expat_reader reader(xml);
    while (reader.read()) {
      if (reader.node_type() == xml_node_type::start_element)
        return xml_element(reader);
    }
    throw std::runtime_error("XML parse error: no root element");
  }

  std::string
  read_text_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("cannot open file: " + path.string());
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }

  xml_element
  load_xml_file(const std::filesystem::path& path) {
    std::string content = read_text_file(path);
    try {
      return parse_xml(content);
    } catch (const std::runtime_error& e) {
      throw std::runtime_error(path.string() + ": " + e.what());
    }
  }

} // namespace xt
