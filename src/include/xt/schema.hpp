#pragma once

#include <xt/attribute_decl.hpp>
#include <xt/attribute_group.hpp>
#include <xt/complex_type.hpp>
#include <xt/element_decl.hpp>
#include <xt/model_group.hpp>
#include <xt/qname.hpp>
#include <xt/schema_builders.hpp>
#include <xt/simple_type.hpp>
#include <xt/wildcard.hpp>
#include <xt/xml_element.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <ostream>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace xt {

  struct schema_error {
    std::string message;
    std::size_t line = 0;

    friend std::ostream&
    operator<<(std::ostream& os, const schema_error& e) {
      if (e.line != 0) os << "line " << e.line << ": ";
      return os << e.message;
    }
  };

  // An XSD schema built from one document. Construction is lax: problems in
  // the schema are collected in errors() rather than thrown. Only unreadable
  // or malformed documents, and documents that are not xs:schema, throw
  // std::runtime_error.
  class schema {
    std::filesystem::path source_;
    schema_version version_ = schema_version::v1_0;
    std::string target_namespace_;
    bool qualified_elements_ = false;
    bool qualified_attributes_ = false;

    std::vector<std::shared_ptr<schema_component>> components_;
    std::unordered_set<const schema_component*> owned_;
    std::unordered_map<qname, const element_decl*> elements_;
    std::unordered_map<qname, const attribute_decl*> attributes_;
    std::unordered_map<qname, const complex_type*> complex_types_;
    std::unordered_map<qname, const simple_type*> simple_types_;
    std::unordered_map<qname, const model_group*> groups_;
    std::unordered_map<qname, const attribute_group*> attribute_groups_;
    std::vector<schema_error> errors_;

    friend class build_context;

    void
    build(const xml_element& root, const builder_table& builders);

    void
    add_global(const std::shared_ptr<schema_component>& component);

    void
    resolve();

  public:
    schema(const std::filesystem::path& path,
           schema_version version = schema_version::v1_0,
           const builder_table& builders = default_builders());

    schema(const xml_element& document, schema_version version,
           const builder_table& builders = default_builders());

    schema(const schema&) = delete;
    schema&
    operator=(const schema&) = delete;

    const std::filesystem::path&
    source() const {
      return source_;
    }

    schema_version
    version() const {
      return version_;
    }

    const std::string&
    target_namespace() const {
      return target_namespace_;
    }

    const std::vector<schema_error>&
    errors() const {
      return errors_;
    }

    bool
    is_valid() const {
      return errors_.empty();
    }

    // Every component built for this schema, in build order.
    const std::vector<std::shared_ptr<schema_component>>&
    components() const {
      return components_;
    }

    bool
    owns(const schema_component* component) const {
      return owned_.count(component) != 0;
    }

    const element_decl*
    find_element(const qname& name) const;

    const attribute_decl*
    find_attribute(const qname& name) const;

    const complex_type*
    find_complex_type(const qname& name) const;

    const simple_type*
    find_simple_type(const qname& name) const;

    const model_group*
    find_group(const qname& name) const;

    const attribute_group*
    find_attribute_group(const qname& name) const;

    // Validates an instance document and returns its errors.
    std::vector<schema_error>
    validate(const xml_element& document) const;

    std::vector<schema_error>
    validate(const std::filesystem::path& instance) const;
  };

} // namespace xt
