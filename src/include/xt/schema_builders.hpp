#pragma once

#include <xt/schema_component.hpp>
#include <xt/xml_element.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

namespace xt {

  class build_context;

  using component_builder = std::function<std::shared_ptr<schema_component>(
      const xml_element&, build_context&)>;

  // A sub-builder of the schema construction pipeline. The metadata travels
  // with the callable so wrappers can keep it for diagnostics.
  struct named_builder {
    std::string name;
    std::string description;
    component_builder build;
    bool observed = false;
  };

  using builder_table = std::map<std::string, named_builder>;

  inline const std::string element_builder_key = "element_class";
  inline const std::string attribute_builder_key = "attribute_class";
  inline const std::string complex_type_builder_key = "complex_type_class";
  inline const std::string simple_type_builder_key = "simple_type_class";
  inline const std::string group_builder_key = "group_class";
  inline const std::string attribute_group_builder_key = "attribute_group_class";
  inline const std::string any_element_builder_key = "any_element_class";
  inline const std::string any_attribute_builder_key = "any_attribute_class";

  // The builders a plain schema uses, keyed as above.
  builder_table
  default_builders();

  // State handed to every builder while one schema document is built. Builders
  // recurse through build() so that nested components go through the table
  // (and through any wrappers installed in it).
  class build_context {
    schema& schema_;
    const builder_table& builders_;
    std::size_t depth_ = 0;

  public:
    build_context(schema& s, const builder_table& builders)
        : schema_(s), builders_(builders) {}

    // Runs the builder registered under `key` and registers the result with
    // the schema. Throws std::out_of_range for an unknown key.
    std::shared_ptr<schema_component>
    build(const std::string& key, const xml_element& elem);

    template <typename T>
    std::shared_ptr<T>
    build_as(const std::string& key, const xml_element& elem) {
      auto component = build(key, elem);
      if (!component) return nullptr;
      auto typed = std::dynamic_pointer_cast<T>(component);
      if (!typed) {
        throw std::runtime_error("builder '" + key +
                                 "' produced an unexpected " +
                                 std::string(to_string(component->kind())));
      }
      return typed;
    }

    // True while building a direct child of xs:schema.
    bool
    top_level() const {
      return depth_ == 1;
    }

    void
    error(const xml_element& elem, std::string message);

    const std::string&
    target_namespace() const;

    bool
    qualified_elements() const;

    bool
    qualified_attributes() const;

    schema_version
    version() const;
  };

} // namespace xt
