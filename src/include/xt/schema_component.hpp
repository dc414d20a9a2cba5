#pragma once

#include <xt/qname.hpp>
#include <xt/schema_fwd.hpp>

#include <cstddef>
#include <string_view>

namespace xt {

  // Common base of everything a schema builder produces. Components are
  // handed around as std::shared_ptr<schema_component>; the schema keeps
  // every component it built alive and references between components are
  // plain non-owning pointers filled in during resolution.
  class schema_component {
    component_kind kind_;
    qname name_;
    std::size_t line_ = 0;
    bool global_ = false;

  protected:
    schema_component(component_kind kind, qname name, std::size_t line)
        : kind_(kind), name_(std::move(name)), line_(line) {}

  public:
    virtual ~schema_component() = default;

    schema_component(const schema_component&) = delete;
    schema_component&
    operator=(const schema_component&) = delete;

    component_kind
    kind() const {
      return kind_;
    }

    const qname&
    name() const {
      return name_;
    }

    std::size_t
    line() const {
      return line_;
    }

    bool
    is_global() const {
      return global_;
    }

    void
    set_global(bool global) {
      global_ = global;
    }
  };

  constexpr std::string_view
  to_string(component_kind kind) {
    switch (kind) {
      case component_kind::element:
        return "element";
      case component_kind::attribute:
        return "attribute";
      case component_kind::complex_type:
        return "complexType";
      case component_kind::simple_type:
        return "simpleType";
      case component_kind::model_group:
        return "group";
      case component_kind::attribute_group:
        return "attributeGroup";
      case component_kind::any_element:
        return "any";
      case component_kind::any_attribute:
        return "anyAttribute";
    }
    return "component";
  }

} // namespace xt
