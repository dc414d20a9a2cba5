#pragma once

#include <xt/occurrence.hpp>
#include <xt/schema_component.hpp>

#include <memory>
#include <optional>
#include <string>

namespace xt {

  // Type of an element: a complex type, a simple type, or a built-in named by
  // `name` alone. No name and no type means xs:anyType.
  struct type_ref {
    qname name;
    std::shared_ptr<schema_component> inline_type;
    const complex_type* complex = nullptr;
    const simple_type* simple = nullptr;

    bool
    is_any_type() const {
      return complex == nullptr && simple == nullptr &&
             (name.empty() || name.is_xs("anyType"));
    }

    bool
    is_builtin_simple() const {
      return complex == nullptr && simple == nullptr && name.is_xs() &&
             !name.is_xs("anyType");
    }
  };

  class element_decl : public schema_component {
    std::optional<qname> ref_;
    type_ref type_;
    occurrence occurs_;
    bool nillable_ = false;
    std::optional<std::string> default_value_;
    std::optional<std::string> fixed_value_;
    const element_decl* target_ = nullptr;

  public:
    element_decl(qname name, std::size_t line)
        : schema_component(component_kind::element, std::move(name), line) {}

    const std::optional<qname>&
    ref() const {
      return ref_;
    }

    void
    set_ref(qname ref) {
      ref_ = std::move(ref);
    }

    const type_ref&
    type() const {
      return type_;
    }

    type_ref&
    type() {
      return type_;
    }

    const occurrence&
    occurs() const {
      return occurs_;
    }

    void
    set_occurs(occurrence o) {
      occurs_ = o;
    }

    bool
    nillable() const {
      return nillable_;
    }

    void
    set_nillable(bool nillable) {
      nillable_ = nillable;
    }

    const std::optional<std::string>&
    default_value() const {
      return default_value_;
    }

    void
    set_default_value(std::string value) {
      default_value_ = std::move(value);
    }

    const std::optional<std::string>&
    fixed_value() const {
      return fixed_value_;
    }

    void
    set_fixed_value(std::string value) {
      fixed_value_ = std::move(value);
    }

    void
    set_target(const element_decl* target) {
      target_ = target;
    }

    // The declaration that governs instances: the referenced global
    // declaration for element references, this one otherwise.
    const element_decl&
    effective() const {
      return target_ != nullptr ? *target_ : *this;
    }

    // Name instances must carry.
    const qname&
    instance_name() const {
      return ref_.has_value() ? *ref_ : name();
    }
  };

} // namespace xt
