#pragma once

#include <xt/schema_component.hpp>
#include <xt/simple_type.hpp>

#include <optional>
#include <string>

namespace xt {

  class attribute_decl : public schema_component {
    std::optional<qname> ref_;
    simple_type_ref type_;
    attribute_use use_ = attribute_use::optional;
    std::optional<std::string> default_value_;
    std::optional<std::string> fixed_value_;
    const attribute_decl* target_ = nullptr;

  public:
    attribute_decl(qname name, std::size_t line)
        : schema_component(component_kind::attribute, std::move(name), line) {
    }

    const std::optional<qname>&
    ref() const {
      return ref_;
    }

    void
    set_ref(qname ref) {
      ref_ = std::move(ref);
    }

    const simple_type_ref&
    type() const {
      return type_;
    }

    simple_type_ref&
    type() {
      return type_;
    }

    attribute_use
    use() const {
      return use_;
    }

    void
    set_use(attribute_use use) {
      use_ = use;
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
    set_target(const attribute_decl* target) {
      target_ = target;
    }

    const attribute_decl&
    effective() const {
      return target_ != nullptr ? *target_ : *this;
    }

    const qname&
    instance_name() const {
      return ref_.has_value() ? *ref_ : name();
    }
  };

} // namespace xt
