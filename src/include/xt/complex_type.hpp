#pragma once

#include <xt/attribute_group.hpp>
#include <xt/model_group.hpp>
#include <xt/schema_component.hpp>
#include <xt/simple_type.hpp>

#include <memory>

namespace xt {

  class complex_type : public schema_component {
    bool mixed_ = false;
    bool simple_content_ = false;
    bool has_assertions_ = false;
    derivation_method derivation_ = derivation_method::none;
    qname base_name_;
    std::shared_ptr<model_group> content_;
    attribute_uses attributes_;
    const complex_type* base_complex_ = nullptr;
    simple_type_ref base_simple_;

  public:
    complex_type(qname name, std::size_t line)
        : schema_component(component_kind::complex_type, std::move(name),
                           line) {}

    bool
    mixed() const {
      return mixed_;
    }

    void
    set_mixed(bool mixed) {
      mixed_ = mixed;
    }

    // True for xs:simpleContent: the element holds text typed by the
    // simple base, plus attributes.
    bool
    simple_content() const {
      return simple_content_;
    }

    void
    set_simple_content(bool simple) {
      simple_content_ = simple;
    }

    bool
    has_assertions() const {
      return has_assertions_;
    }

    void
    set_has_assertions(bool has) {
      has_assertions_ = has;
    }

    derivation_method
    derivation() const {
      return derivation_;
    }

    const qname&
    base_name() const {
      return base_name_;
    }

    void
    set_base(derivation_method method, qname base) {
      derivation_ = method;
      base_name_ = std::move(base);
    }

    // Null for empty content.
    const std::shared_ptr<model_group>&
    content() const {
      return content_;
    }

    void
    set_content(std::shared_ptr<model_group> content) {
      content_ = std::move(content);
    }

    const attribute_uses&
    attributes() const {
      return attributes_;
    }

    attribute_uses&
    attributes() {
      return attributes_;
    }

    const complex_type*
    base_complex() const {
      return base_complex_;
    }

    void
    set_base_complex(const complex_type* base) {
      base_complex_ = base;
    }

    // Text type for simple content derived from a simple type or built-in.
    const simple_type_ref&
    base_simple() const {
      return base_simple_;
    }

    simple_type_ref&
    base_simple() {
      return base_simple_;
    }
  };

} // namespace xt
