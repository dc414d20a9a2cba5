#pragma once

#include <xt/attribute_decl.hpp>
#include <xt/schema_component.hpp>
#include <xt/wildcard.hpp>

#include <memory>
#include <optional>
#include <vector>

namespace xt {

  // Attribute uses shared by complex types and attribute groups.
  struct attribute_uses {
    std::vector<std::shared_ptr<attribute_decl>> attributes;
    std::vector<std::shared_ptr<attribute_group>> group_refs;
    std::shared_ptr<wildcard> any_attribute;
  };

  class attribute_group : public schema_component {
    attribute_uses uses_;
    std::optional<qname> ref_;
    const attribute_group* target_ = nullptr;

  public:
    attribute_group(qname name, std::size_t line)
        : schema_component(component_kind::attribute_group, std::move(name),
                           line) {}

    const attribute_uses&
    uses() const {
      return uses_;
    }

    attribute_uses&
    uses() {
      return uses_;
    }

    const std::optional<qname>&
    ref() const {
      return ref_;
    }

    void
    set_ref(qname ref) {
      ref_ = std::move(ref);
    }

    void
    set_target(const attribute_group* target) {
      target_ = target;
    }

    const attribute_group*
    definition() const {
      if (ref_.has_value()) return target_;
      return this;
    }
  };

} // namespace xt
