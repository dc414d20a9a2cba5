#pragma once

#include <xt/occurrence.hpp>
#include <xt/schema_component.hpp>

#include <memory>
#include <optional>
#include <vector>

namespace xt {

  // xs:sequence, xs:choice and xs:all, named xs:group definitions, and
  // xs:group references. A reference carries only ref() and occurs() until
  // resolution points it at the definition.
  class model_group : public schema_component {
    compositor_kind compositor_ = compositor_kind::sequence;
    occurrence occurs_;
    std::vector<std::shared_ptr<schema_component>> particles_;
    std::optional<qname> ref_;
    const model_group* target_ = nullptr;

  public:
    model_group(qname name, std::size_t line)
        : schema_component(component_kind::model_group, std::move(name),
                           line) {}

    compositor_kind
    compositor() const {
      return compositor_;
    }

    void
    set_compositor(compositor_kind c) {
      compositor_ = c;
    }

    const occurrence&
    occurs() const {
      return occurs_;
    }

    void
    set_occurs(occurrence o) {
      occurs_ = o;
    }

    // element_decl, model_group or wildcard components, in document order.
    const std::vector<std::shared_ptr<schema_component>>&
    particles() const {
      return particles_;
    }

    void
    add_particle(std::shared_ptr<schema_component> p) {
      particles_.push_back(std::move(p));
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
    set_target(const model_group* target) {
      target_ = target;
    }

    const model_group*
    target() const {
      return target_;
    }

    // Group whose compositor and particles apply; null for an unresolved
    // reference.
    const model_group*
    definition() const {
      if (ref_.has_value()) return target_;
      return this;
    }
  };

} // namespace xt
