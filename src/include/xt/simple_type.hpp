#pragma once

#include <xt/schema_component.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace xt {

  struct facet_set {
    std::vector<std::string> enumeration;
    std::vector<std::string> patterns;
    std::optional<std::string> min_inclusive;
    std::optional<std::string> max_inclusive;
    std::optional<std::string> min_exclusive;
    std::optional<std::string> max_exclusive;
    std::optional<std::size_t> length;
    std::optional<std::size_t> min_length;
    std::optional<std::size_t> max_length;

    bool
    empty() const {
      return enumeration.empty() && patterns.empty() && !min_inclusive &&
             !max_inclusive && !min_exclusive && !max_exclusive && !length &&
             !min_length && !max_length;
    }
  };

  // Reference to a simple type by name. `type` is null for built-ins and
  // for references that failed to resolve; anonymous types carry an empty
  // name and a non-null `type`.
  struct simple_type_ref {
    qname name;
    std::shared_ptr<simple_type> inline_type;
    const simple_type* type = nullptr;

    bool
    is_builtin() const {
      return type == nullptr && name.is_xs();
    }

    bool
    empty() const {
      return name.empty() && !inline_type;
    }
  };

  class simple_type : public schema_component {
    simple_type_variety variety_ = simple_type_variety::atomic;
    simple_type_ref base_;
    std::vector<simple_type_ref> members_;
    facet_set facets_;

  public:
    simple_type(qname name, std::size_t line)
        : schema_component(component_kind::simple_type, std::move(name),
                           line) {}

    simple_type_variety
    variety() const {
      return variety_;
    }

    void
    set_variety(simple_type_variety v) {
      variety_ = v;
    }

    // Restriction base, or the item type of a list.
    const simple_type_ref&
    base() const {
      return base_;
    }

    simple_type_ref&
    base() {
      return base_;
    }

    const std::vector<simple_type_ref>&
    members() const {
      return members_;
    }

    std::vector<simple_type_ref>&
    members() {
      return members_;
    }

    const facet_set&
    facets() const {
      return facets_;
    }

    facet_set&
    facets() {
      return facets_;
    }
  };

} // namespace xt
