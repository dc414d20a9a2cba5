#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace xt {

  class schema;
  class schema_component;
  class element_decl;
  class attribute_decl;
  class complex_type;
  class simple_type;
  class model_group;
  class attribute_group;
  class wildcard;

  enum class schema_version { v1_0, v1_1 };

  enum class component_kind {
    element,
    attribute,
    complex_type,
    simple_type,
    model_group,
    attribute_group,
    any_element,
    any_attribute,
  };

  enum class compositor_kind { sequence, choice, all };

  enum class derivation_method { none, extension, restriction };

  enum class simple_type_variety { atomic, list, union_type };

  enum class process_contents { strict, lax, skip };

  enum class attribute_use { optional, required, prohibited };

  inline constexpr std::size_t unbounded = SIZE_MAX;

  constexpr std::string_view
  to_string(schema_version v) {
    return v == schema_version::v1_1 ? "1.1" : "1.0";
  }

} // namespace xt
