#pragma once

#include <xt/schema_fwd.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace xt {

  // Whether `local` names a built-in simple type (or xs:anyType) of the
  // given XSD version.
  bool
  is_builtin_type(std::string_view local, schema_version version);

  // Applies the whiteSpace facet of the built-in type.
  std::string
  normalize_builtin_value(std::string_view type, std::string_view value);

  // Returns why `value` is not a valid lexical value of the built-in
  // `type`, or nullopt when it is. `value` must already be normalized.
  std::optional<std::string>
  check_builtin_value(std::string_view type, std::string_view value);

  // Built-in types whose values compare numerically in range facets.
  bool
  is_numeric_builtin(std::string_view type);

} // namespace xt
