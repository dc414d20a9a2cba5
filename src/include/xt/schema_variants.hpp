#pragma once

#include <xt/component_record.hpp>
#include <xt/schema.hpp>

#include <filesystem>
#include <functional>
#include <memory>
#include <string_view>

namespace xt {

  using schema_factory = std::function<std::unique_ptr<schema>(
      const std::filesystem::path&, schema_version)>;

  enum class component_variant { plain, instrumented };

  constexpr std::string_view
  to_string(component_variant v) {
    return v == component_variant::instrumented ? "instrumented" : "plain";
  }

  // Builds schemas with default_builders().
  schema_factory
  plain_schema_factory();

  // Builds schemas with every default builder observed into `record`, except
  // the simple type builder. `record` must outlive the factory.
  schema_factory
  observed_schema_factory(component_record& record);

  // The pair of schema factories a corpus run chooses from: the plain one
  // for ordinary directives, the instrumented one for inspected ones.
  struct variant_selector {
    schema_factory plain;
    schema_factory instrumented;

    const schema_factory&
    select(bool inspect) const {
      return inspect ? instrumented : plain;
    }
  };

  variant_selector
  default_variants(component_record& record);

} // namespace xt
