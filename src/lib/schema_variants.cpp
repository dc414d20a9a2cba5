#include <xt/builder_observer.hpp>
#include <xt/schema_variants.hpp>

namespace xt {

  schema_factory
  plain_schema_factory() {
    return [](const std::filesystem::path& path, schema_version version) {
      return std::make_unique<schema>(path, version, default_builders());
    };
  }

  schema_factory
  observed_schema_factory(component_record& record) {
    auto builders = builder_observer(record).observe_all(
        default_builders(), {simple_type_builder_key});
    return [builders = std::move(builders)](const std::filesystem::path& path,
                                            schema_version version) {
      return std::make_unique<schema>(path, version, builders);
    };
  }

  variant_selector
  default_variants(component_record& record) {
    return {plain_schema_factory(), observed_schema_factory(record)};
  }

} // namespace xt
