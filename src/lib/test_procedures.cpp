#include <xt/test_procedures.hpp>

#include <sstream>
#include <string>

namespace fs = std::filesystem;

namespace xt {

  namespace {

    std::string
    describe(const std::vector<schema_error>& errors) {
      std::ostringstream os;
      for (const auto& e : errors)
        os << "\n  " << e;
      return os.str();
    }

    void
    check_error_count(const std::string& what, const fs::path& file,
                      const std::vector<schema_error>& errors,
                      std::size_t expected) {
      if (errors.size() == expected) return;
      std::ostringstream os;
      os << file.string() << ": expected " << expected << " " << what
         << " error(s), found " << errors.size() << describe(errors);
      throw test_failure(os.str());
    }

    void
    inspect_record(const component_record& record, const schema& s) {
      if (record.empty())
        throw test_failure(s.source().string() +
                           ": no components were observed");
      for (const auto& component : record) {
        if (!component) {
          throw test_failure(s.source().string() +
                             ": an observed builder returned no component");
        }
        if (!s.owns(component.get())) {
          throw test_failure(s.source().string() + ": observed " +
                             std::string(to_string(component->kind())) +
                             " at line " + std::to_string(component->line()) +
                             " does not belong to the schema");
        }
        if (component->kind() == component_kind::simple_type) {
          throw test_failure(s.source().string() +
                             ": simple type observed at line " +
                             std::to_string(component->line()));
        }
      }
    }

  } // namespace

  std::optional<fs::path>
  instance_schema_location(const xml_element& root, const fs::path& instance) {
    auto dir = instance.parent_path();
    if (auto location =
            root.attribute(qname{xsi_namespace, "noNamespaceSchemaLocation"})) {
      return (dir / *location).lexically_normal();
    }
    auto pairs = root.attribute(qname{xsi_namespace, "schemaLocation"});
    if (!pairs) return std::nullopt;

    std::istringstream tokens(*pairs);
    std::string ns;
    std::string location;
    std::optional<fs::path> first;
    while (tokens >> ns >> location) {
      auto path = (dir / location).lexically_normal();
      if (ns == root.name().namespace_uri()) return path;
      if (!first) first = path;
    }
    return first;
  }

  test_builder
  schema_test_builder(component_record& record) {
    return [&record](const test_input& input) -> test_procedure {
      return [&record, input] {
        if (input.inspect) record.clear();
        auto s = input.factory(input.file_path, input.version);
        check_error_count("schema", input.file_path, s->errors(),
                          input.expected_errors);
        if (input.inspect) inspect_record(record, *s);
      };
    };
  }

  test_builder
  validation_test_builder(component_record& record) {
    return [&record](const test_input& input) -> test_procedure {
      return [&record, input] {
        auto document = load_xml_file(input.file_path);
        auto location = instance_schema_location(document, input.file_path);
        if (!location) {
          throw test_failure(input.file_path.string() +
                             ": instance does not name its schema");
        }

        if (input.inspect) record.clear();
        auto s = input.factory(*location, input.version);
        check_error_count("schema", *location, s->errors(), 0);
        if (input.inspect) inspect_record(record, *s);

        check_error_count("validation", input.file_path, s->validate(document),
                          input.expected_errors);
      };
    };
  }

} // namespace xt
