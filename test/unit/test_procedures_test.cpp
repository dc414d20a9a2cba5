#include <xt/test_procedures.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using namespace xt;
using Catch::Matchers::ContainsSubstring;

namespace {

  const char* order_xsd = R"(<?xml version="1.0"?>
<xs:schema xmlns:xs="http://www.w3.org/2001/XMLSchema">
  <xs:element name="order">
    <xs:complexType>
      <xs:sequence>
        <xs:element name="qty" type="xs:int"/>
      </xs:sequence>
    </xs:complexType>
  </xs:element>
</xs:schema>
)";

  const char* broken_xsd = R"(<?xml version="1.0"?>
<xs:schema xmlns:xs="http://www.w3.org/2001/XMLSchema">
  <xs:complexType>
    <xs:sequence/>
  </xs:complexType>
</xs:schema>
)";

  std::string
  order_xml(const std::string& qty) {
    return "<order xmlns:xsi=\"http://www.w3.org/2001/XMLSchema-instance\"\n"
           "       xsi:noNamespaceSchemaLocation=\"order.xsd\">\n"
           "  <qty>" +
           qty + "</qty>\n</order>\n";
  }

  struct corpus_dir {
    fs::path path = fs::temp_directory_path() / "xt_procedures";

    corpus_dir() {
      fs::remove_all(path);
      fs::create_directories(path);
      write("order.xsd", order_xsd);
      write("broken.xsd", broken_xsd);
      write("good.xml", order_xml("3"));
      write("bad.xml", order_xml("three"));
      write("nameless.xml", "<order><qty>1</qty></order>");
      write("wrong.xml",
            "<order xmlns:xsi=\"http://www.w3.org/2001/XMLSchema-instance\" "
            "xsi:noNamespaceSchemaLocation=\"broken.xsd\"/>");
    }

    ~corpus_dir() {
      std::error_code ec;
      fs::remove_all(path, ec);
    }

    void
    write(const std::string& name, const std::string& content) const {
      std::ofstream(path / name) << content;
    }
  };

  test_input
  make_input(const fs::path& file, const schema_factory& factory,
             std::size_t expected, bool inspect = false) {
    test_input input;
    input.file_path = file;
    input.factory = factory;
    input.expected_errors = expected;
    input.inspect = inspect;
    input.variant =
        inspect ? component_variant::instrumented : component_variant::plain;
    return input;
  }

} // namespace

TEST_CASE("instance_schema_location", "[test_procedures]") {
  fs::path instance = "/data/doc.xml";

  SECTION("noNamespaceSchemaLocation") {
    auto root = parse_xml(
        R"(<r xmlns:xsi="http://www.w3.org/2001/XMLSchema-instance"
              xsi:noNamespaceSchemaLocation="../schemas/r.xsd"
              xsi:schemaLocation="urn:r other.xsd"/>)");
    auto location = instance_schema_location(root, instance);
    REQUIRE(location.has_value());
    CHECK(*location == fs::path("/schemas/r.xsd"));
  }

  SECTION("schemaLocation pair matching the root namespace") {
    auto root = parse_xml(
        R"(<r xmlns="urn:a" xmlns:xsi="http://www.w3.org/2001/XMLSchema-instance"
              xsi:schemaLocation="urn:b b.xsd  urn:a a.xsd"/>)");
    CHECK(instance_schema_location(root, instance) == fs::path("/data/a.xsd"));
  }

  SECTION("first pair when no namespace matches") {
    auto root = parse_xml(
        R"(<r xmlns:xsi="http://www.w3.org/2001/XMLSchema-instance"
              xsi:schemaLocation="urn:b b.xsd urn:c c.xsd"/>)");
    CHECK(instance_schema_location(root, instance) == fs::path("/data/b.xsd"));
  }

  SECTION("no hints") {
    CHECK_FALSE(instance_schema_location(parse_xml("<r/>"), instance));
  }
}

TEST_CASE("schema tests compare the schema error count",
          "[test_procedures]") {
  corpus_dir dir;
  component_record record;
  auto builder = schema_test_builder(record);
  auto plain = plain_schema_factory();

  CHECK_NOTHROW(builder(make_input(dir.path / "order.xsd", plain, 0))());
  CHECK_NOTHROW(builder(make_input(dir.path / "broken.xsd", plain, 1))());
  CHECK_THROWS_WITH(builder(make_input(dir.path / "broken.xsd", plain, 0))(),
                    ContainsSubstring("expected 0 schema error(s), found 1"));
}

TEST_CASE("schema tests surface unreadable schemas", "[test_procedures]") {
  component_record record;
  auto procedure = schema_test_builder(record)(
      make_input("/nonexistent/xt/none.xsd", plain_schema_factory(), 0));
  CHECK_THROWS_AS(procedure(), std::runtime_error);
}

TEST_CASE("inspected schema tests examine the observed components",
          "[test_procedures]") {
  corpus_dir dir;
  component_record record;
  auto builder = schema_test_builder(record);

  auto observed = observed_schema_factory(record);
  CHECK_NOTHROW(builder(make_input(dir.path / "order.xsd", observed, 0, true))());
  CHECK(record.size() == 4);

  // Nothing reaches the record when the factory is not observed.
  auto plain = plain_schema_factory();
  CHECK_THROWS_AS(builder(make_input(dir.path / "order.xsd", plain, 0, true))(),
                  test_failure);
  CHECK(record.empty());
}

TEST_CASE("inspected schema tests reject null observations",
          "[test_procedures]") {
  corpus_dir dir;
  component_record record;
  auto observed = observed_schema_factory(record);
  schema_factory with_null = [&](const fs::path& path, schema_version version) {
    auto s = observed(path, version);
    record.append(nullptr);
    return s;
  };

  CHECK_THROWS_WITH(
      schema_test_builder(record)(
          make_input(dir.path / "order.xsd", with_null, 0, true))(),
      ContainsSubstring("returned no component"));
}

TEST_CASE("validation tests compare the instance error count",
          "[test_procedures]") {
  corpus_dir dir;
  component_record record;
  auto builder = validation_test_builder(record);
  auto plain = plain_schema_factory();

  CHECK_NOTHROW(builder(make_input(dir.path / "good.xml", plain, 0))());
  CHECK_NOTHROW(builder(make_input(dir.path / "bad.xml", plain, 1))());
  CHECK_THROWS_WITH(
      builder(make_input(dir.path / "bad.xml", plain, 0))(),
      ContainsSubstring("expected 0 validation error(s), found 1"));
  CHECK_NOTHROW(builder(make_input(dir.path / "good.xml",
                                   observed_schema_factory(record), 0, true))());
}

TEST_CASE("validation tests need a usable schema", "[test_procedures]") {
  corpus_dir dir;
  component_record record;
  auto builder = validation_test_builder(record);
  auto plain = plain_schema_factory();

  CHECK_THROWS_WITH(builder(make_input(dir.path / "nameless.xml", plain, 0))(),
                    ContainsSubstring("does not name its schema"));
  CHECK_THROWS_WITH(builder(make_input(dir.path / "wrong.xml", plain, 0))(),
                    ContainsSubstring("schema error(s)"));
}
