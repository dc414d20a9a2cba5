#include <xt/test_factory.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace xt;

namespace {

  test_input
  input_for(const fs::path& file, std::size_t expected = 0) {
    test_input input;
    input.file_path = file;
    input.expected_errors = expected;
    return input;
  }

  // Procedures that pass when the expected count is even.
  test_builder
  parity_builder() {
    return [](const test_input& input) -> test_procedure {
      return [input] {
        if (input.expected_errors % 2 != 0)
          throw std::runtime_error(input.file_path.string());
      };
    };
  }

  variant_selector
  null_variants() {
    auto none = [](const fs::path&, schema_version) -> std::unique_ptr<schema> {
      return nullptr;
    };
    return {none, none};
  }

} // namespace

TEST_CASE("title_case capitalises each word", "[test_factory]") {
  CHECK(title_case("validation") == "Validation");
  CHECK(title_case("schema_build") == "Schema_Build");
  CHECK(title_case("XSD") == "Xsd");
  CHECK(title_case("v11test") == "V11Test");
  CHECK(title_case("") == "");
}

TEST_CASE("generate_tests names units by label and position",
          "[test_factory]") {
  fs::path base = "/corpus";
  std::vector<test_input> inputs{input_for("/corpus/a/one.xml", 2),
                                 input_for("/corpus/b/two.xml", 1)};

  test_suite suite;
  generate_tests(inputs, parity_builder(), "validation", base, suite);

  REQUIRE(suite.size() == 2);
  CHECK(suite[0].class_name == "TestValidation001");
  CHECK(suite[0].method_name == "test_validation_001_a/one.xml");
  CHECK(suite[1].class_name == "TestValidation002");
  CHECK(suite[1].method_name == "test_validation_002_b/two.xml");
  CHECK(suite[1].input.expected_errors == 1);

  CHECK_NOTHROW(suite[0].run());
  CHECK_THROWS_AS(suite[1].run(), std::runtime_error);

  auto* found = suite.find("TestValidation002");
  REQUIRE(found != nullptr);
  CHECK(found == &suite[1]);
  CHECK(suite.find("TestValidation003") == nullptr);
}

TEST_CASE("generate_tests with no inputs leaves the suite empty",
          "[test_factory]") {
  test_suite suite;
  generate_tests({}, parity_builder(), "validation", {}, suite);
  CHECK(suite.empty());
  CHECK(suite.begin() == suite.end());
}

TEST_CASE("a second label appends to the same suite", "[test_factory]") {
  std::vector<test_input> inputs{input_for("/corpus/x.xsd")};

  test_suite suite;
  generate_tests(inputs, parity_builder(), "schema", "/corpus", suite);
  generate_tests(inputs, parity_builder(), "validation", "/corpus", suite);

  REQUIRE(suite.size() == 2);
  CHECK(suite[0].class_name == "TestSchema001");
  CHECK(suite[1].class_name == "TestValidation001");
}

TEST_CASE("duplicate class names are rejected", "[test_factory]") {
  std::vector<test_input> inputs{input_for("/corpus/x.xml")};

  test_suite suite;
  generate_tests(inputs, parity_builder(), "validation", "/corpus", suite);
  CHECK_THROWS_AS(
      generate_tests(inputs, parity_builder(), "validation", "/corpus", suite),
      configuration_error);
  CHECK(suite.size() == 1);
}

TEST_CASE("a clash with an existing unit leaves the suite unchanged",
          "[test_factory]") {
  test_suite suite;
  generate_tests({input_for("/corpus/a.xml"), input_for("/corpus/b.xml")},
                 parity_builder(), "validation", "/corpus", suite);
  test_suite target;
  target.add(suite[1]);
  REQUIRE(target.size() == 1);

  int builds = 0;
  test_builder counting = [&](const test_input& input) {
    ++builds;
    return parity_builder()(input);
  };
  std::vector<test_input> inputs{input_for("/corpus/x.xml"),
                                 input_for("/corpus/y.xml"),
                                 input_for("/corpus/z.xml")};

  CHECK_THROWS_AS(
      generate_tests(inputs, counting, "validation", "/corpus", target),
      configuration_error);
  CHECK(target.size() == 1);
  CHECK(target.find("TestValidation001") == nullptr);
  CHECK(target[0].method_name == "test_validation_002_b.xml");
  CHECK(builds == 1);
}

TEST_CASE("builder exceptions propagate out of generation", "[test_factory]") {
  test_builder failing = [](const test_input&) -> test_procedure {
    throw std::runtime_error("cannot build");
  };

  test_suite suite;
  CHECK_THROWS_WITH(generate_tests({input_for("/corpus/x.xml")}, failing,
                                   "validation", "/corpus", suite),
                    "cannot build");
  CHECK(suite.empty());
}

TEST_CASE("tests_factory resolves manifests into units", "[test_factory]") {
  auto dir = fs::temp_directory_path() / "xt_factory_corpus";
  fs::remove_all(dir);
  fs::create_directories(dir);
  std::ofstream(dir / "a.xml") << "<a/>";
  std::ofstream(dir / "b.xml") << "<b/>";
  std::ofstream(dir / "testfiles") << "a.xml 2\n"
                                      "gone.xml\n"
                                      "b.xml 1 -i\n";

  std::vector<fs::path> skipped;
  factory_options opts;
  opts.base_dir = dir;
  opts.on_skip = [&](const fs::path&, std::size_t, const fs::path& file,
                     skip_reason) { skipped.push_back(file); };

  test_suite suite;
  auto stats = tests_factory(parity_builder(), {(dir / "testfiles").string()},
                             null_variants(), opts, suite);

  CHECK(stats.resolved == 2);
  CHECK(stats.skipped_missing == 1);
  REQUIRE(skipped.size() == 1);
  CHECK(skipped[0].filename() == "gone.xml");

  REQUIRE(suite.size() == 2);
  CHECK(suite[0].method_name == "test_validation_001_a.xml");
  CHECK(suite[1].method_name == "test_validation_002_b.xml");
  CHECK(suite[1].input.inspect);
  CHECK(suite[1].input.variant == component_variant::instrumented);
  CHECK_NOTHROW(suite[0].run());
  CHECK_THROWS(suite[1].run());

  auto by_value = tests_factory(parity_builder(),
                                {(dir / "testfiles").string()},
                                null_variants(), opts);
  REQUIRE(by_value.size() == 2);
  CHECK(by_value[0].class_name == "TestValidation001");

  fs::remove_all(dir);
}
