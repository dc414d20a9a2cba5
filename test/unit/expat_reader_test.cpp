#include <xt/expat_reader.hpp>

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>

using namespace xt;

TEST_CASE("reader: empty element", "[expat_reader]") {
  expat_reader reader("<root/>");

  REQUIRE(reader.read());
  CHECK(reader.node_type() == xml_node_type::start_element);
  CHECK(reader.name() == qname{"", "root"});
  CHECK(reader.depth() == 1);

  REQUIRE(reader.read());
  CHECK(reader.node_type() == xml_node_type::end_element);
  CHECK(reader.depth() == 1);

  CHECK_FALSE(reader.read());
}

TEST_CASE("reader: namespaced element and attributes", "[expat_reader]") {
  expat_reader reader(
      R"(<p:a xmlns:p="urn:p" p:x="1" y="2"><b/></p:a>)");

  REQUIRE(reader.read());
  CHECK(reader.name() == qname{"urn:p", "a"});
  REQUIRE(reader.attribute_count() == 2);
  CHECK(reader.attribute_name(0) == qname{"urn:p", "x"});
  CHECK(reader.attribute_value(0) == "1");
  CHECK(reader.attribute_name(1) == qname{"", "y"});
  CHECK(reader.attribute_value(1) == "2");
  CHECK(reader.namespace_uri_for_prefix("p") == "urn:p");

  REQUIRE(reader.read());
  CHECK(reader.name() == qname{"", "b"});
  CHECK(reader.depth() == 2);
}

TEST_CASE("reader: in-scope bindings follow element nesting",
          "[expat_reader]") {
  expat_reader reader(R"(<a xmlns="urn:d"><b xmlns:q="urn:q"/><c/></a>)");

  REQUIRE(reader.read());
  CHECK(reader.in_scope_namespaces().at("") == "urn:d");

  REQUIRE(reader.read());
  auto inner = reader.in_scope_namespaces();
  CHECK(inner.at("q") == "urn:q");
  CHECK(inner.at("") == "urn:d");

  REQUIRE(reader.read()); // </b>
  REQUIRE(reader.read()); // <c>
  CHECK(reader.name() == qname{"urn:d", "c"});
  CHECK(reader.in_scope_namespaces().count("q") == 0);
}

TEST_CASE("reader: line numbers", "[expat_reader]") {
  expat_reader reader("<a>\n  <b/>\n\n  <c/>\n</a>");

  REQUIRE(reader.read());
  CHECK(reader.line() == 1);
  REQUIRE(reader.read()); // whitespace
  REQUIRE(reader.read());
  CHECK(reader.name().local_name() == "b");
  CHECK(reader.line() == 2);
  REQUIRE(reader.read()); // </b>
  REQUIRE(reader.read()); // whitespace
  REQUIRE(reader.read());
  CHECK(reader.name().local_name() == "c");
  CHECK(reader.line() == 4);
}

TEST_CASE("reader: malformed XML throws", "[expat_reader]") {
  CHECK_THROWS_AS(expat_reader("<a><b></a>"), std::runtime_error);
  try {
    expat_reader reader("<a>\n<b>\n</a>");
    FAIL("expected a parse error");
  } catch (const std::runtime_error& e) {
    CHECK(std::string(e.what()).find("line 3") != std::string::npos);
  }
}
