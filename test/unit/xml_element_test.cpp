#include <xt/xml_element.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace xt;

TEST_CASE("xml_element: tree, text and attributes", "[xml_element]") {
  auto root = parse_xml(R"(<?xml version="1.0"?>
<order id="7">
  <item>pen</item>
  <item qty="2">ink</item>
</order>)");

  CHECK(root.name() == qname{"", "order"});
  CHECK(root.attribute("id") == "7");
  CHECK_FALSE(root.attribute("missing").has_value());
  CHECK_FALSE(root.has_text());
  REQUIRE(root.children().size() == 2);
  CHECK(root.children()[0].text() == "pen");
  CHECK(root.children()[1].attribute("qty") == "2");
  CHECK(root.children()[1].line() == 4);
}

TEST_CASE("xml_element: qualified attribute lookup", "[xml_element]") {
  auto root = parse_xml(
      R"(<a xmlns:xsi="http://www.w3.org/2001/XMLSchema-instance" xsi:nil="true" nil="no"/>)");
  CHECK(root.attribute(qname{xsi_namespace, "nil"}) == "true");
  CHECK(root.attribute("nil") == "no");
}

TEST_CASE("xml_element: resolving prefixed names", "[xml_element]") {
  auto root = parse_xml(
      R"(<s xmlns:xs="http://www.w3.org/2001/XMLSchema" xmlns="urn:d"/>)");

  CHECK(root.resolve_qname("xs:string") == qname{xs_namespace, "string"});
  CHECK(root.resolve_qname("local") == qname{"urn:d", "local"});
  CHECK(root.resolve_qname("local", false) == qname{"", "local"});
  CHECK_FALSE(root.resolve_qname("nope:thing").has_value());
}

TEST_CASE("xml_element: unprefixed names without a default namespace",
          "[xml_element]") {
  auto root = parse_xml("<s/>");
  CHECK(root.resolve_qname("local") == qname{"", "local"});
}

TEST_CASE("xml_element: loading files", "[xml_element]") {
  auto path = std::filesystem::temp_directory_path() / "xt_xml_element.xml";
  {
    std::ofstream out(path);
    out << "<doc><p>text</p></doc>";
  }
  auto doc = load_xml_file(path);
  CHECK(doc.name().local_name() == "doc");
  CHECK(doc.children().size() == 1);
  std::filesystem::remove(path);

  CHECK_THROWS_AS(load_xml_file(path), std::runtime_error);
}

TEST_CASE("xml_element: parse errors name the file", "[xml_element]") {
  auto path = std::filesystem::temp_directory_path() / "xt_broken.xml";
  {
    std::ofstream out(path);
    out << "<doc><p></doc>";
  }
  try {
    load_xml_file(path);
    FAIL("expected a parse error");
  } catch (const std::runtime_error& e) {
    CHECK(std::string(e.what()).find("xt_broken.xml") != std::string::npos);
  }
  std::filesystem::remove(path);
}
