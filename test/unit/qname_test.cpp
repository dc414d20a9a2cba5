#include <xt/qname.hpp>

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>
#include <unordered_map>

using namespace xt;

TEST_CASE("qname default construction", "[qname]") {
  qname q;
  CHECK(q.namespace_uri().empty());
  CHECK(q.local_name().empty());
  CHECK(q.empty());
}

TEST_CASE("qname equality and ordering", "[qname]") {
  qname a{"urn:ns", "name"};
  qname b{"urn:ns", "name"};
  qname c{"urn:ns", "other"};
  qname d{"urn:a", "zzz"};

  CHECK(a == b);
  CHECK(a != c);
  CHECK(a < c);
  CHECK(d < a);
}

TEST_CASE("qname XML Schema names", "[qname]") {
  qname s{xs_namespace, "string"};
  CHECK(s.is_xs());
  CHECK(s.is_xs("string"));
  CHECK_FALSE(s.is_xs("int"));
  CHECK_FALSE(qname("string").is_xs());
}

TEST_CASE("qname Clark notation", "[qname]") {
  CHECK(qname("urn:a", "b").str() == "{urn:a}b");
  CHECK(qname("local").str() == "local");

  std::ostringstream os;
  os << qname("urn:a", "b");
  CHECK(os.str() == "{urn:a}b");
}

TEST_CASE("qname as unordered_map key", "[qname]") {
  std::unordered_map<qname, int> m;
  m[qname("urn:a", "x")] = 1;
  m[qname("urn:b", "x")] = 2;
  CHECK(m.size() == 2);
  CHECK(m.at(qname("urn:a", "x")) == 1);
}
