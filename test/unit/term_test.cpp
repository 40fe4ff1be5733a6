#include <shacl/term.hpp>
#include <shacl/vocabulary.hpp>

#include <catch2/catch.hpp>

#include <sstream>
#include <string>
#include <unordered_set>

using shacl::term;

TEST_CASE("term: factories pick the right alternative", "[term]") {
  SECTION("iri") {
    auto t = term::make_iri("http://example.org/a");
    CHECK(t.is_iri());
    CHECK_FALSE(t.is_literal());
    CHECK(t.get<shacl::iri>().value == "http://example.org/a");
  }
  SECTION("blank node") {
    auto t = term::make_blank("b0");
    CHECK(t.is_blank());
    CHECK(t.get<shacl::blank_node>().label == "b0");
  }
  SECTION("plain literal is xsd:string") {
    auto t = term::make_literal("hello");
    REQUIRE(t.is_literal());
    CHECK(t.get<shacl::literal>().datatype == shacl::vocab::xsd::string);
    CHECK_FALSE(t.get<shacl::literal>().language);
  }
  SECTION("language literal is rdf:langString") {
    auto t = term::make_lang_literal("chat", "fr");
    REQUIRE(t.is_literal());
    CHECK(t.get<shacl::literal>().datatype == shacl::vocab::rdf::lang_string);
    CHECK(t.get<shacl::literal>().language == "fr");
  }
}

TEST_CASE("term: N-Triples serialization", "[term]") {
  CHECK(term::make_iri("http://example.org/a").to_string() ==
        "<http://example.org/a>");
  CHECK(term::make_blank("n1").to_string() == "_:n1");
  CHECK(term::make_literal("abc").to_string() == "\"abc\"");
  CHECK(term::make_literal("5", std::string(shacl::vocab::xsd::integer))
            .to_string() ==
        "\"5\"^^<http://www.w3.org/2001/XMLSchema#integer>");
  CHECK(term::make_lang_literal("hi", "en").to_string() == "\"hi\"@en");

  SECTION("special characters are escaped") {
    CHECK(term::make_literal("a\"b\\c\nd").to_string() ==
          "\"a\\\"b\\\\c\\nd\"");
  }

  SECTION("stream output uses the same form") {
    std::ostringstream os;
    os << term::make_blank("x");
    CHECK(os.str() == "_:x");
  }
}

TEST_CASE("term: equality is structural", "[term]") {
  auto integer = std::string(shacl::vocab::xsd::integer);
  CHECK(term::make_literal("1", integer) == term::make_literal("1", integer));
  CHECK(term::make_literal("1", integer) != term::make_literal("01", integer));
  CHECK(term::make_literal("1") != term::make_literal("1", integer));
  CHECK(term::make_iri("x") != term::make_blank("x"));
  CHECK(term::make_lang_literal("a", "en") !=
        term::make_lang_literal("a", "de"));
}

TEST_CASE("term: ordering and hashing", "[term]") {
  auto a = term::make_iri("http://example.org/a");
  auto b = term::make_iri("http://example.org/b");
  CHECK(a < b);
  CHECK_FALSE(b < a);

  std::unordered_set<term> set{a, b, a};
  CHECK(set.size() == 2);
  CHECK(std::hash<term>{}(a) == std::hash<term>{}(term::make_iri(
                                    "http://example.org/a")));
}
