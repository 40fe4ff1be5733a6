#include <shacl/constraint_validators.hpp>
#include <shacl/memory_graph.hpp>
#include <shacl/vocabulary.hpp>

#include <catch2/catch.hpp>

#include <string>

using namespace shacl;

namespace {

  term
  ex(const std::string& local) {
    return term::make_iri("http://example.org/" + local);
  }

  term
  rdf_type() {
    return term::make_iri(std::string(vocab::rdf::type));
  }

  property_shape
  shape_on(const std::string& predicate) {
    property_shape ps;
    ps.id = ex(predicate + "Shape");
    ps.path = iri{"http://example.org/" + predicate};
    return ps;
  }

} // namespace

TEST_CASE("type: datatype", "[type]") {
  auto ps = shape_on("age");
  ps.datatype = iri{std::string(vocab::xsd::integer)};
  auto integer = std::string(vocab::xsd::integer);

  SECTION("matching literal conforms") {
    memory_graph g{{ex("a"), ex("age"), term::make_literal("42", integer)}};
    CHECK(validators::validate_type(g, ex("a"), ps).empty());
  }

  SECTION("literal of another datatype") {
    memory_graph g{{ex("a"), ex("age"), term::make_literal("42")}};
    auto results = validators::validate_type(g, ex("a"), ps);
    REQUIRE(results.size() == 1);
    CHECK(results[0].details.get<term>("constraint_component") ==
          term::make_iri(std::string(vocab::sh::datatype_component)));
    CHECK(results[0].details.get<term>("expected_datatype") ==
          term::make_iri(integer));
    CHECK(results[0].details.get<term>("actual_value") ==
          term::make_literal("42"));
  }

  SECTION("IRI value") {
    memory_graph g{{ex("a"), ex("age"), ex("old")}};
    CHECK(validators::validate_type(g, ex("a"), ps).size() == 1);
  }

  SECTION("one violation per offending value") {
    memory_graph g{
        {ex("a"), ex("age"), term::make_literal("1", integer)},
        {ex("a"), ex("age"), term::make_literal("x")},
        {ex("a"), ex("age"), term::make_blank("b")},
    };
    CHECK(validators::validate_type(g, ex("a"), ps).size() == 2);
  }
}

TEST_CASE("type: class", "[type]") {
  auto ps = shape_on("knows");
  ps.class_ = iri{"http://example.org/Person"};

  memory_graph g{
      {ex("a"), ex("knows"), ex("b")},
      {ex("a"), ex("knows"), ex("c")},
      {ex("a"), ex("knows"), term::make_literal("d")},
      {ex("b"), rdf_type(), ex("Person")},
      {ex("c"), rdf_type(), ex("Employee")},
      {ex("Employee"), ex("subClassOf"), ex("Person")},
  };

  auto results = validators::validate_type(g, ex("a"), ps);
  // c is only an Employee (no subclass reasoning); the literal never is.
  REQUIRE(results.size() == 2);
  CHECK(results[0].details.get<term>("actual_value") == ex("c"));
  CHECK(results[1].details.get<term>("actual_value") ==
        term::make_literal("d"));
  CHECK(results[0].details.get<term>("expected_class") == ex("Person"));
}

TEST_CASE("type: datatype then class results concatenate", "[type]") {
  auto ps = shape_on("p");
  ps.datatype = iri{std::string(vocab::xsd::string)};
  ps.class_ = iri{"http://example.org/C"};

  memory_graph g{{ex("a"), ex("p"), ex("x")}};
  auto results = validators::validate_type(g, ex("a"), ps);
  REQUIRE(results.size() == 2);
  CHECK(results[0].details.contains("expected_datatype"));
  CHECK(results[1].details.contains("expected_class"));
}

TEST_CASE("type: no values conforms", "[type]") {
  auto ps = shape_on("age");
  ps.datatype = iri{std::string(vocab::xsd::integer)};
  memory_graph g;
  CHECK(validators::validate_type(g, ex("a"), ps).empty());
}
