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

  property_shape
  code_shape() {
    property_shape ps;
    ps.id = ex("CodeShape");
    ps.path = iri{"http://example.org/code"};
    return ps;
  }

} // namespace

TEST_CASE("string: pattern", "[string]") {
  auto ps = code_shape();
  ps.pattern = compiled_pattern("[A-Z]{3}-[0-9]+");

  memory_graph g{
      {ex("a"), ex("code"), term::make_literal("ABC-12")},
      {ex("a"), ex("code"), term::make_literal("xABC-12")},
      {ex("a"), ex("code"), ex("ABC-1")},
  };

  auto results = validators::validate_string(g, ex("a"), ps);
  REQUIRE(results.size() == 2);
  CHECK(results[0].details.get<term>("constraint_component") ==
        term::make_iri(std::string(vocab::sh::pattern_component)));
  CHECK(results[0].details.get<std::string>("pattern") == "[A-Z]{3}-[0-9]+");
  CHECK(results[0].details.get<term>("actual_value") ==
        term::make_literal("xABC-12"));
  CHECK(results[1].details.get<term>("actual_value") == ex("ABC-1"));
}

TEST_CASE("string: pattern applies to typed literals' lexical form",
          "[string]") {
  auto ps = code_shape();
  ps.pattern = compiled_pattern("[0-9]+");
  memory_graph g{{ex("a"), ex("code"),
                  term::make_literal("123", std::string(vocab::xsd::integer))}};
  CHECK(validators::validate_string(g, ex("a"), ps).empty());
}

TEST_CASE("string: min_length counts characters", "[string]") {
  auto ps = code_shape();
  ps.min_length = 3;

  SECTION("multibyte characters count once") {
    memory_graph g{{ex("a"), ex("code"), term::make_literal("\xC3\xA9t\xC3\xA9")}};
    CHECK(validators::validate_string(g, ex("a"), ps).empty());
  }

  SECTION("short literal") {
    memory_graph g{{ex("a"), ex("code"), term::make_literal("ab")}};
    auto results = validators::validate_string(g, ex("a"), ps);
    REQUIRE(results.size() == 1);
    CHECK(results[0].details.get<std::int64_t>("min_length") == 3);
    CHECK(results[0].details.get<std::int64_t>("actual_length") == 2);
    CHECK(results[0].message ==
          "Value is too short (expected at least 3 characters, found 2)");
  }

  SECTION("non-literal value") {
    memory_graph g{{ex("a"), ex("code"), term::make_blank("b1")}};
    auto results = validators::validate_string(g, ex("a"), ps);
    REQUIRE(results.size() == 1);
    CHECK_FALSE(results[0].details.contains("actual_length"));
    CHECK(results[0].details.get<term>("actual_value") ==
          term::make_blank("b1"));
  }
}

TEST_CASE("string: pattern results precede min_length results", "[string]") {
  auto ps = code_shape();
  ps.pattern = compiled_pattern("[a-z]+");
  ps.min_length = 5;
  memory_graph g{{ex("a"), ex("code"), term::make_literal("AB")}};

  auto results = validators::validate_string(g, ex("a"), ps);
  REQUIRE(results.size() == 2);
  CHECK(results[0].details.contains("pattern"));
  CHECK(results[1].details.contains("min_length"));
}
