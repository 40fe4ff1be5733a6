#include <shacl/basic_query_executor.hpp>
#include <shacl/memory_graph.hpp>
#include <shacl/rule_validator.hpp>
#include <shacl/vocabulary.hpp>

#include <catch2/catch.hpp>

#include <string>
#include <vector>

using namespace shacl;

namespace {

  term
  ex(const std::string& local) {
    return term::make_iri("http://example.org/" + local);
  }

  // Returns canned rows and remembers the last query it saw.
  class scripted_executor : public query_executor {
  public:
    std::vector<binding_row> rows;
    bool fail = false;
    mutable std::string last_query;

    std::vector<binding_row>
    execute(const graph&, std::string_view query,
            std::stop_token) const override {
      last_query = std::string(query);
      if (fail) throw query_error("boom");
      return rows;
    }
  };

  rule_constraint
  rule(const std::string& query) {
    return rule_constraint{ex("RuleShape"), query, std::nullopt};
  }

} // namespace

TEST_CASE("rule: bind_focus_node substitution", "[rule]") {
  SECTION("IRI focus node") {
    CHECK(bind_focus_node("ASK { $this ?p ?o }", ex("n1")) ==
          "ASK { <http://example.org/n1> ?p ?o }");
  }
  SECTION("blank node focus node") {
    CHECK(bind_focus_node("SELECT ?o WHERE { $this ?p ?o }",
                          term::make_blank("b7")) ==
          "SELECT ?o WHERE { _:b7 ?p ?o }");
  }
  SECTION("every occurrence is replaced") {
    auto q = bind_focus_node(
        "SELECT ?x WHERE { $this ?p ?x . ?x ?q $this }", ex("n"));
    CHECK(q == "SELECT ?x WHERE { <http://example.org/n> ?p ?x . ?x ?q "
               "<http://example.org/n> }");
  }
  SECTION("longer variable names are left alone") {
    CHECK(bind_focus_node("SELECT ?o WHERE { $thisNode ?p ?o }", ex("n")) ==
          "SELECT ?o WHERE { $thisNode ?p ?o }");
  }
  SECTION("projected $this becomes a bound ?this") {
    CHECK(bind_focus_node("SELECT $this ?v WHERE { $this ?p ?v }", ex("n")) ==
          "SELECT ?this ?v WHERE { BIND(<http://example.org/n> AS ?this) . "
          "<http://example.org/n> ?p ?v }");
  }
  SECTION("projected $this without WHERE") {
    CHECK(bind_focus_node("SELECT $this ?v { $this ?p ?v }", ex("n")) ==
          "SELECT ?this ?v { BIND(<http://example.org/n> AS ?this) . "
          "<http://example.org/n> ?p ?v }");
  }
}

TEST_CASE("rule: one violation per row", "[rule]") {
  memory_graph g;
  scripted_executor exec;
  exec.rows = {
      binding_row{{"value", term::make_literal("x")}},
      binding_row{{"value", term::make_literal("y")}, {"other", ex("o")}},
  };

  auto results = validate_rules(
      g, ex("n1"), {rule("SELECT ?value WHERE { $this ?p ?value }")}, exec);
  REQUIRE(results.size() == 2);
  CHECK(exec.last_query ==
        "SELECT ?value WHERE { <http://example.org/n1> ?p ?value }");

  CHECK(results[0].focus_node == ex("n1"));
  CHECK(results[0].source_shape == ex("RuleShape"));
  CHECK(results[0].severity == severity::violation);
  CHECK_FALSE(results[0].path);
  CHECK(results[0].message == "Rule constraint violated");
  CHECK(results[0].details.size() == 1);
  CHECK(results[0].details.get<term>("value") == term::make_literal("x"));

  CHECK(results[1].details.size() == 2);
  CHECK(results[1].details.get<term>("other") == ex("o"));
}

TEST_CASE("rule: zero rows conform", "[rule]") {
  memory_graph g;
  scripted_executor exec;
  CHECK(validate_rules(g, ex("n1"), {rule("SELECT ?x WHERE { }")}, exec)
            .empty());
}

TEST_CASE("rule: constraint message is used", "[rule]") {
  memory_graph g;
  scripted_executor exec;
  exec.rows = {binding_row{}};
  auto r = rule("SELECT * WHERE { }");
  r.message = "Custom rule failed";
  auto results = validate_rules(g, ex("n1"), {r}, exec);
  REQUIRE(results.size() == 1);
  CHECK(results[0].message == "Custom rule failed");
  CHECK(results[0].details.empty());
}

TEST_CASE("rule: query errors propagate", "[rule]") {
  memory_graph g;
  scripted_executor exec;
  exec.fail = true;
  CHECK_THROWS_AS(validate_rules(g, ex("n1"), {rule("SELECT ?x {}")}, exec),
                  query_error);
}

TEST_CASE("rule: end to end with the basic executor", "[rule]") {
  memory_graph g{
      {ex("n1"), ex("age"),
       term::make_literal("-3", std::string(vocab::xsd::integer))},
      {ex("n1"), ex("age"),
       term::make_literal("20", std::string(vocab::xsd::integer))},
  };
  basic_query_executor exec;
  auto results = validate_rules(
      g, ex("n1"),
      {rule("PREFIX ex: <http://example.org/>\n"
            "SELECT $this ?age WHERE { $this ex:age ?age . FILTER(?age < 0) }")},
      exec);

  REQUIRE(results.size() == 1);
  CHECK(results[0].details.get<term>("this") == ex("n1"));
  CHECK(results[0].details.get<term>("age") ==
        term::make_literal("-3", std::string(vocab::xsd::integer)));
}

TEST_CASE("rule: projected focus node runs for every kind of focus",
          "[rule]") {
  auto b1 = term::make_blank("b1");
  memory_graph g{
      {b1, ex("p"), ex("v")},
      {ex("n1"), ex("p"), ex("v")},
  };
  basic_query_executor exec;

  SECTION("blank node focus node") {
    auto results = validate_rules(
        g, b1, {rule("SELECT $this ?v WHERE { $this <http://example.org/p> ?v }")},
        exec);
    REQUIRE(results.size() == 1);
    CHECK(results[0].focus_node == b1);
    CHECK(results[0].details.get<term>("this") == b1);
    CHECK(results[0].details.get<term>("v") == ex("v"));
  }

  SECTION("query without WHERE") {
    auto results = validate_rules(
        g, ex("n1"), {rule("SELECT $this ?v { $this <http://example.org/p> ?v }")},
        exec);
    REQUIRE(results.size() == 1);
    CHECK(results[0].details.get<term>("this") == ex("n1"));
  }
}
