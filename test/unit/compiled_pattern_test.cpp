#include <shacl/compiled_pattern.hpp>

#include <catch2/catch.hpp>

#include <stdexcept>

using shacl::compiled_pattern;

TEST_CASE("compiled_pattern: full match", "[compiled_pattern]") {
  compiled_pattern p("[A-Z][a-z]+");
  CHECK(p.full_match("Alice"));
  CHECK_FALSE(p.full_match("alice"));
  CHECK_FALSE(p.full_match("Alice Smith"));
  CHECK(p.source() == "[A-Z][a-z]+");
}

TEST_CASE("compiled_pattern: search finds a substring", "[compiled_pattern]") {
  compiled_pattern p("ice");
  CHECK(p.search("Alice"));
  CHECK_FALSE(p.full_match("Alice"));
  CHECK_FALSE(p.search("Bob"));
}

TEST_CASE("compiled_pattern: UTF-8 aware", "[compiled_pattern]") {
  compiled_pattern p("^.{3}$");
  CHECK(p.full_match("h\xC3\xA9llo") == false);
  CHECK(p.full_match("\xC3\xA9t\xC3\xA9"));
}

TEST_CASE("compiled_pattern: flags", "[compiled_pattern]") {
  SECTION("i is case-insensitive") {
    CHECK(compiled_pattern("abc", "i").full_match("ABC"));
  }
  SECTION("s lets dot match newline") {
    CHECK_FALSE(compiled_pattern("a.b").full_match("a\nb"));
    CHECK(compiled_pattern("a.b", "s").full_match("a\nb"));
  }
  SECTION("m makes anchors line based") {
    CHECK(compiled_pattern("^b$", "m").search("a\nb\nc"));
    CHECK_FALSE(compiled_pattern("^b$").search("a\nb\nc"));
  }
  SECTION("q treats the pattern literally") {
    CHECK(compiled_pattern("a.b", "q").full_match("a.b"));
    CHECK_FALSE(compiled_pattern("a.b", "q").full_match("axb"));
  }
  SECTION("unknown flag") {
    CHECK_THROWS_AS(compiled_pattern("a", "x"), std::invalid_argument);
  }
}

TEST_CASE("compiled_pattern: invalid pattern throws", "[compiled_pattern]") {
  CHECK_THROWS_AS(compiled_pattern("(unclosed"), std::invalid_argument);
}

TEST_CASE("compiled_pattern: copies share the regex", "[compiled_pattern]") {
  compiled_pattern a("x+");
  auto b = a;
  CHECK(b.full_match("xxx"));
  CHECK(b.source() == a.source());
}
