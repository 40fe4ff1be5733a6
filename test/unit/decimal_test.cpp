#include <shacl/decimal.hpp>

#include <catch2/catch.hpp>

#include <compare>
#include <stdexcept>

using shacl::decimal;

TEST_CASE("decimal: parse numeric lexical forms", "[decimal]") {
  SECTION("integers and decimals") {
    CHECK(decimal("42").to_string() == "42");
    CHECK(decimal("-7").to_string() == "-7");
    CHECK(decimal("+1.50").to_string() == "1.5");
    CHECK(decimal("0.001").to_string() == "0.001");
    CHECK(decimal(".5").to_string() == "0.5");
    CHECK(decimal("100.00").to_string() == "100");
  }
  SECTION("zero forms normalize") {
    CHECK(decimal("0").is_zero());
    CHECK(decimal("-0.0").is_zero());
    CHECK(decimal("000").to_string() == "0");
  }
  SECTION("exponents") {
    CHECK(decimal("1.5e2").to_string() == "150");
    CHECK(decimal("25E-1").to_string() == "2.5");
    CHECK(decimal("1e40").to_string() == "1E40");
  }
  SECTION("special values") {
    CHECK(decimal("INF").kind() == decimal::kind_type::positive_infinity);
    CHECK(decimal("-INF").kind() == decimal::kind_type::negative_infinity);
    CHECK(decimal("NaN").is_nan());
  }
  SECTION("from integer") {
    CHECK(decimal(std::int64_t{-12}).to_string() == "-12");
  }
}

TEST_CASE("decimal: invalid text", "[decimal]") {
  CHECK_FALSE(decimal::parse(""));
  CHECK_FALSE(decimal::parse("abc"));
  CHECK_FALSE(decimal::parse("1.2.3"));
  CHECK_FALSE(decimal::parse("."));
  CHECK_FALSE(decimal::parse("1e"));
  CHECK_FALSE(decimal::parse(" 1"));
  CHECK_THROWS_AS(decimal("twelve"), std::invalid_argument);
}

TEST_CASE("decimal: exact ordering", "[decimal]") {
  SECTION("equal values with different forms") {
    CHECK(decimal("1.50") == decimal("1.5"));
    CHECK(decimal("150") == decimal("1.5e2"));
    CHECK(decimal("0") == decimal("-0"));
  }
  SECTION("ordering across magnitudes and signs") {
    CHECK(decimal("1.9") < decimal("10"));
    CHECK(decimal("-2") < decimal("-1.5"));
    CHECK(decimal("-0.1") < decimal("0"));
    CHECK(decimal("0.30000000000000000001") > decimal("0.3"));
  }
  SECTION("infinities bound every finite value") {
    CHECK(decimal("-INF") < decimal("-1e300"));
    CHECK(decimal("INF") > decimal("1e300"));
    CHECK(decimal("INF") == decimal("+INF"));
  }
  SECTION("NaN is unordered") {
    auto cmp = decimal("NaN") <=> decimal("1");
    CHECK(cmp == std::partial_ordering::unordered);
    CHECK_FALSE(decimal("NaN") == decimal("NaN"));
    CHECK_FALSE(decimal("NaN") <= decimal("INF"));
  }
}
