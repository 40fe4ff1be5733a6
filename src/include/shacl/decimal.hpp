#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace shacl {

  // Exact numeric value of an XSD numeric lexical form: integer, decimal,
  // or double/float with an exponent, plus INF, -INF and NaN. Only ordering
  // is supported; NaN is unordered against everything including itself.
  class decimal {
  public:
    enum class kind_type : std::uint8_t {
      finite,
      positive_infinity,
      negative_infinity,
      not_a_number,
    };

  private:
    kind_type kind_ = kind_type::finite;
    bool negative_ = false;
    // Significant digits without leading or trailing zeros; empty for zero.
    std::string digits_;
    // Value is digits_ * 10^exponent_.
    std::int64_t exponent_ = 0;

  public:
    decimal() = default;
    explicit decimal(std::string_view lexical);
    explicit decimal(std::int64_t value);

    // Returns std::nullopt if the text is not a numeric lexical form.
    static std::optional<decimal>
    parse(std::string_view lexical);

    kind_type
    kind() const {
      return kind_;
    }

    bool
    is_zero() const {
      return kind_ == kind_type::finite && digits_.empty();
    }

    bool
    is_nan() const {
      return kind_ == kind_type::not_a_number;
    }

    std::string
    to_string() const;

    std::partial_ordering
    operator<=>(const decimal& other) const;

    bool
    operator==(const decimal& other) const {
      return (*this <=> other) == std::partial_ordering::equivalent;
    }

    friend std::ostream&
    operator<<(std::ostream& os, const decimal& d) {
      return os << d.to_string();
    }
  };

} // namespace shacl
