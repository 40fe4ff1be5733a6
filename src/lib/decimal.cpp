#include <shacl/decimal.hpp>

#include <charconv>
#include <stdexcept>
#include <string>

namespace shacl {

  namespace {

    bool
    is_digit(char c) {
      return c >= '0' && c <= '9';
    }

    // Digits beyond this many exponent places are written in E notation.
    constexpr std::int64_t max_plain_places = 30;

    // Compare magnitudes of two non-zero finite values.
    std::strong_ordering
    compare_magnitude(const std::string& da, std::int64_t ea,
                      const std::string& db, std::int64_t eb) {
      // Position of the most significant digit decides first.
      auto lead_a = static_cast<std::int64_t>(da.size()) + ea;
      auto lead_b = static_cast<std::int64_t>(db.size()) + eb;
      if (lead_a != lead_b) return lead_a <=> lead_b;
      // Same leading position: digit strings line up from the left and
      // carry no trailing zeros, so plain string order is numeric order.
      auto c = da.compare(db);
      if (c < 0) return std::strong_ordering::less;
      if (c > 0) return std::strong_ordering::greater;
      return std::strong_ordering::equal;
    }

  } // namespace

  std::optional<decimal>
  decimal::parse(std::string_view text) {
    decimal d;
    if (text == "INF" || text == "+INF") {
      d.kind_ = kind_type::positive_infinity;
      return d;
    }
    if (text == "-INF") {
      d.kind_ = kind_type::negative_infinity;
      return d;
    }
    if (text == "NaN") {
      d.kind_ = kind_type::not_a_number;
      return d;
    }

    std::size_t pos = 0;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
      negative = text[pos] == '-';
      ++pos;
    }

    std::string digits;
    std::size_t mantissa_digits = 0;
    while (pos < text.size() && is_digit(text[pos])) {
      digits += text[pos++];
      ++mantissa_digits;
    }

    std::int64_t fraction_places = 0;
    if (pos < text.size() && text[pos] == '.') {
      ++pos;
      while (pos < text.size() && is_digit(text[pos])) {
        digits += text[pos++];
        ++fraction_places;
        ++mantissa_digits;
      }
    }
    if (mantissa_digits == 0) return std::nullopt;

    std::int64_t exponent = 0;
    if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
      ++pos;
      auto rest = text.substr(pos);
      if (!rest.empty() && rest.front() == '+') rest.remove_prefix(1);
      if (rest.empty()) return std::nullopt;
      auto [end, ec] =
          std::from_chars(rest.data(), rest.data() + rest.size(), exponent);
      if (ec != std::errc() || end != rest.data() + rest.size())
        return std::nullopt;
      // Keep later arithmetic on the exponent far from overflow.
      if (exponent > 1'000'000'000 || exponent < -1'000'000'000)
        return std::nullopt;
      pos = text.size();
    }
    if (pos != text.size()) return std::nullopt;

    auto first = digits.find_first_not_of('0');
    if (first == std::string::npos) return d; // zero, sign dropped
    digits.erase(0, first);

    exponent -= fraction_places;
    auto last = digits.find_last_not_of('0');
    exponent += static_cast<std::int64_t>(digits.size() - last - 1);
    digits.erase(last + 1);

    d.negative_ = negative;
    d.digits_ = std::move(digits);
    d.exponent_ = exponent;
    return d;
  }

  decimal::decimal(std::string_view lexical) {
    auto parsed = parse(lexical);
    if (!parsed) {
      throw std::invalid_argument("decimal: not a numeric lexical form '" +
                                  std::string(lexical) + "'");
    }
    *this = std::move(*parsed);
  }

  decimal::decimal(std::int64_t value) : decimal(std::to_string(value)) {}

  std::string
  decimal::to_string() const {
    switch (kind_) {
      case kind_type::positive_infinity:
        return "INF";
      case kind_type::negative_infinity:
        return "-INF";
      case kind_type::not_a_number:
        return "NaN";
      case kind_type::finite:
        break;
    }
    if (digits_.empty()) return "0";

    std::string out = negative_ ? "-" : "";
    auto places = -exponent_;
    if (exponent_ > max_plain_places || places > max_plain_places) {
      out += digits_.substr(0, 1);
      if (digits_.size() > 1) out += "." + digits_.substr(1);
      out += "E" + std::to_string(exponent_ +
                                  static_cast<std::int64_t>(digits_.size()) -
                                  1);
      return out;
    }

    if (exponent_ >= 0) {
      out += digits_;
      out.append(static_cast<std::size_t>(exponent_), '0');
      return out;
    }

    auto size = static_cast<std::int64_t>(digits_.size());
    if (size <= places) {
      out += "0.";
      out.append(static_cast<std::size_t>(places - size), '0');
      out += digits_;
      return out;
    }
    auto split = static_cast<std::size_t>(size - places);
    out += digits_.substr(0, split) + "." + digits_.substr(split);
    return out;
  }

  std::partial_ordering
  decimal::operator<=>(const decimal& other) const {
    if (is_nan() || other.is_nan()) return std::partial_ordering::unordered;

    auto rank = [](const decimal& d) {
      switch (d.kind_) {
        case kind_type::negative_infinity:
          return -2;
        case kind_type::positive_infinity:
          return 2;
        default:
          if (d.digits_.empty()) return 0;
          return d.negative_ ? -1 : 1;
      }
    };

    int ra = rank(*this);
    int rb = rank(other);
    if (ra != rb) return ra <=> rb;
    // Same rank: both infinite of one sign, both zero, or same-signed finite.
    if (ra == 0 || ra == 2 || ra == -2) return std::partial_ordering::equivalent;

    auto magnitude =
        compare_magnitude(digits_, exponent_, other.digits_, other.exponent_);
    if (negative_) return 0 <=> magnitude;
    return magnitude;
  }

} // namespace shacl
