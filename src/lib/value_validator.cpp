#include <shacl/constraint_validators.hpp>

#include "validator_support.hpp"

#include <algorithm>

namespace shacl::validators {

  namespace {

    bool
    contains(const std::vector<term>& terms, const term& t) {
      return std::find(terms.begin(), terms.end(), t) != terms.end();
    }

    void
    check_in(const term& focus_node, const property_shape& shape,
             const std::vector<term>& values,
             std::vector<validation_result>& results) {
      if (shape.in_list.empty()) return;
      for (const auto& value : values) {
        if (contains(shape.in_list, value)) continue;
        auto r = detail::make_violation(focus_node, shape,
                                        vocab::sh::in_component,
                                        "Value is not one of the allowed values");
        r.details.set("actual_value", value);
        results.push_back(std::move(r));
      }
    }

    void
    check_has_value(const term& focus_node, const property_shape& shape,
                    const std::vector<term>& values,
                    std::vector<validation_result>& results) {
      if (!shape.has_value) return;
      if (contains(values, *shape.has_value)) return;
      auto r = detail::make_violation(focus_node, shape,
                                      vocab::sh::has_value_component,
                                      "Required value " +
                                          shape.has_value->to_string() +
                                          " is missing");
      r.details.set("required_value", *shape.has_value);
      results.push_back(std::move(r));
    }

    void
    check_max_inclusive(const term& focus_node, const property_shape& shape,
                        const std::vector<term>& values,
                        std::vector<validation_result>& results) {
      if (!shape.max_inclusive) return;
      const auto& bound = *shape.max_inclusive;
      for (const auto& value : values) {
        std::optional<decimal> number;
        if (value.is_literal())
          number = decimal::parse(value.get<literal>().lexical);

        if (!number) {
          auto r = detail::make_violation(
              focus_node, shape, vocab::sh::max_inclusive_component,
              "Value is not numeric (expected <= " + bound.to_string() + ")");
          r.details.set("max_inclusive", bound.to_string());
          r.details.set("actual_value", value);
          results.push_back(std::move(r));
          continue;
        }

        // NaN is unordered, so it fails this test as well.
        if (*number <= bound) continue;
        auto r = detail::make_violation(
            focus_node, shape, vocab::sh::max_inclusive_component,
            "Value exceeds maximum (expected <= " + bound.to_string() +
                ", found " + number->to_string() + ")");
        r.details.set("max_inclusive", bound.to_string());
        r.details.set("actual_value", value);
        results.push_back(std::move(r));
      }
    }

  } // namespace

  std::vector<validation_result>
  validate_value(const graph& g, const term& focus_node,
                 const property_shape& shape) {
    std::vector<validation_result> results;
    if (shape.in_list.empty() && !shape.has_value && !shape.max_inclusive)
      return results;

    auto values = detail::path_values(g, focus_node, shape);
    check_in(focus_node, shape, values, results);
    check_has_value(focus_node, shape, values, results);
    check_max_inclusive(focus_node, shape, values, results);
    return results;
  }

} // namespace shacl::validators
