#include <shacl/constraint_validators.hpp>

#include "validator_support.hpp"

#include <string>

namespace shacl::validators {

  std::vector<validation_result>
  validate_cardinality(const graph& g, const term& focus_node,
                       const property_shape& shape) {
    std::vector<validation_result> results;
    if (!shape.min_count && !shape.max_count) return results;

    auto count = detail::path_values(g, focus_node, shape).size();

    if (shape.min_count && count < *shape.min_count) {
      auto r = detail::make_violation(
          focus_node, shape, vocab::sh::min_count_component,
          "Property has too few values (expected at least " +
              std::to_string(*shape.min_count) + ", found " +
              std::to_string(count) + ")");
      r.details.set("actual_count", detail::as_count(count));
      r.details.set("min_count", detail::as_count(*shape.min_count));
      results.push_back(std::move(r));
    }

    if (shape.max_count && count > *shape.max_count) {
      auto r = detail::make_violation(
          focus_node, shape, vocab::sh::max_count_component,
          "Property has too many values (expected at most " +
              std::to_string(*shape.max_count) + ", found " +
              std::to_string(count) + ")");
      r.details.set("actual_count", detail::as_count(count));
      r.details.set("max_count", detail::as_count(*shape.max_count));
      results.push_back(std::move(r));
    }

    return results;
  }

} // namespace shacl::validators
