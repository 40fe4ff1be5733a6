#include <shacl/constraint_validators.hpp>

#include "validator_support.hpp"

#include <algorithm>
#include <string>

namespace shacl::validators {

  std::vector<validation_result>
  validate_qualified(const graph& g, const term& focus_node,
                     const property_shape& shape) {
    std::vector<validation_result> results;
    if (!shape.qualified_class || !shape.qualified_min_count) return results;

    auto values = detail::path_values(g, focus_node, shape);
    const auto& cls = *shape.qualified_class;
    auto qualified = static_cast<std::size_t>(
        std::count_if(values.begin(), values.end(), [&](const term& v) {
          return detail::is_instance_of(g, v, cls);
        }));

    if (qualified >= *shape.qualified_min_count) return results;

    auto r = detail::make_violation(
        focus_node, shape, vocab::sh::qualified_min_count_component,
        "Property has too few values of required type (expected at least " +
            std::to_string(*shape.qualified_min_count) + " instances of <" +
            cls.value + ">, found " + std::to_string(qualified) + ")");
    r.details.set("qualified_count", detail::as_count(qualified));
    r.details.set("qualified_min_count",
                  detail::as_count(*shape.qualified_min_count));
    r.details.set("qualified_class", term(cls));
    r.details.set("total_values", detail::as_count(values.size()));
    results.push_back(std::move(r));
    return results;
  }

} // namespace shacl::validators
