#include <shacl/constraint_validators.hpp>

#include "validator_support.hpp"

#include <string>

namespace shacl::validators {

  std::vector<validation_result>
  validate_string(const graph& g, const term& focus_node,
                  const property_shape& shape) {
    std::vector<validation_result> results;
    if (!shape.pattern && !shape.min_length) return results;

    auto values = detail::path_values(g, focus_node, shape);

    if (shape.pattern) {
      for (const auto& value : values) {
        // IRIs and blank nodes have no lexical form to match.
        if (value.is_literal() &&
            shape.pattern->full_match(value.get<literal>().lexical))
          continue;
        auto r = detail::make_violation(
            focus_node, shape, vocab::sh::pattern_component,
            "Value does not match required pattern \"" +
                shape.pattern->source() + "\"");
        r.details.set("pattern", shape.pattern->source());
        r.details.set("actual_value", value);
        results.push_back(std::move(r));
      }
    }

    if (shape.min_length) {
      for (const auto& value : values) {
        if (!value.is_literal()) {
          auto r = detail::make_violation(
              focus_node, shape, vocab::sh::min_length_component,
              "Value is not a literal (expected at least " +
                  std::to_string(*shape.min_length) + " characters)");
          r.details.set("min_length", detail::as_count(*shape.min_length));
          r.details.set("actual_value", value);
          results.push_back(std::move(r));
          continue;
        }

        auto length = detail::utf8_length(value.get<literal>().lexical);
        if (length >= *shape.min_length) continue;
        auto r = detail::make_violation(
            focus_node, shape, vocab::sh::min_length_component,
            "Value is too short (expected at least " +
                std::to_string(*shape.min_length) + " characters, found " +
                std::to_string(length) + ")");
        r.details.set("min_length", detail::as_count(*shape.min_length));
        r.details.set("actual_length", detail::as_count(length));
        r.details.set("actual_value", value);
        results.push_back(std::move(r));
      }
    }

    return results;
  }

} // namespace shacl::validators
