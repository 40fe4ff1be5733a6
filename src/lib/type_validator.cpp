#include <shacl/constraint_validators.hpp>

#include "validator_support.hpp"

namespace shacl::validators {

  namespace {

    bool
    has_datatype(const term& value, const iri& datatype) {
      return value.is_literal() &&
             value.get<literal>().datatype == datatype.value;
    }

  } // namespace

  std::vector<validation_result>
  validate_type(const graph& g, const term& focus_node,
                const property_shape& shape) {
    std::vector<validation_result> results;
    if (!shape.datatype && !shape.class_) return results;

    auto values = detail::path_values(g, focus_node, shape);

    if (shape.datatype) {
      for (const auto& value : values) {
        if (has_datatype(value, *shape.datatype)) continue;
        auto r = detail::make_violation(
            focus_node, shape, vocab::sh::datatype_component,
            "Value does not have required datatype <" +
                shape.datatype->value + ">");
        r.details.set("expected_datatype", term(*shape.datatype));
        r.details.set("actual_value", value);
        results.push_back(std::move(r));
      }
    }

    if (shape.class_) {
      for (const auto& value : values) {
        if (detail::is_instance_of(g, value, *shape.class_)) continue;
        auto r = detail::make_violation(
            focus_node, shape, vocab::sh::class_component,
            "Value is not an instance of class <" + shape.class_->value +
                ">");
        r.details.set("expected_class", term(*shape.class_));
        r.details.set("actual_value", value);
        results.push_back(std::move(r));
      }
    }

    return results;
  }

} // namespace shacl::validators
