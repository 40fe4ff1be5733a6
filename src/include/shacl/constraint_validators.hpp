#pragma once

#include <shacl/graph.hpp>
#include <shacl/shapes.hpp>
#include <shacl/validation_result.hpp>

#include <vector>

// Each validator checks only the constraint kinds it owns and returns an
// empty list when none of its fields are set on the shape. They are pure and
// may run concurrently against the same graph.
namespace shacl::validators {

  // sh:minCount, sh:maxCount
  std::vector<validation_result>
  validate_cardinality(const graph& g, const term& focus_node,
                       const property_shape& shape);

  // sh:datatype, sh:class
  std::vector<validation_result>
  validate_type(const graph& g, const term& focus_node,
                const property_shape& shape);

  // sh:pattern, sh:minLength
  std::vector<validation_result>
  validate_string(const graph& g, const term& focus_node,
                  const property_shape& shape);

  // sh:in, sh:hasValue, sh:maxInclusive
  std::vector<validation_result>
  validate_value(const graph& g, const term& focus_node,
                 const property_shape& shape);

  // sh:qualifiedValueShape with an sh:class filter, sh:qualifiedMinCount
  std::vector<validation_result>
  validate_qualified(const graph& g, const term& focus_node,
                     const property_shape& shape);

} // namespace shacl::validators
