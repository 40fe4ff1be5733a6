#pragma once

#include <shacl/compiled_pattern.hpp>
#include <shacl/decimal.hpp>
#include <shacl/term.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace shacl {

  // Constraints on the values reachable from a focus node through one
  // predicate. An empty optional means that constraint is not checked.
  struct property_shape {
    term id;
    iri path;

    std::optional<std::size_t> min_count;
    std::optional<std::size_t> max_count;

    std::optional<iri> datatype;
    std::optional<iri> class_;

    std::optional<compiled_pattern> pattern;
    std::optional<std::size_t> min_length;

    std::vector<term> in_list;
    std::optional<term> has_value;
    std::optional<decimal> max_inclusive;

    std::optional<iri> qualified_class;
    std::optional<std::size_t> qualified_min_count;

    std::optional<std::string> message;
  };

  // A node-level constraint evaluated as a SELECT query. Every $this in the
  // template is replaced by the focus node; each solution is a violation.
  struct rule_constraint {
    term source_shape_id;
    std::string query_template;
    std::optional<std::string> message;
  };

  struct node_shape {
    term id;
    std::vector<iri> target_classes;
    // Set when the shape is also a class: its instances are targeted too.
    std::optional<iri> implicit_class_target;
    std::vector<property_shape> property_shapes;
    std::vector<rule_constraint> rule_constraints;
  };

} // namespace shacl
