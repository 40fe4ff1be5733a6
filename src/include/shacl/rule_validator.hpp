#pragma once

#include <shacl/graph.hpp>
#include <shacl/query_executor.hpp>
#include <shacl/shapes.hpp>
#include <shacl/validation_result.hpp>

#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace shacl {

  // Substitutes focus_node into a rule query template. A leading
  // "SELECT $this" projection is rewritten to report the focus node as
  // ?this; every other $this becomes the N-Triples form of focus_node.
  std::string
  bind_focus_node(std::string_view query_template, const term& focus_node);

  // Evaluates each rule constraint for focus_node; every solution row is one
  // violation whose details are the row's bindings. query_error from the
  // executor propagates to the caller.
  std::vector<validation_result>
  validate_rules(const graph& g, const term& focus_node,
                 const std::vector<rule_constraint>& constraints,
                 const query_executor& executor, std::stop_token stop = {});

} // namespace shacl
