#pragma once

#include <shacl/graph.hpp>
#include <shacl/query_executor.hpp>
#include <shacl/shapes.hpp>
#include <shacl/validation_options.hpp>
#include <shacl/validation_report.hpp>

#include <memory>
#include <stdexcept>
#include <stop_token>
#include <vector>

namespace shacl {

  // A unit of work noticed its stop request between two constraint checks.
  class unit_timeout : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  // Validates a data graph against node shapes.
  //
  // The unit of work is one (node shape, focus node) pair. A unit runs every
  // property shape through the cardinality, type, string, value and
  // qualified validators in that order, then the node shape's rule
  // constraints. Units never share mutable state, so in parallel mode they
  // run on a thread pool without locking; results are still assembled in
  // sequential order.
  //
  // A unit that times out, whose rule query fails, or that throws is
  // replaced by a single engine_error result. Only configuration_error
  // escapes run().
  class validation_engine {
    std::shared_ptr<const query_executor> executor_;

  public:
    // Uses basic_query_executor for rule constraints.
    validation_engine();

    explicit validation_engine(std::shared_ptr<const query_executor> executor);

    // options.log_level applies to spdlog's default logger for the duration
    // of the call only.
    validation_report
    run(const graph& g, const std::vector<node_shape>& shapes,
        const validation_options& options = {}) const;

    // Focus nodes of shape in discovery order, without duplicates.
    static std::vector<term>
    select_targets(const graph& g, const node_shape& shape);

    // Results of one unit. Throws unit_timeout once stop is requested and
    // lets query_error and other exceptions propagate.
    std::vector<validation_result>
    evaluate_unit(const graph& g, const node_shape& shape,
                  const term& focus_node, std::stop_token stop = {}) const;
  };

  // Runs a default validation_engine.
  validation_report
  validate(const graph& g, const std::vector<node_shape>& shapes,
           const validation_options& options = {});

} // namespace shacl
