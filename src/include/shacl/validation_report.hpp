#pragma once

#include <shacl/validation_result.hpp>

#include <cstddef>
#include <string_view>
#include <vector>

namespace shacl {

  enum class report_status {
    conforms,     // no violations, every unit fully evaluated
    violates,     // at least one violation
    inconclusive, // no violations, but some units failed to evaluate
  };

  std::string_view
  to_string(report_status s);

  // The outcome of one validation run. Conformance is always derived from
  // the results, never stored.
  class validation_report {
    std::vector<validation_result> results_;

  public:
    validation_report() = default;

    explicit validation_report(std::vector<validation_result> results)
        : results_(std::move(results)) {}

    const std::vector<validation_result>&
    results() const {
      return results_;
    }

    bool
    conforms() const {
      return count(severity::violation) == 0;
    }

    bool
    fully_evaluated() const {
      return count(severity::engine_error) == 0;
    }

    report_status
    status() const;

    std::size_t
    count(severity s) const;

    std::vector<validation_result>
    violations() const;

    std::vector<validation_result>
    engine_errors() const;

    std::vector<validation_result>
    results_for(const term& focus_node) const;

    std::vector<validation_result>
    results_from(const term& source_shape) const;
  };

} // namespace shacl
