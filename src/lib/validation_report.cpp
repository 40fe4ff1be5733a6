#include <shacl/validation_report.hpp>

#include <algorithm>
#include <iterator>

namespace shacl {

  namespace {

    template <typename Pred>
    std::vector<validation_result>
    select(const std::vector<validation_result>& results, Pred pred) {
      std::vector<validation_result> out;
      std::copy_if(results.begin(), results.end(), std::back_inserter(out),
                   pred);
      return out;
    }

  } // namespace

  std::string_view
  to_string(report_status s) {
    switch (s) {
      case report_status::conforms:
        return "conforms";
      case report_status::violates:
        return "violates";
      case report_status::inconclusive:
        return "inconclusive";
    }
    return "unknown";
  }

  report_status
  validation_report::status() const {
    if (!conforms()) return report_status::violates;
    if (!fully_evaluated()) return report_status::inconclusive;
    return report_status::conforms;
  }

  std::size_t
  validation_report::count(severity s) const {
    return static_cast<std::size_t>(
        std::count_if(results_.begin(), results_.end(),
                      [s](const validation_result& r) {
                        return r.severity == s;
                      }));
  }

  std::vector<validation_result>
  validation_report::violations() const {
    return select(results_, [](const validation_result& r) {
      return r.severity == severity::violation;
    });
  }

  std::vector<validation_result>
  validation_report::engine_errors() const {
    return select(results_, [](const validation_result& r) {
      return r.severity == severity::engine_error;
    });
  }

  std::vector<validation_result>
  validation_report::results_for(const term& focus_node) const {
    return select(results_, [&](const validation_result& r) {
      return r.focus_node == focus_node;
    });
  }

  std::vector<validation_result>
  validation_report::results_from(const term& source_shape) const {
    return select(results_, [&](const validation_result& r) {
      return r.source_shape == source_shape;
    });
  }

} // namespace shacl
