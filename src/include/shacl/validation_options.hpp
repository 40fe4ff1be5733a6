#pragma once

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

namespace shacl {

  // Invalid engine options. Raised before any validation work starts.
  class configuration_error : public std::invalid_argument {
  public:
    using std::invalid_argument::invalid_argument;
  };

  struct validation_options {
    bool parallel = false;
    // Worker limit in parallel mode; unset means the hardware concurrency.
    std::optional<int> max_concurrency;
    // Per-unit time limit; unset means no limit.
    std::optional<std::chrono::milliseconds> timeout;
    // Logger level name for configure_logging; unset leaves it alone.
    std::optional<std::string> log_level;
  };

  // Throws configuration_error when max_concurrency or timeout is present
  // but not positive.
  void
  validate_options(const validation_options& options);

  // Number of workers a parallel run may use: max_concurrency if set,
  // otherwise std::thread::hardware_concurrency(), never less than 1.
  int
  effective_concurrency(const validation_options& options);

  // Reads "parallel", "max-concurrency", "timeout-ms" and "log-level" from
  // a JSON object. Unknown keys, wrong value types and out-of-range values
  // raise configuration_error.
  validation_options
  options_from_json(const nlohmann::json& config);

  // Loads options from a JSON file.
  validation_options
  load_options(const std::string& path);

} // namespace shacl
