#include <shacl/validation_options.hpp>

#include <shacl/logging.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <fstream>
#include <limits>
#include <string_view>
#include <thread>

namespace shacl {

  namespace {

    constexpr std::array<std::string_view, 4> known_keys = {
        "parallel", "max-concurrency", "timeout-ms", "log-level"};

    int
    read_positive_int(const nlohmann::json& config, const char* key) {
      const auto& value = config[key];
      if (!value.is_number_integer()) {
        throw configuration_error(std::string("options: \"") + key +
                                  "\" must be an integer");
      }
      auto n = value.get<long long>();
      if (n <= 0 || n > std::numeric_limits<int>::max()) {
        throw configuration_error(std::string("options: \"") + key +
                                  "\" must be a positive integer, got " +
                                  value.dump());
      }
      return static_cast<int>(n);
    }

  } // namespace

  void
  validate_options(const validation_options& options) {
    if (options.max_concurrency && *options.max_concurrency <= 0) {
      throw configuration_error(
          "options: max_concurrency must be positive, got " +
          std::to_string(*options.max_concurrency));
    }
    if (options.timeout && options.timeout->count() <= 0) {
      throw configuration_error("options: timeout must be positive, got " +
                                std::to_string(options.timeout->count()) +
                                "ms");
    }
  }

  int
  effective_concurrency(const validation_options& options) {
    if (options.max_concurrency) return std::max(1, *options.max_concurrency);
    auto hw = static_cast<int>(std::thread::hardware_concurrency());
    return std::max(1, hw);
  }

  validation_options
  options_from_json(const nlohmann::json& config) {
    if (!config.is_object()) {
      throw configuration_error("options: expected a JSON object");
    }
    for (const auto& [key, value] : config.items()) {
      if (std::find(known_keys.begin(), known_keys.end(), key) ==
          known_keys.end()) {
        throw configuration_error("options: unknown key \"" + key + "\"");
      }
    }

    validation_options options;
    if (config.contains("parallel")) {
      if (!config["parallel"].is_boolean())
        throw configuration_error("options: \"parallel\" must be a boolean");
      options.parallel = config["parallel"].get<bool>();
    }
    if (config.contains("max-concurrency")) {
      options.max_concurrency = read_positive_int(config, "max-concurrency");
    }
    if (config.contains("timeout-ms")) {
      options.timeout =
          std::chrono::milliseconds(read_positive_int(config, "timeout-ms"));
    }
    if (config.contains("log-level")) {
      if (!config["log-level"].is_string())
        throw configuration_error("options: \"log-level\" must be a string");
      options.log_level = config["log-level"].get<std::string>();
      parse_log_level(*options.log_level);
    }
    return options;
  }

  validation_options
  load_options(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
      throw configuration_error("options: cannot open file: " + path);
    }
    nlohmann::json config;
    try {
      config = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
      throw configuration_error("options: " + path + ": " + e.what());
    }
    return options_from_json(config);
  }

} // namespace shacl
