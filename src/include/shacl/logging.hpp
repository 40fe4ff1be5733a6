#pragma once

#include <spdlog/common.h>

#include <string_view>

namespace shacl {

  // Maps "trace", "debug", "info", "warn", "error", "critical" or "off" to
  // the spdlog level. Throws configuration_error for any other name.
  spdlog::level::level_enum
  parse_log_level(std::string_view name);

  // Sets the level of spdlog's default logger, which the engine logs to.
  void
  configure_logging(std::string_view level);

  // Sets the default logger's level for the lifetime of the object and
  // restores the previous level afterwards.
  class scoped_log_level {
    spdlog::level::level_enum previous_;

  public:
    explicit scoped_log_level(std::string_view level);
    ~scoped_log_level();

    scoped_log_level(const scoped_log_level&) = delete;
    scoped_log_level&
    operator=(const scoped_log_level&) = delete;
  };

} // namespace shacl
