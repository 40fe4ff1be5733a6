#include <shacl/logging.hpp>

#include <shacl/validation_options.hpp>

#include <spdlog/spdlog.h>

#include <array>
#include <string>
#include <utility>

namespace shacl {

  spdlog::level::level_enum
  parse_log_level(std::string_view name) {
    using spdlog::level::level_enum;
    static constexpr std::array<std::pair<std::string_view, level_enum>, 7>
        levels = {{
            {"trace", level_enum::trace},
            {"debug", level_enum::debug},
            {"info", level_enum::info},
            {"warn", level_enum::warn},
            {"error", level_enum::err},
            {"critical", level_enum::critical},
            {"off", level_enum::off},
        }};
    for (const auto& [n, level] : levels) {
      if (n == name) return level;
    }
    throw configuration_error("logging: unknown level \"" + std::string(name) +
                              "\"");
  }

  void
  configure_logging(std::string_view level) {
    spdlog::set_level(parse_log_level(level));
  }

  scoped_log_level::scoped_log_level(std::string_view level)
      : previous_(spdlog::get_level()) {
    configure_logging(level);
  }

  scoped_log_level::~scoped_log_level() {
    spdlog::set_level(previous_);
  }

} // namespace shacl
