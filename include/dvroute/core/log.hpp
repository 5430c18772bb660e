/* Library logger. */
#pragma once

#include <memory>
#include <optional>
#include <string_view>

#include <spdlog/spdlog.h>

namespace dvroute::core {

// Shared "dvroute" logger; created on first use with a stderr color sink and
// level warn. Callers may adjust the level or replace sinks.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

// Maps trace|debug|info|warn(ing)|err(or)|critical|off to a level; nullopt otherwise.
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name);

} // namespace dvroute::core
