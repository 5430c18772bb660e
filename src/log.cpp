#include "dvroute/core/log.hpp"

#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace dvroute::core {

std::shared_ptr<spdlog::logger> logger() {
  static const std::shared_ptr<spdlog::logger> instance = [] {
    if (auto existing = spdlog::get("dvroute")) return existing;
    auto lg = spdlog::stderr_color_mt("dvroute");
    lg->set_level(spdlog::level::warn);
    lg->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
    return lg;
  }();
  return instance;
}

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name) {
  // spdlog::level::from_str maps unknown names to off, so match exactly here
  static constexpr std::pair<std::string_view, spdlog::level::level_enum> kLevels[] = {
    {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},   {"warn", spdlog::level::warn},
    {"warning", spdlog::level::warn}, {"err", spdlog::level::err},
    {"error", spdlog::level::err},   {"critical", spdlog::level::critical},
    {"off", spdlog::level::off},
  };
  for (const auto& [n, lvl] : kLevels) {
    if (n == name) return lvl;
  }
  return std::nullopt;
}

} // namespace dvroute::core
