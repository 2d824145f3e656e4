#pragma once

// Logging abstraction over spdlog.
// Call sites use fmt-style format strings: log::info("fd # {} closed", fd).
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

#include <optional>
#include <string>
#include <string_view>

namespace filewire {

namespace log = spdlog;

// Map a textual level ("trace", "debug", "info", "warn", "error", "critical", "off") to a spdlog level.
// Returns std::nullopt for unknown names.
inline std::optional<log::level::level_enum> LogLevelFromString(std::string_view name) {
  const auto lvl = log::level::from_str(std::string(name));
  if (lvl == log::level::off && name != "off") {
    return std::nullopt;
  }
  return lvl;
}

}  // namespace filewire
