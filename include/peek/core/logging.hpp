#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string_view>

namespace peek::core {

/// Process-wide "peek" logger (colored stdout sink), created on first use.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

/// Sets the level from "trace" | "debug" | "info" | "warn" | "error" | "off"
/// (case-insensitive). Returns false and keeps the current level if unknown.
bool set_log_level(std::string_view level);

}  // namespace peek::core
