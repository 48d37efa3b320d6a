#include <peek/core/logging.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <cctype>
#include <string>

namespace peek::core {

std::shared_ptr<spdlog::logger> logger() {
  static const std::shared_ptr<spdlog::logger> instance = [] {
    if (auto existing = spdlog::get("peek")) return existing;
    auto created = spdlog::stdout_color_mt("peek");
    created->set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] [%t] %v");
    return created;
  }();
  return instance;
}

bool set_log_level(std::string_view level) {
  std::string name(level);
  std::transform(name.begin(), name.end(), name.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (name == "warning") name = "warn";

  const auto parsed = spdlog::level::from_str(name);
  // from_str maps unknown names to "off"; only accept "off" when asked for it.
  if (parsed == spdlog::level::off && name != "off") {
    logger()->warn("invalid log level '{}', keeping {}", level,
                   spdlog::level::to_string_view(logger()->level()));
    return false;
  }
  logger()->set_level(parsed);
  return true;
}

}  // namespace peek::core
