#include <peek/core/insights.hpp>

namespace peek::core {

std::string_view to_string(BlurLevel level) noexcept {
  switch (level) {
    case BlurLevel::Low:
      return "low";
    case BlurLevel::Medium:
      return "medium";
    case BlurLevel::High:
    default:
      return "high";
  }
}

std::string_view to_string(SceneType type) noexcept {
  switch (type) {
    case SceneType::Indoor:
      return "indoor";
    case SceneType::Outdoor:
      return "outdoor";
    case SceneType::Unknown:
    default:
      return "unknown";
  }
}

BlurLevel blur_level_for(double sharpness) noexcept {
  if (!(sharpness >= kBlurLowThreshold)) return BlurLevel::High;
  if (sharpness < kBlurHighThreshold) return BlurLevel::Medium;
  return BlurLevel::Low;
}

std::optional<BlurLevel> parse_blur_level(std::string_view s) noexcept {
  if (s == "low") return BlurLevel::Low;
  if (s == "medium") return BlurLevel::Medium;
  if (s == "high") return BlurLevel::High;
  return std::nullopt;
}

std::optional<SceneType> parse_scene_type(std::string_view s) noexcept {
  if (s == "indoor") return SceneType::Indoor;
  if (s == "outdoor") return SceneType::Outdoor;
  if (s == "unknown") return SceneType::Unknown;
  return std::nullopt;
}

}  // namespace peek::core
