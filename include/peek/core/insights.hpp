#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace peek::core {

/// Axis-aligned box in original-image pixel coordinates.
struct FaceBox {
  int x{0};
  int y{0};
  int width{0};
  int height{0};

  friend bool operator==(const FaceBox&, const FaceBox&) = default;
};

/// Blur category; inverse of sharpness.
enum class BlurLevel : std::uint8_t {
  Low,
  Medium,
  High,
};

enum class SceneType : std::uint8_t {
  Indoor,
  Outdoor,
  Unknown,
};

/// Sharpness below kBlurLowThreshold is high blur, below kBlurHighThreshold medium, else low.
inline constexpr double kBlurLowThreshold = 100.0;
inline constexpr double kBlurHighThreshold = 500.0;

[[nodiscard]] BlurLevel blur_level_for(double sharpness) noexcept;

[[nodiscard]] std::string_view to_string(BlurLevel level) noexcept;
[[nodiscard]] std::string_view to_string(SceneType type) noexcept;
[[nodiscard]] std::optional<BlurLevel> parse_blur_level(std::string_view s) noexcept;
[[nodiscard]] std::optional<SceneType> parse_scene_type(std::string_view s) noexcept;

// Partial results, one per analyzer.

struct ColorResult {
  std::vector<std::string> dominant_colors;  // "#rrggbb", most populous first
  int brightness{0};                         // mean luma, [0,255]
};

struct QualityResult {
  double sharpness_score{0.0};  // variance of Laplacian
  BlurLevel blur_level{BlurLevel::High};
  double contrast_score{0.0};   // RMS contrast
  double quality_score{0.0};    // [0,100]
};

struct FaceResult {
  std::vector<FaceBox> face_locations;  // detector scan order
};

struct TextResult {
  bool text_found{false};
  std::string extracted_text;
  std::uint32_t word_count{0};
};

struct SceneResult {
  SceneType scene_type{SceneType::Unknown};
  double scene_confidence{0.0};  // [0,1]
};

/// Aggregate of the partial results. A disengaged member means that analyzer
/// failed; it serializes as nulls for the analyzer's fields.
struct Insights {
  std::optional<ColorResult> color;
  std::optional<QualityResult> quality;
  std::optional<FaceResult> faces;
  std::optional<TextResult> text;
  std::optional<SceneResult> scene;

  [[nodiscard]] std::uint32_t faces_detected() const noexcept {
    return faces ? static_cast<std::uint32_t>(faces->face_locations.size()) : 0u;
  }
};

}  // namespace peek::core
