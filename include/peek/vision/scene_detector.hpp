#pragma once

#include <peek/core/analyzer.hpp>

namespace peek::vision {

/// HSV statistics of one image, inputs to the scene rules.
struct SceneStats {
  double blue_ratio{0.0};   // fraction of pixels in the sky/water hue band
  double green_ratio{0.0};  // fraction of pixels in the vegetation hue band
  double mean_saturation{0.0};
  double mean_value{0.0};
};

/// Coarse indoor/outdoor classification from color statistics.
class SceneDetector : public peek::core::IAnalyzer {
 public:
  static constexpr double kDominantRatio = 0.3;
  static constexpr double kTieMargin = 0.05;
  static constexpr double kBrightValue = 100.0;
  static constexpr double kDarkValue = 80.0;
  static constexpr double kLowSaturation = 50.0;

  [[nodiscard]] peek::core::AnalyzerKind kind() const noexcept override {
    return peek::core::AnalyzerKind::Scene;
  }

  [[nodiscard]] std::expected<peek::core::PartialResult, peek::core::Error> analyze(
      const peek::core::DecodedImage& image) const override;

  /// Applies the rules in order; first match wins.
  [[nodiscard]] static peek::core::SceneResult classify(const SceneStats& stats) noexcept;
};

}  // namespace peek::vision
