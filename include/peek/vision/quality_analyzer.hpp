#pragma once

#include <peek/core/analyzer.hpp>

namespace peek::vision {

/// Sharpness (variance of the Laplacian), RMS contrast and a combined quality score.
class QualityAnalyzer : public peek::core::IAnalyzer {
 public:
  static constexpr double kBlurLowThreshold = peek::core::kBlurLowThreshold;
  static constexpr double kBlurHighThreshold = peek::core::kBlurHighThreshold;
  static constexpr double kSharpnessWeight = 0.6;
  static constexpr double kContrastWeight = 0.4;

  [[nodiscard]] peek::core::AnalyzerKind kind() const noexcept override {
    return peek::core::AnalyzerKind::Quality;
  }

  [[nodiscard]] std::expected<peek::core::PartialResult, peek::core::Error> analyze(
      const peek::core::DecodedImage& image) const override;

  /// Same thresholds the aggregate uses after clamping; see peek::core::blur_level_for().
  [[nodiscard]] static peek::core::BlurLevel classify_blur(double sharpness) noexcept {
    return peek::core::blur_level_for(sharpness);
  }

  /// clamp(0.6 * min(sharpness/10, 100) + 0.4 * min(contrast, 100), 0, 100).
  [[nodiscard]] static double combine_quality(double sharpness, double contrast) noexcept;
};

}  // namespace peek::vision
