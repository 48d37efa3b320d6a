#pragma once

#include <peek/core/analyzer.hpp>
#include <cstddef>
#include <cstdint>
#include <string>

namespace peek::vision {

/// Dominant colors by k-means over pixel colors, plus mean luma brightness.
///
/// Colors come out as "#rrggbb", most populous cluster first; equal populations
/// are ordered by where the cluster first appears in row-major scan order.
/// Images with at most K distinct colors skip clustering and report the exact
/// colors, padded with the most populous one, so a uniform image yields K
/// identical entries.
class ColorAnalyzer : public peek::core::IAnalyzer {
 public:
  static constexpr std::size_t kDefaultColorCount = 5;
  /// Images above this many pixels are subsampled (nearest neighbour) before clustering.
  static constexpr std::size_t kMaxClusterSamples = 160 * 160;
  static constexpr int kAttempts = 3;
  static constexpr int kMaxIterations = 20;
  static constexpr std::uint64_t kSeed = 42;

  explicit ColorAnalyzer(std::size_t color_count = kDefaultColorCount);

  [[nodiscard]] peek::core::AnalyzerKind kind() const noexcept override {
    return peek::core::AnalyzerKind::Color;
  }

  [[nodiscard]] std::expected<peek::core::PartialResult, peek::core::Error> analyze(
      const peek::core::DecodedImage& image) const override;

  [[nodiscard]] std::size_t color_count() const noexcept { return color_count_; }

  /// "#rrggbb" from 8-bit channels.
  [[nodiscard]] static std::string to_hex(int r, int g, int b);

 private:
  std::size_t color_count_;
};

}  // namespace peek::vision
