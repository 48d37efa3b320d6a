#pragma once

#include <peek/core/analyzer.hpp>
#include <peek/vision/ocr_engine.hpp>
#include <memory>
#include <string_view>

namespace peek::vision {

/// Grayscale + min-max normalization, then OCR through an IOcrEngine.
class TextExtractor : public peek::core::IAnalyzer {
 public:
  /// Images whose shorter side is below this are upscaled before OCR.
  static constexpr int kMinOcrSide = 300;

  /// Throws std::invalid_argument if engine is null.
  explicit TextExtractor(std::shared_ptr<const IOcrEngine> engine);

  [[nodiscard]] peek::core::AnalyzerKind kind() const noexcept override {
    return peek::core::AnalyzerKind::Text;
  }

  [[nodiscard]] std::expected<peek::core::PartialResult, peek::core::Error> analyze(
      const peek::core::DecodedImage& image) const override;

  /// Trims raw OCR output and counts whitespace-separated tokens.
  [[nodiscard]] static peek::core::TextResult summarize_text(std::string_view raw);

  /// The Gray8 image handed to the engine.
  [[nodiscard]] static std::expected<peek::core::DecodedImage, peek::core::Error> preprocess(
      const peek::core::DecodedImage& image);

 private:
  std::shared_ptr<const IOcrEngine> engine_;
};

}  // namespace peek::vision
