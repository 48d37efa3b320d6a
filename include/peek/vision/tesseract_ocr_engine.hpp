#pragma once

#include <peek/vision/ocr_engine.hpp>
#include <memory>
#include <string>

namespace peek::vision {

/// Tesseract OCR engine (built when PEEK_HAS_TESSERACT is defined).
///
/// The constructor checks that the language data loads and throws
/// std::runtime_error if it cannot. Tesseract's API object is not reentrant,
/// so each calling thread initialises and keeps its own; calls never wait on
/// each other.
class TesseractOcrEngine : public IOcrEngine {
 public:
  /// \param tessdata_path Directory holding <language>.traineddata; empty uses
  ///        Tesseract's compiled-in default (TESSDATA_PREFIX).
  /// \param language Tesseract language code, e.g. "eng".
  explicit TesseractOcrEngine(std::string tessdata_path = {}, std::string language = "eng");

  ~TesseractOcrEngine() override;

  TesseractOcrEngine(const TesseractOcrEngine&) = delete;
  TesseractOcrEngine& operator=(const TesseractOcrEngine&) = delete;

  [[nodiscard]] std::expected<std::string, peek::core::Error> recognize(
      const peek::core::DecodedImage& gray) const override;

  [[nodiscard]] std::string_view name() const noexcept override { return "tesseract"; }

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace peek::vision
