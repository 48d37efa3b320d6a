#pragma once

#include <peek/vision/ocr_engine.hpp>
#include <mutex>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>

namespace peek::vision {

/// Scripted OCR engine (for tests and deployments without language data).
/// Returns the configured text for every image, or the configured error.
class MockOcrEngine : public IOcrEngine {
 public:
  MockOcrEngine() = default;
  explicit MockOcrEngine(std::string text) : text_(std::move(text)) {}

  void set_text(std::string text);
  /// Next recognize() calls fail with this error until set_text() is called.
  void set_error(peek::core::Error error);

  [[nodiscard]] std::expected<std::string, peek::core::Error> recognize(
      const peek::core::DecodedImage& gray) const override;

  [[nodiscard]] std::string_view name() const noexcept override { return "mock"; }

  [[nodiscard]] std::size_t calls() const;

 private:
  mutable std::mutex mutex_;
  std::string text_;
  std::optional<peek::core::Error> error_;
  mutable std::size_t calls_{0};
};

}  // namespace peek::vision
