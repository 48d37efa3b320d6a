#pragma once

#include <peek/core/error.hpp>
#include <peek/core/image.hpp>
#include <expected>
#include <string>
#include <string_view>

namespace peek::vision {

/// Abstract OCR engine used by TextExtractor.
/// Input is a preprocessed Gray8 image; output is the raw recognized text.
/// recognize() may be called from several threads at once.
class IOcrEngine {
 public:
  virtual ~IOcrEngine() = default;

  [[nodiscard]] virtual std::expected<std::string, peek::core::Error> recognize(
      const peek::core::DecodedImage& gray) const = 0;

  [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

}  // namespace peek::vision
