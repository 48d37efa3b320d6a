#include <peek/vision/mock_ocr_engine.hpp>
#include <utility>

namespace peek::vision {

void MockOcrEngine::set_text(std::string text) {
  std::lock_guard lock(mutex_);
  text_ = std::move(text);
  error_.reset();
}

void MockOcrEngine::set_error(peek::core::Error error) {
  std::lock_guard lock(mutex_);
  error_ = std::move(error);
}

std::expected<std::string, peek::core::Error> MockOcrEngine::recognize(
    const peek::core::DecodedImage& gray) const {
  std::lock_guard lock(mutex_);
  ++calls_;
  if (gray.empty()) {
    return std::unexpected(peek::core::Error{peek::core::ErrorCode::DecodeError, "ocr: empty image"});
  }
  if (error_) return std::unexpected(*error_);
  return text_;
}

std::size_t MockOcrEngine::calls() const {
  std::lock_guard lock(mutex_);
  return calls_;
}

}  // namespace peek::vision
