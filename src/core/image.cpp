#include <peek/core/image.hpp>
#include <cstddef>

namespace peek::core {

std::size_t DecodedImage::channels(PixelFormat format) noexcept {
  switch (format) {
    case PixelFormat::Gray8:
      return 1;
    case PixelFormat::BGR8:
      return 3;
    case PixelFormat::Unknown:
    default:
      return 0;
  }
}

std::size_t DecodedImage::min_bytes(std::uint32_t width,
                                    std::uint32_t height,
                                    PixelFormat format) noexcept {
  return static_cast<std::size_t>(width) * height * channels(format);
}

bool DecodedImage::valid() const noexcept {
  if (width_ == 0 || height_ == 0 || format_ == PixelFormat::Unknown) return false;
  return buffer_.size() >= min_bytes(width_, height_, format_);
}

}  // namespace peek::core
