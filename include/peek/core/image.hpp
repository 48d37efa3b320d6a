#pragma once

#include <peek/core/image_format.hpp>
#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace peek::core {

/// Memory: DecodedImage owns one contiguous, tightly packed buffer and only
/// exposes it read-only, so one instance can be shared by concurrently running
/// analyzers without synchronization. Analyzers that need scratch space copy.

/// Pixel layout of a decoded image.
enum class PixelFormat : std::uint8_t {
  Unknown,
  Gray8,
  BGR8,  // OpenCV channel order
};

/// Decoded raster plus the container format it came from.
class DecodedImage {
 public:
  DecodedImage() = default;

  DecodedImage(std::uint32_t width,
               std::uint32_t height,
               PixelFormat format,
               std::vector<std::byte> buffer,
               ImageFormat source_format = ImageFormat::Unknown)
      : width_(width),
        height_(height),
        format_(format),
        source_format_(source_format),
        buffer_(std::move(buffer)) {}

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] PixelFormat format() const noexcept { return format_; }
  [[nodiscard]] ImageFormat source_format() const noexcept { return source_format_; }

  [[nodiscard]] std::span<const std::byte> data() const noexcept {
    return std::span<const std::byte>(buffer_.data(), buffer_.size());
  }

  [[nodiscard]] bool empty() const noexcept { return buffer_.empty(); }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return buffer_.size(); }
  [[nodiscard]] std::size_t pixel_count() const noexcept {
    return static_cast<std::size_t>(width_) * height_;
  }

  /// True when the buffer holds at least width*height*channels bytes.
  [[nodiscard]] bool valid() const noexcept;

  [[nodiscard]] static std::size_t channels(PixelFormat format) noexcept;

  [[nodiscard]] static std::size_t min_bytes(std::uint32_t width,
                                             std::uint32_t height,
                                             PixelFormat format) noexcept;

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  PixelFormat format_{PixelFormat::Unknown};
  ImageFormat source_format_{ImageFormat::Unknown};
  std::vector<std::byte> buffer_;
};

}  // namespace peek::core
