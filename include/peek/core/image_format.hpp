#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace peek::core {

/// Container formats accepted for upload.
enum class ImageFormat : std::uint8_t {
  Unknown,
  Png,
  Jpeg,
  Gif,
  Bmp,
  Webp,
};

/// Identify the container from its magic bytes. Unknown if none matches.
[[nodiscard]] ImageFormat sniff_format(std::span<const std::byte> bytes) noexcept;

/// "image/png" -> Png. "image/jpg" is accepted as an alias of image/jpeg.
[[nodiscard]] ImageFormat format_from_content_type(std::string_view content_type) noexcept;

/// "png", "jpg", "jpeg", ... (case-insensitive, no leading dot).
[[nodiscard]] ImageFormat format_from_extension(std::string_view ext) noexcept;

[[nodiscard]] std::string_view content_type_of(ImageFormat format) noexcept;

/// Canonical file extension without dot ("png", "jpg", ...); "bin" for Unknown.
[[nodiscard]] std::string_view extension_of(ImageFormat format) noexcept;

}  // namespace peek::core
