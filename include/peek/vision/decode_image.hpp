#pragma once

#include <peek/core/error.hpp>
#include <peek/core/image.hpp>
#include <cstddef>
#include <expected>
#include <span>

namespace peek::vision {

/// Decode PNG/JPEG/GIF/BMP/WEBP bytes into a BGR8 image (first frame for GIF).
/// Fails with ErrorCode::DecodeError if the bytes are not a readable image.
[[nodiscard]] std::expected<peek::core::DecodedImage, peek::core::Error> decode_image(
    std::span<const std::byte> bytes);

}  // namespace peek::vision
