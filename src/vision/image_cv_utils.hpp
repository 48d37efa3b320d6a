#pragma once

#include <peek/core/error.hpp>
#include <peek/core/image.hpp>
#include <opencv2/core/mat.hpp>
#include <cstddef>
#include <expected>
#include <optional>
#include <span>
#include <vector>

namespace peek::vision::detail {

/// Non-owning cv::Mat header over the image buffer. The header is writable as
/// far as OpenCV is concerned; callers treat it as read-only.
/// Returns nullopt if the image is empty or its format unsupported.
std::optional<cv::Mat> image_to_mat(const peek::core::DecodedImage& image);

/// Copies a continuous CV_8UC1 / CV_8UC3 matrix into a DecodedImage.
peek::core::DecodedImage mat_to_image(const cv::Mat& mat,
                                      peek::core::ImageFormat source_format);

/// Grayscale copy of a BGR or gray matrix.
cv::Mat to_gray(const cv::Mat& mat);

/// cv::imdecode wrapper (IMREAD_COLOR). Empty matrix on failure.
cv::Mat decode_to_mat(std::span<const std::byte> bytes);

/// cv::imencode wrapper. GIF is not encodable by OpenCV and is written as PNG;
/// *written_format receives the format actually produced.
std::expected<std::vector<std::byte>, peek::core::Error> encode_mat(
    const cv::Mat& mat,
    peek::core::ImageFormat format,
    peek::core::ImageFormat* written_format = nullptr);

}  // namespace peek::vision::detail
