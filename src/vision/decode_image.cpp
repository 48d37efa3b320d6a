#include <peek/vision/decode_image.hpp>
#include "image_cv_utils.hpp"
#include <peek/core/image_format.hpp>
#include <opencv2/core.hpp>

namespace peek::vision {

std::expected<peek::core::DecodedImage, peek::core::Error> decode_image(
    std::span<const std::byte> bytes) {
  using peek::core::Error;
  using peek::core::ErrorCode;

  if (bytes.empty()) {
    return std::unexpected(Error{ErrorCode::DecodeError, "empty image payload"});
  }

  cv::Mat mat;
  try {
    mat = detail::decode_to_mat(bytes);
  } catch (const cv::Exception& e) {
    return std::unexpected(Error{ErrorCode::DecodeError, e.what()});
  }
  if (mat.empty()) {
    return std::unexpected(Error{ErrorCode::DecodeError, "bytes are not a decodable image"});
  }
  return detail::mat_to_image(mat, peek::core::sniff_format(bytes));
}

}  // namespace peek::vision
