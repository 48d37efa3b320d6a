#include "image_cv_utils.hpp"
#include <peek/core/image.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <cstring>
#include <string>
#include <vector>

namespace peek::vision::detail {

namespace pc = peek::core;

std::optional<cv::Mat> image_to_mat(const pc::DecodedImage& image) {
  if (!image.valid()) return std::nullopt;

  const int w = static_cast<int>(image.width());
  const int h = static_cast<int>(image.height());
  auto* data = const_cast<std::byte*>(image.data().data());

  switch (image.format()) {
    case pc::PixelFormat::Gray8:
      return cv::Mat(h, w, CV_8UC1, data);
    case pc::PixelFormat::BGR8:
      return cv::Mat(h, w, CV_8UC3, data);
    case pc::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
}

pc::DecodedImage mat_to_image(const cv::Mat& mat, pc::ImageFormat source_format) {
  if (mat.empty()) return pc::DecodedImage();

  pc::PixelFormat format = pc::PixelFormat::Unknown;
  if (mat.type() == CV_8UC1) format = pc::PixelFormat::Gray8;
  else if (mat.type() == CV_8UC3) format = pc::PixelFormat::BGR8;
  else return pc::DecodedImage();

  const cv::Mat packed = mat.isContinuous() ? mat : mat.clone();
  const std::size_t len = packed.total() * packed.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), packed.ptr(), len);
  return pc::DecodedImage(static_cast<std::uint32_t>(packed.cols),
                          static_cast<std::uint32_t>(packed.rows), format, std::move(buffer),
                          source_format);
}

cv::Mat to_gray(const cv::Mat& mat) {
  if (mat.channels() == 1) return mat.clone();
  cv::Mat gray;
  cv::cvtColor(mat, gray, cv::COLOR_BGR2GRAY);
  return gray;
}

cv::Mat decode_to_mat(std::span<const std::byte> bytes) {
  if (bytes.empty()) return cv::Mat();
  const cv::Mat raw(1, static_cast<int>(bytes.size()), CV_8UC1,
                    const_cast<std::byte*>(bytes.data()));
  return cv::imdecode(raw, cv::IMREAD_COLOR);
}

std::expected<std::vector<std::byte>, pc::Error> encode_mat(const cv::Mat& mat,
                                                            pc::ImageFormat format,
                                                            pc::ImageFormat* written_format) {
  if (format == pc::ImageFormat::Gif || format == pc::ImageFormat::Unknown) {
    format = pc::ImageFormat::Png;
  }
  const std::string ext = "." + std::string(pc::extension_of(format));

  std::vector<uchar> encoded;
  if (!cv::imencode(ext, mat, encoded)) {
    return std::unexpected(pc::Error{pc::ErrorCode::DecodeError, "failed to encode " + ext});
  }
  if (written_format) *written_format = format;

  std::vector<std::byte> out(encoded.size());
  std::memcpy(out.data(), encoded.data(), encoded.size());
  return out;
}

}  // namespace peek::vision::detail
