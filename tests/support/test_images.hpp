#pragma once

#include <peek/core/image.hpp>
#include <peek/core/image_format.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <atomic>
#include <cstddef>
#include <cstring>
#include <filesystem>
#include <string>
#include <vector>
#include <unistd.h>

// Synthetic images for analyzer and pipeline tests.
namespace peek::test {

inline peek::core::DecodedImage to_image(const cv::Mat& mat,
                                         peek::core::ImageFormat source = peek::core::ImageFormat::Png) {
  const cv::Mat packed = mat.isContinuous() ? mat : mat.clone();
  std::vector<std::byte> buf(packed.total() * packed.elemSize());
  std::memcpy(buf.data(), packed.ptr(), buf.size());
  const auto format =
      packed.channels() == 1 ? peek::core::PixelFormat::Gray8 : peek::core::PixelFormat::BGR8;
  return peek::core::DecodedImage(static_cast<std::uint32_t>(packed.cols),
                                  static_cast<std::uint32_t>(packed.rows), format, std::move(buf),
                                  source);
}

inline std::vector<std::byte> encode(const cv::Mat& mat, const std::string& ext = ".png") {
  std::vector<uchar> raw;
  cv::imencode(ext, mat, raw);
  std::vector<std::byte> out(raw.size());
  std::memcpy(out.data(), raw.data(), raw.size());
  return out;
}

inline cv::Mat decode(const std::vector<std::byte>& bytes) {
  const cv::Mat raw(1, static_cast<int>(bytes.size()), CV_8UC1,
                    const_cast<std::byte*>(bytes.data()));
  return cv::imdecode(raw, cv::IMREAD_COLOR);
}

inline cv::Mat solid(int width, int height, cv::Scalar bgr) {
  return cv::Mat(height, width, CV_8UC3, bgr);
}

/// Three equally wide vertical bands: red, green, blue (left to right).
inline cv::Mat three_blocks(int band_width = 10, int height = 10) {
  cv::Mat img(height, band_width * 3, CV_8UC3);
  img(cv::Rect(0, 0, band_width, height)).setTo(cv::Scalar(0, 0, 255));
  img(cv::Rect(band_width, 0, band_width, height)).setTo(cv::Scalar(0, 255, 0));
  img(cv::Rect(band_width * 2, 0, band_width, height)).setTo(cv::Scalar(255, 0, 0));
  return img;
}

inline cv::Mat checkerboard(int width, int height, int cell) {
  cv::Mat img(height, width, CV_8UC3, cv::Scalar(0, 0, 0));
  for (int y = 0; y < height; ++y) {
    for (int x = 0; x < width; ++x) {
      if (((x / cell) + (y / cell)) % 2 == 0) img.at<cv::Vec3b>(y, x) = cv::Vec3b(255, 255, 255);
    }
  }
  return img;
}

/// Hand-assembled 1x1 GIF89a whose single pixel is pure red.
inline std::vector<std::byte> red_pixel_gif() {
  static const unsigned char raw[] = {
      'G',  'I',  'F',  '8',  '9',  'a',                          // header
      0x01, 0x00, 0x01, 0x00, 0x80, 0x00, 0x00,                   // 1x1, 2-entry global table
      0xFF, 0x00, 0x00, 0x00, 0x00, 0x00,                         // red, black
      0x2C, 0x00, 0x00, 0x00, 0x00, 0x01, 0x00, 0x01, 0x00, 0x00,  // image descriptor
      0x02, 0x02, 0x44, 0x01, 0x00,                               // LZW: clear, 0, end
      0x3B};
  std::vector<std::byte> out(sizeof(raw));
  std::memcpy(out.data(), raw, sizeof(raw));
  return out;
}

/// Black text on white, large enough for OCR.
inline cv::Mat text_card(const std::string& text) {
  cv::Mat img(160, 900, CV_8UC3, cv::Scalar(255, 255, 255));
  cv::putText(img, text, cv::Point(30, 105), cv::FONT_HERSHEY_SIMPLEX, 2.5, cv::Scalar(0, 0, 0), 6,
              cv::LINE_AA);
  return img;
}

/// Fresh empty directory under the system temp dir.
inline std::filesystem::path temp_dir(const std::string& prefix) {
  static std::atomic<int> counter{0};
  auto dir = std::filesystem::temp_directory_path() /
             (prefix + "-" + std::to_string(::getpid()) + "-" + std::to_string(counter++));
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

}  // namespace peek::test
