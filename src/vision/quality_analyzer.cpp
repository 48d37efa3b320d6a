#include <peek/vision/quality_analyzer.hpp>
#include "image_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

namespace peek::vision {

using peek::core::Error;
using peek::core::ErrorCode;

namespace {

double round2(double v) { return std::round(v * 100.0) / 100.0; }

}  // namespace

double QualityAnalyzer::combine_quality(double sharpness, double contrast) noexcept {
  const double ns = std::min(std::max(sharpness, 0.0) / 10.0, 100.0);
  const double nc = std::min(std::max(contrast, 0.0), 100.0);
  return std::clamp(kSharpnessWeight * ns + kContrastWeight * nc, 0.0, 100.0);
}

std::expected<peek::core::PartialResult, Error> QualityAnalyzer::analyze(
    const peek::core::DecodedImage& image) const {
  auto view = detail::image_to_mat(image);
  if (!view) {
    return std::unexpected(Error{ErrorCode::DecodeError, "quality: unreadable image"});
  }
  try {
    const cv::Mat gray = detail::to_gray(*view);

    cv::Mat laplacian;
    cv::Laplacian(gray, laplacian, CV_64F);
    cv::Scalar lap_mean;
    cv::Scalar lap_stddev;
    cv::meanStdDev(laplacian, lap_mean, lap_stddev);
    const double sharpness = lap_stddev[0] * lap_stddev[0];

    cv::Scalar mean;
    cv::Scalar stddev;
    cv::meanStdDev(gray, mean, stddev);
    const double contrast = stddev[0];

    peek::core::QualityResult result;
    result.sharpness_score = round2(sharpness);
    result.blur_level = classify_blur(sharpness);
    result.contrast_score = round2(contrast);
    result.quality_score = round2(combine_quality(sharpness, contrast));
    return result;
  } catch (const cv::Exception& e) {
    return std::unexpected(Error{ErrorCode::AnalyzerError, std::string("quality: ") + e.what()});
  }
}

}  // namespace peek::vision
