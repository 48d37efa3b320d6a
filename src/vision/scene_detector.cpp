#include <peek/vision/scene_detector.hpp>
#include "image_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

namespace peek::vision {

using peek::core::Error;
using peek::core::ErrorCode;
using peek::core::SceneResult;
using peek::core::SceneType;

SceneResult SceneDetector::classify(const SceneStats& s) noexcept {
  const bool blue = s.blue_ratio > kDominantRatio;
  const bool green = s.green_ratio > kDominantRatio;

  if (blue && green && std::abs(s.blue_ratio - s.green_ratio) <= kTieMargin) {
    return SceneResult{SceneType::Unknown, 0.5};
  }
  if (blue && s.mean_value > kBrightValue) {
    return SceneResult{SceneType::Outdoor, std::min(0.6 + 0.4 * s.blue_ratio, 1.0)};
  }
  if (green) {
    return SceneResult{SceneType::Outdoor, std::min(0.6 + 0.4 * s.green_ratio, 1.0)};
  }
  if (s.mean_value < kDarkValue) return SceneResult{SceneType::Indoor, 0.7};
  if (s.mean_saturation < kLowSaturation) return SceneResult{SceneType::Indoor, 0.6};
  return SceneResult{SceneType::Unknown, 0.5};
}

std::expected<peek::core::PartialResult, Error> SceneDetector::analyze(
    const peek::core::DecodedImage& image) const {
  auto view = detail::image_to_mat(image);
  if (!view) {
    return std::unexpected(Error{ErrorCode::DecodeError, "scene: unreadable image"});
  }
  try {
    cv::Mat bgr;
    if (view->channels() == 1) cv::cvtColor(*view, bgr, cv::COLOR_GRAY2BGR);
    else bgr = *view;

    cv::Mat hsv;
    cv::cvtColor(bgr, hsv, cv::COLOR_BGR2HSV);

    cv::Mat blue_mask;
    cv::Mat green_mask;
    cv::inRange(hsv, cv::Scalar(90, 50, 50), cv::Scalar(130, 255, 255), blue_mask);
    cv::inRange(hsv, cv::Scalar(35, 50, 50), cv::Scalar(85, 255, 255), green_mask);

    const double total = static_cast<double>(hsv.total());
    const cv::Scalar mean = cv::mean(hsv);

    SceneStats stats;
    stats.blue_ratio = cv::countNonZero(blue_mask) / total;
    stats.green_ratio = cv::countNonZero(green_mask) / total;
    stats.mean_saturation = mean[1];
    stats.mean_value = mean[2];
    return classify(stats);
  } catch (const cv::Exception& e) {
    return std::unexpected(Error{ErrorCode::AnalyzerError, std::string("scene: ") + e.what()});
  }
}

}  // namespace peek::vision
