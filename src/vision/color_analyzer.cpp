#include <peek/vision/color_analyzer.hpp>
#include "image_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <limits>
#include <unordered_map>
#include <vector>

namespace peek::vision {

using peek::core::ColorResult;
using peek::core::Error;
using peek::core::ErrorCode;

namespace {

/// Population and first row-major position of one color group.
struct Group {
  std::size_t count{0};
  std::size_t first_index{std::numeric_limits<std::size_t>::max()};
  cv::Vec3b bgr;
};

std::vector<std::string> ranked_hex(std::vector<Group> groups, std::size_t k) {
  std::stable_sort(groups.begin(), groups.end(), [](const Group& a, const Group& b) {
    if (a.count != b.count) return a.count > b.count;
    return a.first_index < b.first_index;
  });
  std::vector<std::string> out;
  out.reserve(k);
  for (const auto& g : groups) {
    if (g.count == 0) continue;
    out.push_back(ColorAnalyzer::to_hex(g.bgr[2], g.bgr[1], g.bgr[0]));
    if (out.size() == k) break;
  }
  // Fewer groups than K (or empty clusters): repeat the most populous color.
  while (!out.empty() && out.size() < k) out.push_back(out.front());
  return out;
}

/// Exact colors if there are at most k of them; empty otherwise.
std::vector<Group> exact_groups(const cv::Mat& bgr, std::size_t k) {
  std::unordered_map<std::uint32_t, std::size_t> slot_of;
  std::vector<Group> groups;
  std::size_t index = 0;
  for (int y = 0; y < bgr.rows; ++y) {
    const auto* row = bgr.ptr<cv::Vec3b>(y);
    for (int x = 0; x < bgr.cols; ++x, ++index) {
      const cv::Vec3b px = row[x];
      const std::uint32_t packed = (static_cast<std::uint32_t>(px[2]) << 16) |
                                   (static_cast<std::uint32_t>(px[1]) << 8) | px[0];
      auto [it, inserted] = slot_of.try_emplace(packed, groups.size());
      if (inserted) {
        if (groups.size() == k) return {};
        groups.push_back(Group{0, index, px});
      }
      ++groups[it->second].count;
    }
  }
  return groups;
}

std::vector<Group> cluster_groups(const cv::Mat& bgr, std::size_t k) {
  cv::Mat samples;
  bgr.reshape(1, bgr.rows * bgr.cols).convertTo(samples, CV_32F);

  // kmeans draws from the calling thread's RNG; reseed for reproducible centers.
  cv::theRNG().state = ColorAnalyzer::kSeed;

  cv::Mat labels;
  cv::Mat centers;
  cv::kmeans(samples, static_cast<int>(k), labels,
             cv::TermCriteria(cv::TermCriteria::EPS + cv::TermCriteria::COUNT,
                              ColorAnalyzer::kMaxIterations, 1.0),
             ColorAnalyzer::kAttempts, cv::KMEANS_PP_CENTERS, centers);

  std::vector<Group> groups(k);
  for (int i = 0; i < labels.rows; ++i) {
    const int label = labels.at<int>(i);
    Group& g = groups[static_cast<std::size_t>(label)];
    ++g.count;
    g.first_index = std::min(g.first_index, static_cast<std::size_t>(i));
  }
  for (std::size_t c = 0; c < k; ++c) {
    const float* center = centers.ptr<float>(static_cast<int>(c));
    for (int ch = 0; ch < 3; ++ch) {
      groups[c].bgr[ch] = cv::saturate_cast<uchar>(std::lround(center[ch]));
    }
  }
  return groups;
}

}  // namespace

ColorAnalyzer::ColorAnalyzer(std::size_t color_count)
    : color_count_(color_count == 0 ? kDefaultColorCount : color_count) {}

std::string ColorAnalyzer::to_hex(int r, int g, int b) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", std::clamp(r, 0, 255), std::clamp(g, 0, 255),
                std::clamp(b, 0, 255));
  return buf;
}

std::expected<peek::core::PartialResult, Error> ColorAnalyzer::analyze(
    const peek::core::DecodedImage& image) const {
  auto view = detail::image_to_mat(image);
  if (!view) {
    return std::unexpected(Error{ErrorCode::DecodeError, "color: unreadable image"});
  }

  try {
    cv::Mat bgr;
    if (view->channels() == 1) cv::cvtColor(*view, bgr, cv::COLOR_GRAY2BGR);
    else bgr = *view;

    ColorResult result;
    const cv::Scalar mean = cv::mean(bgr);
    const double luma = 0.299 * mean[2] + 0.587 * mean[1] + 0.114 * mean[0];
    result.brightness = std::clamp(static_cast<int>(std::lround(luma)), 0, 255);

    cv::Mat sample = bgr;
    const std::size_t pixels = static_cast<std::size_t>(bgr.rows) * bgr.cols;
    if (pixels > kMaxClusterSamples) {
      const double scale = std::sqrt(static_cast<double>(kMaxClusterSamples) / pixels);
      cv::resize(bgr, sample, cv::Size(), scale, scale, cv::INTER_NEAREST);
    }
    if (!sample.isContinuous()) sample = sample.clone();

    std::vector<Group> groups = exact_groups(sample, color_count_);
    if (groups.empty()) groups = cluster_groups(sample, color_count_);
    result.dominant_colors = ranked_hex(std::move(groups), color_count_);
    return result;
  } catch (const cv::Exception& e) {
    return std::unexpected(Error{ErrorCode::AnalyzerError, std::string("color: ") + e.what()});
  }
}

}  // namespace peek::vision
