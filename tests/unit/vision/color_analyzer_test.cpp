#include <peek/vision/color_analyzer.hpp>
#include <gtest/gtest.h>
#include "test_images.hpp"
#include <regex>
#include <string>
#include <vector>

namespace pc = peek::core;
namespace pv = peek::vision;
namespace pt = peek::test;

namespace {

pc::ColorResult analyze(const pv::ColorAnalyzer& a, const cv::Mat& img) {
  auto r = a.analyze(pt::to_image(img));
  EXPECT_TRUE(r.has_value());
  return std::get<pc::ColorResult>(*r);
}

cv::Mat gradient(int w, int h) {
  cv::Mat img(h, w, CV_8UC3);
  for (int y = 0; y < h; ++y) {
    for (int x = 0; x < w; ++x) {
      img.at<cv::Vec3b>(y, x) = cv::Vec3b(static_cast<uchar>(x * 255 / (w - 1)),
                                          static_cast<uchar>(y * 255 / (h - 1)), 128);
    }
  }
  return img;
}

}  // namespace

TEST(ColorAnalyzer, HexFormatting) {
  EXPECT_EQ(pv::ColorAnalyzer::to_hex(255, 0, 16), "#ff0010");
  EXPECT_EQ(pv::ColorAnalyzer::to_hex(-4, 300, 0), "#00ff00");
}

TEST(ColorAnalyzer, EqualBlocksOrderedByScanPosition) {
  pv::ColorAnalyzer analyzer(3);
  const auto result = analyze(analyzer, pt::three_blocks());
  const std::vector<std::string> expected = {"#ff0000", "#00ff00", "#0000ff"};
  EXPECT_EQ(result.dominant_colors, expected);
}

TEST(ColorAnalyzer, FewColorsPaddedWithMostPopulous) {
  cv::Mat img = pt::solid(20, 10, cv::Scalar(0, 0, 255));
  img(cv::Rect(0, 0, 5, 10)).setTo(cv::Scalar(255, 0, 0));  // blue, 50 px, scanned first
  pv::ColorAnalyzer analyzer;
  const auto result = analyze(analyzer, img);
  const std::vector<std::string> expected = {"#ff0000", "#0000ff", "#ff0000", "#ff0000",
                                             "#ff0000"};
  EXPECT_EQ(result.dominant_colors, expected);
}

TEST(ColorAnalyzer, SolidGrayRepeatsOneColor) {
  pv::ColorAnalyzer analyzer;
  const auto result = analyze(analyzer, pt::solid(64, 48, cv::Scalar(128, 128, 128)));
  ASSERT_EQ(result.dominant_colors.size(), pv::ColorAnalyzer::kDefaultColorCount);
  for (const auto& c : result.dominant_colors) EXPECT_EQ(c, "#808080");
  EXPECT_EQ(result.brightness, 128);
}

TEST(ColorAnalyzer, BrightnessIsMeanLuma) {
  pv::ColorAnalyzer analyzer;
  // 0.299 * 255 = 76.2 for pure red.
  EXPECT_EQ(analyze(analyzer, pt::solid(8, 8, cv::Scalar(0, 0, 255))).brightness, 76);
  EXPECT_EQ(analyze(analyzer, pt::solid(8, 8, cv::Scalar(255, 255, 255))).brightness, 255);
}

TEST(ColorAnalyzer, ClusteredImageIsDeterministic) {
  pv::ColorAnalyzer analyzer;
  const cv::Mat img = gradient(400, 300);
  const auto first = analyze(analyzer, img);
  const auto second = analyze(analyzer, img);
  ASSERT_EQ(first.dominant_colors.size(), 5u);
  EXPECT_EQ(first.dominant_colors, second.dominant_colors);
  const std::regex hex("^#[0-9a-f]{6}$");
  for (const auto& c : first.dominant_colors) EXPECT_TRUE(std::regex_match(c, hex)) << c;
}

TEST(ColorAnalyzer, GrayscaleInputAccepted) {
  pv::ColorAnalyzer analyzer(2);
  cv::Mat gray(10, 10, CV_8UC1, cv::Scalar(200));
  const auto result = analyze(analyzer, gray);
  EXPECT_EQ(result.dominant_colors.front(), "#c8c8c8");
  EXPECT_EQ(result.brightness, 200);
}

TEST(ColorAnalyzer, EmptyImageIsDecodeError) {
  pv::ColorAnalyzer analyzer;
  auto r = analyzer.analyze(pc::DecodedImage{});
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), pc::ErrorCode::DecodeError);
}
