#include <peek/vision/scene_detector.hpp>
#include <gtest/gtest.h>
#include "test_images.hpp"

namespace pc = peek::core;
namespace pv = peek::vision;
namespace pt = peek::test;

namespace {

pc::SceneResult analyze(const cv::Mat& img) {
  pv::SceneDetector detector;
  auto r = detector.analyze(pt::to_image(img));
  EXPECT_TRUE(r.has_value());
  return std::get<pc::SceneResult>(*r);
}

}  // namespace

TEST(SceneDetector, RulesInOrder) {
  using S = pv::SceneStats;
  auto tie = pv::SceneDetector::classify(S{0.45, 0.42, 120, 150});
  EXPECT_EQ(tie.scene_type, pc::SceneType::Unknown);
  EXPECT_DOUBLE_EQ(tie.scene_confidence, 0.5);

  auto sky = pv::SceneDetector::classify(S{0.5, 0.1, 120, 150});
  EXPECT_EQ(sky.scene_type, pc::SceneType::Outdoor);
  EXPECT_DOUBLE_EQ(sky.scene_confidence, 0.8);

  // Dark blue does not count as sky, and no other rule fires before darkness.
  auto dark_blue = pv::SceneDetector::classify(S{0.5, 0.0, 120, 60});
  EXPECT_EQ(dark_blue.scene_type, pc::SceneType::Indoor);
  EXPECT_DOUBLE_EQ(dark_blue.scene_confidence, 0.7);

  auto grass = pv::SceneDetector::classify(S{0.0, 0.75, 120, 90});
  EXPECT_EQ(grass.scene_type, pc::SceneType::Outdoor);
  EXPECT_DOUBLE_EQ(grass.scene_confidence, 0.9);

  auto dull = pv::SceneDetector::classify(S{0.0, 0.0, 20, 150});
  EXPECT_EQ(dull.scene_type, pc::SceneType::Indoor);
  EXPECT_DOUBLE_EQ(dull.scene_confidence, 0.6);

  auto other = pv::SceneDetector::classify(S{0.1, 0.1, 200, 200});
  EXPECT_EQ(other.scene_type, pc::SceneType::Unknown);
  EXPECT_DOUBLE_EQ(other.scene_confidence, 0.5);
}

TEST(SceneDetector, BlueSkyIsOutdoor) {
  auto r = analyze(pt::solid(40, 30, cv::Scalar(255, 0, 0)));
  EXPECT_EQ(r.scene_type, pc::SceneType::Outdoor);
  EXPECT_DOUBLE_EQ(r.scene_confidence, 1.0);
}

TEST(SceneDetector, GreenFieldIsOutdoor) {
  auto r = analyze(pt::solid(40, 30, cv::Scalar(0, 200, 0)));
  EXPECT_EQ(r.scene_type, pc::SceneType::Outdoor);
  EXPECT_DOUBLE_EQ(r.scene_confidence, 1.0);
}

TEST(SceneDetector, HalfBlueHalfGreenIsTie) {
  cv::Mat img = pt::solid(40, 30, cv::Scalar(255, 0, 0));
  img(cv::Rect(20, 0, 20, 30)).setTo(cv::Scalar(0, 255, 0));
  auto r = analyze(img);
  EXPECT_EQ(r.scene_type, pc::SceneType::Unknown);
  EXPECT_DOUBLE_EQ(r.scene_confidence, 0.5);
}

TEST(SceneDetector, DarkAndGrayAreIndoor) {
  auto dark = analyze(pt::solid(20, 20, cv::Scalar(10, 10, 10)));
  EXPECT_EQ(dark.scene_type, pc::SceneType::Indoor);
  EXPECT_DOUBLE_EQ(dark.scene_confidence, 0.7);

  auto gray = analyze(pt::solid(20, 20, cv::Scalar(128, 128, 128)));
  EXPECT_EQ(gray.scene_type, pc::SceneType::Indoor);
  EXPECT_DOUBLE_EQ(gray.scene_confidence, 0.6);
}

TEST(SceneDetector, SaturatedRedIsUnknown) {
  auto r = analyze(pt::solid(20, 20, cv::Scalar(0, 0, 255)));
  EXPECT_EQ(r.scene_type, pc::SceneType::Unknown);
}
