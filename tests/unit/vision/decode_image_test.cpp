#include <peek/vision/decode_image.hpp>
#include <gtest/gtest.h>
#include "test_images.hpp"
#include <vector>

namespace pc = peek::core;
namespace pv = peek::vision;
namespace pt = peek::test;

TEST(DecodeImage, PngToBgr) {
  const auto bytes = pt::encode(pt::three_blocks(), ".png");
  auto img = pv::decode_image(bytes);
  ASSERT_TRUE(img.has_value());
  EXPECT_EQ(img->width(), 30u);
  EXPECT_EQ(img->height(), 10u);
  EXPECT_EQ(img->format(), pc::PixelFormat::BGR8);
  EXPECT_EQ(img->source_format(), pc::ImageFormat::Png);
  EXPECT_TRUE(img->valid());
}

TEST(DecodeImage, EmptyInputIsDecodeError) {
  auto img = pv::decode_image({});
  ASSERT_FALSE(img.has_value());
  EXPECT_EQ(img.error(), pc::ErrorCode::DecodeError);
}

TEST(DecodeImage, CorruptBodyIsDecodeError) {
  auto bytes = pt::encode(pt::solid(32, 32, cv::Scalar(1, 2, 3)), ".png");
  bytes.resize(24);  // signature and part of IHDR only
  auto img = pv::decode_image(bytes);
  ASSERT_FALSE(img.has_value());
  EXPECT_EQ(img.error(), pc::ErrorCode::DecodeError);
}

TEST(DecodeImage, JpegSourceFormatRecorded) {
  const auto bytes = pt::encode(pt::solid(16, 16, cv::Scalar(50, 100, 150)), ".jpg");
  auto img = pv::decode_image(bytes);
  ASSERT_TRUE(img.has_value());
  EXPECT_EQ(img->source_format(), pc::ImageFormat::Jpeg);
}

TEST(DecodeImage, GifDecodesToBgr) {
  auto img = pv::decode_image(pt::red_pixel_gif());
  ASSERT_TRUE(img.has_value()) << img.error().message;
  EXPECT_EQ(img->width(), 1u);
  EXPECT_EQ(img->height(), 1u);
  EXPECT_EQ(img->format(), pc::PixelFormat::BGR8);
  EXPECT_EQ(img->source_format(), pc::ImageFormat::Gif);
  const auto* px = reinterpret_cast<const unsigned char*>(img->data().data());
  EXPECT_EQ(px[0], 0);
  EXPECT_EQ(px[1], 0);
  EXPECT_EQ(px[2], 255);
}
