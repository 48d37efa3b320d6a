#include <peek/storage/local_storage_backend.hpp>
#include <peek/vision/annotation_renderer.hpp>
#include <gtest/gtest.h>
#include "test_images.hpp"
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <vector>

namespace pc = peek::core;
namespace ps = peek::storage;
namespace pv = peek::vision;
namespace pt = peek::test;

TEST(AnnotationRenderer, DerivedKey) {
  EXPECT_EQ(pv::annotated_key_for("images/20240501_120000_ab.png", pc::ImageFormat::Png),
            "images/20240501_120000_ab_annotated.png");
  EXPECT_EQ(pv::annotated_key_for("images/a.jpg", pc::ImageFormat::Jpeg),
            "images/a_annotated.jpg");
  EXPECT_EQ(pv::annotated_key_for("images/anim.gif", pc::ImageFormat::Png),
            "images/anim_annotated.png");
  EXPECT_EQ(pv::annotated_key_for("images.d/noext", pc::ImageFormat::Png),
            "images.d/noext_annotated.png");
}

TEST(AnnotationRenderer, DrawsGreenBoxes) {
  const auto original = pt::encode(pt::solid(100, 100, cv::Scalar(0, 0, 0)), ".png");
  const std::vector<pc::FaceBox> faces = {{10, 10, 40, 40}};
  auto rendered = pv::render_annotation(original, faces);
  ASSERT_TRUE(rendered.has_value());
  EXPECT_EQ(rendered->format, pc::ImageFormat::Png);

  const cv::Mat out = pt::decode(rendered->bytes);
  ASSERT_FALSE(out.empty());
  EXPECT_EQ(out.at<cv::Vec3b>(10, 30), cv::Vec3b(0, 255, 0));   // top edge
  EXPECT_EQ(out.at<cv::Vec3b>(30, 30), cv::Vec3b(0, 0, 0));     // interior untouched
  EXPECT_EQ(out.at<cv::Vec3b>(90, 90), cv::Vec3b(0, 0, 0));
}

TEST(AnnotationRenderer, KeepsJpegFormat) {
  const auto original = pt::encode(pt::solid(64, 64, cv::Scalar(200, 200, 200)), ".jpg");
  auto rendered = pv::render_annotation(original, {{5, 5, 20, 20}});
  ASSERT_TRUE(rendered.has_value());
  EXPECT_EQ(rendered->format, pc::ImageFormat::Jpeg);
  EXPECT_EQ(pc::sniff_format(rendered->bytes), pc::ImageFormat::Jpeg);
}

TEST(AnnotationRenderer, GifOriginalWrittenAsPng) {
  auto rendered = pv::render_annotation(pt::red_pixel_gif(), {{0, 0, 1, 1}});
  ASSERT_TRUE(rendered.has_value()) << rendered.error().message;
  EXPECT_EQ(rendered->format, pc::ImageFormat::Png);
  EXPECT_EQ(pc::sniff_format(rendered->bytes), pc::ImageFormat::Png);
}

TEST(AnnotationRenderer, UndecodableOriginal) {
  const std::vector<std::byte> junk(16, std::byte{0x42});
  auto rendered = pv::render_annotation(junk, {{0, 0, 1, 1}});
  ASSERT_FALSE(rendered.has_value());
  EXPECT_EQ(rendered.error(), pc::ErrorCode::DecodeError);
}

TEST(AnnotationRenderer, ZeroFacesSkippedByDefault) {
  auto storage = std::make_shared<ps::LocalStorageBackend>(pt::temp_dir("peek-annot"));
  pv::AnnotationRenderer renderer(storage);
  const auto original = pt::encode(pt::solid(32, 32, cv::Scalar(9, 9, 9)), ".png");

  auto key = renderer.render_and_store("images/x.png", original, {});
  ASSERT_TRUE(key.has_value());
  EXPECT_FALSE(key->has_value());
}

TEST(AnnotationRenderer, ZeroFacesRenderedWhenConfigured) {
  auto storage = std::make_shared<ps::LocalStorageBackend>(pt::temp_dir("peek-annot"));
  pv::AnnotationRenderer renderer(storage, /*render_when_no_faces=*/true);
  const auto original = pt::encode(pt::solid(32, 32, cv::Scalar(9, 9, 9)), ".png");

  auto key = renderer.render_and_store("images/x.png", original, {});
  ASSERT_TRUE(key.has_value());
  ASSERT_TRUE(key->has_value());
  EXPECT_EQ(**key, "images/x_annotated.png");
  auto exists = storage->exists(**key);
  ASSERT_TRUE(exists.has_value());
  EXPECT_TRUE(*exists);
}

TEST(AnnotationRenderer, StoresNextToOriginal) {
  auto storage = std::make_shared<ps::LocalStorageBackend>(pt::temp_dir("peek-annot"));
  pv::AnnotationRenderer renderer(storage);
  const auto original = pt::encode(pt::solid(64, 64, cv::Scalar(9, 9, 9)), ".png");

  auto key = renderer.render_and_store("images/y.png", original, {{4, 4, 30, 30}});
  ASSERT_TRUE(key.has_value());
  ASSERT_TRUE(key->has_value());
  auto bytes = storage->fetch(**key);
  ASSERT_TRUE(bytes.has_value());
  EXPECT_EQ(pc::sniff_format(*bytes), pc::ImageFormat::Png);
}

TEST(AnnotationRenderer, NullStorageThrows) {
  EXPECT_THROW(pv::AnnotationRenderer(nullptr), std::invalid_argument);
}
