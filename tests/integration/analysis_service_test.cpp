#include <peek/app/analysis_service.hpp>
#include <peek/app/config.hpp>
#include <peek/app/orchestrator.hpp>
#include <peek/app/service_builder.hpp>
#include <peek/core/insights_json.hpp>
#include <peek/vision/annotation_renderer.hpp>
#include <gtest/gtest.h>
#include "test_images.hpp"
#include <algorithm>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace pa = peek::app;
namespace pc = peek::core;
namespace pst = peek::store;
namespace pv = peek::vision;
namespace pt = peek::test;

namespace {

/// Real analyzers, mock OCR, local storage and a SQLite file under a temp dir.
class AnalysisServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = pt::temp_dir("peek-it");
    config_ = pa::default_config();
    config_.storage_root = (dir_ / "storage").string();
    config_.database_path = (dir_ / "peek.db").string();
    config_.ocr_backend = pa::OcrBackendType::Mock;
    config_.worker_count = 2;
    config_.log_level = "warn";
  }

  void build() {
    storage_ = pa::build_storage(config_);
    store_ = pa::build_result_store(config_);
    auto renderer =
        std::make_shared<pv::AnnotationRenderer>(storage_, config_.render_when_no_faces);
    pa::OrchestratorOptions orch;
    orch.job_timeout = config_.job_timeout;
    auto orchestrator = std::make_shared<pa::Orchestrator>(
        storage_, store_, pa::build_analyzers(config_), renderer, orch);
    pa::AnalysisServiceOptions opts;
    opts.max_upload_bytes = config_.max_upload_bytes;
    opts.pool.worker_count = config_.worker_count;
    service_ = std::make_unique<pa::AnalysisService>(storage_, store_, orchestrator, opts);
  }

  std::size_t stored_files() const {
    const auto root = dir_ / "storage";
    if (!std::filesystem::exists(root)) return 0;
    std::size_t n = 0;
    for (const auto& e : std::filesystem::recursive_directory_iterator(root)) {
      if (e.is_regular_file()) ++n;
    }
    return n;
  }

  std::filesystem::path dir_;
  pa::ServiceConfig config_;
  std::shared_ptr<peek::storage::IStorageBackend> storage_;
  std::shared_ptr<pst::IResultStore> store_;
  std::unique_ptr<pa::AnalysisService> service_;
};

std::vector<std::byte> gray_png() {
  return pt::encode(pt::solid(96, 64, cv::Scalar(128, 128, 128)), ".png");
}

}  // namespace

TEST_F(AnalysisServiceTest, SolidGrayEndToEnd) {
  build();
  const auto original = gray_png();
  auto id = service_->submit(original, "image/png", "gray.png");
  ASSERT_TRUE(id.has_value()) << id.error().message;

  auto pending = service_->get_result(*id);
  ASSERT_TRUE(pending.has_value());

  service_->wait_idle();
  auto r = service_->get_result(*id);
  ASSERT_TRUE(r.has_value());
  ASSERT_EQ(r->status, pc::JobStatus::Completed) << r->reason.value_or("");
  ASSERT_TRUE(r->insights.has_value());
  const auto& in = *r->insights;

  ASSERT_TRUE(in.color.has_value());
  EXPECT_EQ(in.color->dominant_colors, std::vector<std::string>(5, "#808080"));
  EXPECT_EQ(in.color->brightness, 128);
  ASSERT_TRUE(in.quality.has_value());
  EXPECT_NEAR(in.quality->sharpness_score, 0.0, 1e-9);
  EXPECT_EQ(in.quality->blur_level, pc::BlurLevel::High);
  EXPECT_EQ(in.faces_detected(), 0u);
  ASSERT_TRUE(in.text.has_value());
  EXPECT_FALSE(in.text->text_found);
  EXPECT_EQ(in.text->word_count, 0u);
  EXPECT_EQ(in.scene->scene_type, pc::SceneType::Indoor);

  // Face detection depends on the installed cascade; either it ran or it is reported failed.
  const bool face_failed = std::find(r->failed_analyzers.begin(), r->failed_analyzers.end(),
                                     "face") != r->failed_analyzers.end();
  EXPECT_EQ(face_failed, !in.faces.has_value());

  EXPECT_EQ(r->asset.filename, "gray.png");
  EXPECT_EQ(r->asset.width, 96u);
  EXPECT_EQ(r->asset.size_bytes, original.size());

  auto fetched = service_->get_original(*id);
  ASSERT_TRUE(fetched.has_value());
  EXPECT_EQ(*fetched, original);

  // Zero faces: no annotation under the default policy.
  auto annotated = service_->get_annotated(*id);
  ASSERT_FALSE(annotated.has_value());
  EXPECT_EQ(annotated.error(), pc::ErrorCode::NotFound);
  EXPECT_EQ(stored_files(), 1u);
}

TEST_F(AnalysisServiceTest, GifUploadCompletes) {
  build();
  auto id = service_->submit(pt::red_pixel_gif(), "image/gif", "dot.gif");
  ASSERT_TRUE(id.has_value()) << id.error().message;
  service_->wait_idle();
  auto r = service_->get_result(*id);
  ASSERT_TRUE(r.has_value());
  ASSERT_EQ(r->status, pc::JobStatus::Completed) << r->reason.value_or("");
  EXPECT_EQ(r->asset.content_type, "image/gif");
  EXPECT_EQ(r->asset.width, 1u);
  EXPECT_EQ(r->insights->color->dominant_colors, std::vector<std::string>(5, "#ff0000"));
}

TEST_F(AnalysisServiceTest, GetResultIsIdempotent) {
  build();
  auto id = service_->submit(gray_png(), "image/png");
  ASSERT_TRUE(id.has_value());
  service_->wait_idle();
  const auto a = pc::record_to_json(*service_->get_result(*id)).dump();
  const auto b = pc::record_to_json(*service_->get_result(*id)).dump();
  EXPECT_EQ(a, b);
}

TEST_F(AnalysisServiceTest, OversizedUploadLeavesStoreUnchanged) {
  config_.max_upload_bytes = 64;
  build();
  auto id = service_->submit(gray_png(), "image/png");
  ASSERT_FALSE(id.has_value());
  EXPECT_EQ(id.error(), pc::ErrorCode::ValidationError);
  EXPECT_EQ(*store_->count(), 0u);
  EXPECT_EQ(stored_files(), 0u);
}

TEST_F(AnalysisServiceTest, RejectsWrongTypeAndUnknownFormat) {
  build();
  auto mismatch = service_->submit(gray_png(), "image/jpeg");
  ASSERT_FALSE(mismatch.has_value());
  EXPECT_EQ(mismatch.error(), pc::ErrorCode::ValidationError);

  const std::vector<std::byte> text(32, std::byte{'x'});
  auto unknown = service_->submit(text, "image/png");
  ASSERT_FALSE(unknown.has_value());
  EXPECT_EQ(unknown.error(), pc::ErrorCode::ValidationError);

  EXPECT_EQ(*store_->count(), 0u);
}

TEST_F(AnalysisServiceTest, CorruptBodyFailsWithDecodeError) {
  build();
  auto bytes = gray_png();
  bytes.resize(40);
  auto id = service_->submit(bytes, "image/png");
  ASSERT_TRUE(id.has_value());
  service_->wait_idle();
  auto r = service_->get_result(*id);
  EXPECT_EQ(r->status, pc::JobStatus::Failed);
  EXPECT_EQ(r->reason, "decode_error");
  EXPECT_FALSE(pc::record_to_json(*r).contains("insights"));
}

TEST_F(AnalysisServiceTest, UnknownJobIsNotFound) {
  build();
  EXPECT_EQ(service_->get_result("nope").error(), pc::ErrorCode::NotFound);
  EXPECT_EQ(service_->get_original("nope").error(), pc::ErrorCode::NotFound);
  EXPECT_EQ(service_->get_annotated("nope").error(), pc::ErrorCode::NotFound);
}

TEST_F(AnalysisServiceTest, RenderedAnnotationWhenConfigured) {
  config_.render_when_no_faces = true;
  build();
  auto id = service_->submit(gray_png(), "image/png");
  ASSERT_TRUE(id.has_value());
  service_->wait_idle();
  auto r = service_->get_result(*id);
  ASSERT_EQ(r->status, pc::JobStatus::Completed);
  if (!r->insights->faces) GTEST_SKIP() << "face analyzer unavailable; nothing to render from";

  auto annotated = service_->get_annotated(*id);
  ASSERT_TRUE(annotated.has_value());
  EXPECT_EQ(pc::sniff_format(*annotated), pc::ImageFormat::Png);
  EXPECT_FALSE(service_->get_annotated_url(*id)->has_value());
}

TEST_F(AnalysisServiceTest, PublicUrlsFromBase) {
  config_.public_base_url = "https://img.example.com";
  build();
  auto id = service_->submit(gray_png(), "image/png");
  ASSERT_TRUE(id.has_value());
  auto url = service_->get_original_url(*id);
  ASSERT_TRUE(url.has_value());
  ASSERT_TRUE(url->has_value());
  EXPECT_TRUE((*url)->starts_with("https://img.example.com/images/"));
  service_->wait_idle();
}

TEST_F(AnalysisServiceTest, RecoversPendingJobsAfterRestart) {
  build();
  // A record left in `processing` by a process that died before running it.
  auto key = storage_->save(gray_png(), "upload.png", "image/png");
  ASSERT_TRUE(key.has_value());
  pc::InsightRecord orphan;
  orphan.id = "orphan";
  orphan.created_at_ms = pst::now_ms();
  orphan.updated_at_ms = orphan.created_at_ms;
  orphan.asset.original_key = *key;
  orphan.asset.content_type = "image/png";
  ASSERT_TRUE(store_->create(orphan).has_value());

  auto queued = service_->recover_pending();
  ASSERT_TRUE(queued.has_value());
  EXPECT_EQ(*queued, 1u);
  service_->wait_idle();
  EXPECT_EQ(service_->get_result("orphan")->status, pc::JobStatus::Completed);
}

TEST_F(AnalysisServiceTest, BuiltFromConfig) {
  auto service = pa::make_analysis_service(config_);
  auto id = service->submit(pt::encode(pt::three_blocks(), ".png"), "image/png");
  ASSERT_TRUE(id.has_value());
  service->wait_idle();
  auto r = service->get_result(*id);
  ASSERT_EQ(r->status, pc::JobStatus::Completed);
  const std::vector<std::string> expected = {"#ff0000", "#00ff00", "#0000ff", "#ff0000",
                                             "#ff0000"};
  EXPECT_EQ(r->insights->color->dominant_colors, expected);
  service->shutdown();
}
