#include <peek/core/insights_json.hpp>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace pc = peek::core;

namespace {

pc::Insights sample() {
  pc::Insights in;
  in.color = pc::ColorResult{{"#ff0000", "#00ff00"}, 120};
  in.quality = pc::QualityResult{612.5, pc::BlurLevel::Low, 48.25, 79.3};
  in.faces = pc::FaceResult{{pc::FaceBox{10, 20, 30, 40}}};
  in.text = pc::TextResult{true, "HELLO WORLD", 2};
  in.scene = pc::SceneResult{pc::SceneType::Outdoor, 0.82};
  return in;
}

}  // namespace

TEST(InsightsJson, FieldOrderAndNames) {
  const auto j = pc::insights_to_json(sample());
  std::vector<std::string> keys;
  for (const auto& item : j.items()) keys.push_back(item.key());
  const std::vector<std::string> expected = {
      "dominant_colors", "brightness",      "faces_detected", "face_locations",
      "text_found",      "extracted_text",  "word_count",     "sharpness_score",
      "blur_level",      "contrast_score",  "quality_score",  "scene_type",
      "scene_confidence"};
  EXPECT_EQ(keys, expected);
  EXPECT_EQ(j["faces_detected"], 1);
  EXPECT_EQ(j["blur_level"], "low");
  EXPECT_EQ(j["scene_type"], "outdoor");
  EXPECT_EQ(j["face_locations"][0]["width"], 30);
}

TEST(InsightsJson, FailedAnalyzerFieldsAreNull) {
  pc::Insights in = sample();
  in.faces.reset();
  in.text.reset();
  const auto j = pc::insights_to_json(in);
  EXPECT_TRUE(j["faces_detected"].is_null());
  EXPECT_TRUE(j["face_locations"].is_null());
  EXPECT_TRUE(j["text_found"].is_null());
  EXPECT_TRUE(j["word_count"].is_null());
  EXPECT_FALSE(j["brightness"].is_null());
}

TEST(InsightsJson, ParseRestoresPayload) {
  pc::Insights in = sample();
  in.scene.reset();
  auto parsed = pc::parse_insights(pc::serialize_insights(in));
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->color->dominant_colors, in.color->dominant_colors);
  EXPECT_EQ(parsed->faces->face_locations, in.faces->face_locations);
  EXPECT_EQ(parsed->text->extracted_text, "HELLO WORLD");
  EXPECT_EQ(parsed->quality->blur_level, pc::BlurLevel::Low);
  EXPECT_FALSE(parsed->scene.has_value());
}

TEST(InsightsJson, ParseRejectsGarbage) {
  auto parsed = pc::parse_insights("{not json");
  ASSERT_FALSE(parsed.has_value());
  EXPECT_EQ(parsed.error(), pc::ErrorCode::StoreError);

  auto bad_level = pc::parse_insights(
      R"({"sharpness_score":1,"blur_level":"extreme","contrast_score":1,"quality_score":1})");
  ASSERT_FALSE(bad_level.has_value());
}

TEST(InsightsJson, ProcessingRecordHasNoInsights) {
  pc::InsightRecord r;
  r.id = "abc";
  r.created_at_ms = 0;
  r.updated_at_ms = 1500;
  const auto j = pc::record_to_json(r);
  EXPECT_EQ(j["status"], "processing");
  EXPECT_EQ(j["created_at"], "1970-01-01T00:00:00.000Z");
  EXPECT_EQ(j["updated_at"], "1970-01-01T00:00:01.500Z");
  EXPECT_FALSE(j.contains("insights"));
  EXPECT_FALSE(j.contains("reason"));
}

TEST(InsightsJson, FailedRecordCarriesReason) {
  pc::InsightRecord r;
  r.id = "abc";
  r.status = pc::JobStatus::Failed;
  r.reason = "timeout";
  r.processing_time_ms = 60001;
  const auto j = pc::record_to_json(r);
  EXPECT_EQ(j["reason"], "timeout");
  EXPECT_EQ(j["processing_time_ms"], 60001);
  EXPECT_FALSE(j.contains("insights"));
}

TEST(InsightsJson, CompletedRecordCarriesInsights) {
  pc::InsightRecord r;
  r.id = "abc";
  r.status = pc::JobStatus::Completed;
  r.insights = sample();
  r.failed_analyzers = {"scene"};
  r.processing_time_ms = 42;
  const auto j = pc::record_to_json(r);
  EXPECT_EQ(j["insights"]["word_count"], 2);
  EXPECT_EQ(j["failed_analyzers"][0], "scene");
  EXPECT_EQ(pc::record_to_json(r).dump(), j.dump());
}
