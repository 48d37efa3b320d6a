#include <peek/core/insights_json.hpp>
#include <ctime>
#include <cstdio>
#include <string>
#include <vector>

namespace peek::core {

namespace {

constexpr const char* kColorFields[] = {"dominant_colors", "brightness"};
constexpr const char* kFaceFields[] = {"faces_detected", "face_locations"};
constexpr const char* kTextFields[] = {"text_found", "extracted_text", "word_count"};
constexpr const char* kQualityFields[] = {"sharpness_score", "blur_level", "contrast_score",
                                          "quality_score"};
constexpr const char* kSceneFields[] = {"scene_type", "scene_confidence"};

template <std::size_t N>
void put_nulls(Json& j, const char* const (&fields)[N]) {
  for (const char* f : fields) j[f] = nullptr;
}

bool is_null_or_missing(const Json& j, const char* key) {
  const auto it = j.find(key);
  return it == j.end() || it->is_null();
}

}  // namespace

Json insights_to_json(const Insights& insights) {
  Json j = Json::object();

  if (insights.color) {
    j["dominant_colors"] = insights.color->dominant_colors;
    j["brightness"] = insights.color->brightness;
  } else {
    put_nulls(j, kColorFields);
  }

  if (insights.faces) {
    j["faces_detected"] = insights.faces_detected();
    Json boxes = Json::array();
    for (const auto& b : insights.faces->face_locations) {
      boxes.push_back(Json{{"x", b.x}, {"y", b.y}, {"width", b.width}, {"height", b.height}});
    }
    j["face_locations"] = std::move(boxes);
  } else {
    put_nulls(j, kFaceFields);
  }

  if (insights.text) {
    j["text_found"] = insights.text->text_found;
    j["extracted_text"] = insights.text->extracted_text;
    j["word_count"] = insights.text->word_count;
  } else {
    put_nulls(j, kTextFields);
  }

  if (insights.quality) {
    j["sharpness_score"] = insights.quality->sharpness_score;
    j["blur_level"] = std::string(to_string(insights.quality->blur_level));
    j["contrast_score"] = insights.quality->contrast_score;
    j["quality_score"] = insights.quality->quality_score;
  } else {
    put_nulls(j, kQualityFields);
  }

  if (insights.scene) {
    j["scene_type"] = std::string(to_string(insights.scene->scene_type));
    j["scene_confidence"] = insights.scene->scene_confidence;
  } else {
    put_nulls(j, kSceneFields);
  }

  return j;
}

std::expected<Insights, Error> insights_from_json(const Json& j) {
  if (!j.is_object()) {
    return std::unexpected(Error{ErrorCode::StoreError, "insights is not an object"});
  }
  Insights out;
  try {
    if (!is_null_or_missing(j, "dominant_colors")) {
      ColorResult c;
      c.dominant_colors = j.at("dominant_colors").get<std::vector<std::string>>();
      c.brightness = j.at("brightness").get<int>();
      out.color = std::move(c);
    }
    if (!is_null_or_missing(j, "face_locations")) {
      FaceResult f;
      for (const auto& b : j.at("face_locations")) {
        f.face_locations.push_back(FaceBox{b.at("x").get<int>(), b.at("y").get<int>(),
                                           b.at("width").get<int>(), b.at("height").get<int>()});
      }
      out.faces = std::move(f);
    }
    if (!is_null_or_missing(j, "text_found")) {
      TextResult t;
      t.text_found = j.at("text_found").get<bool>();
      t.extracted_text = j.at("extracted_text").get<std::string>();
      t.word_count = j.at("word_count").get<std::uint32_t>();
      out.text = std::move(t);
    }
    if (!is_null_or_missing(j, "sharpness_score")) {
      QualityResult q;
      q.sharpness_score = j.at("sharpness_score").get<double>();
      const auto level = parse_blur_level(j.at("blur_level").get<std::string>());
      if (!level) {
        return std::unexpected(Error{ErrorCode::StoreError, "bad blur_level"});
      }
      q.blur_level = *level;
      q.contrast_score = j.at("contrast_score").get<double>();
      q.quality_score = j.at("quality_score").get<double>();
      out.quality = q;
    }
    if (!is_null_or_missing(j, "scene_type")) {
      const auto type = parse_scene_type(j.at("scene_type").get<std::string>());
      if (!type) {
        return std::unexpected(Error{ErrorCode::StoreError, "bad scene_type"});
      }
      out.scene = SceneResult{*type, j.at("scene_confidence").get<double>()};
    }
  } catch (const nlohmann::json::exception& e) {
    return std::unexpected(Error{ErrorCode::StoreError, e.what()});
  }
  return out;
}

std::string serialize_insights(const Insights& insights) {
  return insights_to_json(insights).dump();
}

std::expected<Insights, Error> parse_insights(std::string_view text) {
  Json j = Json::parse(text.begin(), text.end(), nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded()) {
    return std::unexpected(Error{ErrorCode::StoreError, "insights column is not valid JSON"});
  }
  return insights_from_json(j);
}

Json record_to_json(const InsightRecord& record) {
  Json j = Json::object();
  j["id"] = record.id;
  j["status"] = std::string(to_string(record.status));
  j["created_at"] = format_timestamp(record.created_at_ms);
  j["updated_at"] = format_timestamp(record.updated_at_ms);
  if (record.status == JobStatus::Failed && record.reason) {
    j["reason"] = *record.reason;
  }
  if (record.processing_time_ms) {
    j["processing_time_ms"] = *record.processing_time_ms;
  }
  if (record.status == JobStatus::Completed) {
    if (!record.failed_analyzers.empty()) {
      j["failed_analyzers"] = record.failed_analyzers;
    }
    j["insights"] = record.insights ? insights_to_json(*record.insights) : Json(nullptr);
  }
  return j;
}

std::string format_timestamp(std::int64_t epoch_ms) {
  const std::time_t secs = static_cast<std::time_t>(epoch_ms / 1000);
  const int millis = static_cast<int>(epoch_ms % 1000);
  std::tm tm{};
  gmtime_r(&secs, &tm);
  char buf[32];
  const std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
  char out[48];
  std::snprintf(out, sizeof(out), "%.*s.%03dZ", static_cast<int>(n), buf, millis < 0 ? 0 : millis);
  return out;
}

}  // namespace peek::core
