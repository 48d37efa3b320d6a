#include <peek/core/analysis.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>

namespace peek::core {

std::string_view to_string(AnalyzerKind kind) noexcept {
  switch (kind) {
    case AnalyzerKind::Color:
      return "color";
    case AnalyzerKind::Quality:
      return "quality";
    case AnalyzerKind::Face:
      return "face";
    case AnalyzerKind::Text:
      return "text";
    case AnalyzerKind::Scene:
      return "scene";
  }
  return "unknown";
}

void AnalyzerSet::set(std::unique_ptr<IAnalyzer> analyzer) {
  if (analyzer) {
    const auto slot = static_cast<std::size_t>(analyzer->kind());
    slots_[slot] = std::move(analyzer);
  }
}

std::size_t AnalyzerSet::configured_count() const noexcept {
  return static_cast<std::size_t>(
      std::count_if(slots_.begin(), slots_.end(), [](const auto& a) { return a != nullptr; }));
}

std::expected<PartialResult, Error> AnalyzerSet::run_one(AnalyzerKind kind,
                                                         const DecodedImage& image) const {
  const IAnalyzer* analyzer = get(kind);
  if (!analyzer) {
    return std::unexpected(
        Error{ErrorCode::AnalyzerError, std::string(to_string(kind)) + " analyzer not configured"});
  }
  try {
    return analyzer->analyze(image);
  } catch (const std::exception& e) {
    return std::unexpected(Error{ErrorCode::AnalyzerError, e.what()});
  }
}

AnalyzerOutcomes AnalyzerSet::run(const DecodedImage& image,
                                  AnalyzerTimingCallback* timing_cb) const {
  AnalyzerOutcomes outcomes;
  for (std::size_t i = 0; i < kAnalyzerCount; ++i) {
    const auto kind = static_cast<AnalyzerKind>(i);
    const auto start = std::chrono::steady_clock::now();
    outcomes[i] = run_one(kind, image);
    if (timing_cb) {
      const auto end = std::chrono::steady_clock::now();
      const double ms = std::chrono::duration<double, std::milli>(end - start).count();
      (*timing_cb)(kind, ms);
    }
  }
  return outcomes;
}

namespace {

double clamp_finite(double v, double lo, double hi) noexcept {
  if (!std::isfinite(v)) return std::isinf(v) && v > 0 ? hi : lo;
  return std::clamp(v, lo, hi);
}

double clamp_non_negative(double v) noexcept {
  if (std::isnan(v) || v < 0.0) return 0.0;
  return v;
}

}  // namespace

void clamp_to_ranges(Insights& insights) noexcept {
  if (insights.color) {
    insights.color->brightness = std::clamp(insights.color->brightness, 0, 255);
  }
  if (insights.quality) {
    insights.quality->sharpness_score = clamp_non_negative(insights.quality->sharpness_score);
    insights.quality->blur_level = blur_level_for(insights.quality->sharpness_score);
    insights.quality->contrast_score = clamp_non_negative(insights.quality->contrast_score);
    insights.quality->quality_score = clamp_finite(insights.quality->quality_score, 0.0, 100.0);
  }
  if (insights.scene) {
    insights.scene->scene_confidence = clamp_finite(insights.scene->scene_confidence, 0.0, 1.0);
  }
}

std::expected<Aggregate, Error> aggregate(AnalyzerOutcomes outcomes) {
  Aggregate out;
  std::string last_error;

  for (std::size_t i = 0; i < kAnalyzerCount; ++i) {
    const auto kind = static_cast<AnalyzerKind>(i);
    auto& outcome = outcomes[i];
    // A result whose alternative does not match the slot counts as a failure.
    if (outcome && outcome->index() == i) {
      switch (kind) {
        case AnalyzerKind::Color:
          out.insights.color = std::get<ColorResult>(std::move(*outcome));
          break;
        case AnalyzerKind::Quality:
          out.insights.quality = std::get<QualityResult>(std::move(*outcome));
          break;
        case AnalyzerKind::Face:
          out.insights.faces = std::get<FaceResult>(std::move(*outcome));
          break;
        case AnalyzerKind::Text:
          out.insights.text = std::get<TextResult>(std::move(*outcome));
          break;
        case AnalyzerKind::Scene:
          out.insights.scene = std::get<SceneResult>(std::move(*outcome));
          break;
      }
      continue;
    }
    out.failed_analyzers.emplace_back(to_string(kind));
    last_error = outcome ? "result does not match analyzer kind" : outcome.error().message;
  }

  if (out.failed_analyzers.size() == kAnalyzerCount) {
    return std::unexpected(Error{ErrorCode::PipelineError, "all analyzers failed: " + last_error});
  }
  clamp_to_ranges(out.insights);
  return out;
}

}  // namespace peek::core
