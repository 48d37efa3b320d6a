#pragma once

#include <peek/core/analyzer.hpp>
#include <cstdint>
#include <memory>
#include <string>

namespace peek::vision {

/// Frontal face detection with an OpenCV Haar cascade.
///
/// The model file is read and parsed once, in the constructor. A
/// CascadeClassifier keeps scratch state during detectMultiScale and is not
/// safe to share, so each calling thread builds its own classifier from the
/// in-memory model the first time it runs. A missing or unreadable model does
/// not fail construction; it surfaces as AnalyzerError on every image.
class FaceDetector : public peek::core::IAnalyzer {
 public:
  static constexpr const char* kDefaultCascadePath =
      "/usr/share/opencv4/haarcascades/haarcascade_frontalface_default.xml";
  static constexpr double kScaleFactor = 1.1;
  static constexpr int kMinNeighbors = 5;
  static constexpr int kMinSize = 30;

  explicit FaceDetector(std::string cascade_path = kDefaultCascadePath);

  [[nodiscard]] peek::core::AnalyzerKind kind() const noexcept override {
    return peek::core::AnalyzerKind::Face;
  }

  [[nodiscard]] std::expected<peek::core::PartialResult, peek::core::Error> analyze(
      const peek::core::DecodedImage& image) const override;

  [[nodiscard]] const std::string& cascade_path() const noexcept { return cascade_path_; }

  /// True if the cascade file was read and parsed at construction.
  [[nodiscard]] bool model_available() const noexcept { return model_ != nullptr; }

 private:
  std::string cascade_path_;
  /// XML text of a model that parsed; null when unavailable.
  std::shared_ptr<const std::string> model_;
  /// Distinguishes detectors in the per-thread classifier cache.
  std::uint64_t id_;
};

}  // namespace peek::vision
