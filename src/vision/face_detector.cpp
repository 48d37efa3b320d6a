#include <peek/vision/face_detector.hpp>
#include "image_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/objdetect.hpp>
#include <atomic>
#include <fstream>
#include <optional>
#include <sstream>
#include <utility>
#include <vector>

namespace peek::vision {

using peek::core::Error;
using peek::core::ErrorCode;

namespace {

std::atomic<std::uint64_t> next_detector_id{1};

bool parse_cascade(const std::string& xml, cv::CascadeClassifier& cascade) {
  cv::FileStorage fs(xml, cv::FileStorage::READ | cv::FileStorage::MEMORY);
  if (!fs.isOpened()) return false;
  return cascade.read(fs.getFirstTopLevelNode()) && !cascade.empty();
}

std::optional<std::string> read_text(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return std::nullopt;
  std::ostringstream buf;
  buf << in.rdbuf();
  return buf.str();
}

/// This thread's classifier for detector `id`, parsed from `xml` on first use.
cv::CascadeClassifier* thread_cascade(std::uint64_t id, const std::string& xml) {
  struct Cached {
    std::uint64_t id{0};
    cv::CascadeClassifier cascade;
  };
  thread_local Cached cached;
  if (cached.id == id) return &cached.cascade;
  cv::CascadeClassifier fresh;
  if (!parse_cascade(xml, fresh)) return nullptr;
  cached.cascade = std::move(fresh);
  cached.id = id;
  return &cached.cascade;
}

}  // namespace

FaceDetector::FaceDetector(std::string cascade_path)
    : cascade_path_(cascade_path.empty() ? std::string(kDefaultCascadePath)
                                         : std::move(cascade_path)),
      id_(next_detector_id.fetch_add(1)) {
  auto xml = read_text(cascade_path_);
  if (!xml) return;
  try {
    cv::CascadeClassifier check;
    if (parse_cascade(*xml, check)) model_ = std::make_shared<const std::string>(std::move(*xml));
  } catch (const cv::Exception&) {
    model_.reset();
  }
}

std::expected<peek::core::PartialResult, Error> FaceDetector::analyze(
    const peek::core::DecodedImage& image) const {
  auto view = detail::image_to_mat(image);
  if (!view) {
    return std::unexpected(Error{ErrorCode::DecodeError, "face: unreadable image"});
  }
  if (!model_) {
    return std::unexpected(
        Error{ErrorCode::AnalyzerError, "face: cascade model unavailable: " + cascade_path_});
  }
  try {
    cv::CascadeClassifier* cascade = thread_cascade(id_, *model_);
    if (!cascade) {
      return std::unexpected(
          Error{ErrorCode::AnalyzerError, "face: cascade model unavailable: " + cascade_path_});
    }

    cv::Mat gray = detail::to_gray(*view);
    cv::equalizeHist(gray, gray);

    std::vector<cv::Rect> rects;
    cascade->detectMultiScale(gray, rects, kScaleFactor, kMinNeighbors, 0,
                              cv::Size(kMinSize, kMinSize));

    peek::core::FaceResult result;
    result.face_locations.reserve(rects.size());
    for (const auto& r : rects) {
      result.face_locations.push_back(peek::core::FaceBox{r.x, r.y, r.width, r.height});
    }
    return result;
  } catch (const cv::Exception& e) {
    return std::unexpected(Error{ErrorCode::AnalyzerError, std::string("face: ") + e.what()});
  }
}

}  // namespace peek::vision
