#include <peek/vision/text_extractor.hpp>
#include "image_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <utility>

namespace peek::vision {

using peek::core::Error;
using peek::core::ErrorCode;
using peek::core::TextResult;

namespace {

bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

}  // namespace

TextExtractor::TextExtractor(std::shared_ptr<const IOcrEngine> engine)
    : engine_(std::move(engine)) {
  if (!engine_) throw std::invalid_argument("TextExtractor: OCR engine is required");
}

TextResult TextExtractor::summarize_text(std::string_view raw) {
  const auto first = std::find_if_not(raw.begin(), raw.end(), is_space);
  const auto last = std::find_if_not(raw.rbegin(), raw.rend(), is_space).base();

  TextResult result;
  if (first >= last) return result;
  result.extracted_text.assign(first, last);
  result.text_found = true;

  bool in_word = false;
  for (char c : result.extracted_text) {
    if (is_space(c)) {
      in_word = false;
    } else if (!in_word) {
      in_word = true;
      ++result.word_count;
    }
  }
  return result;
}

std::expected<peek::core::DecodedImage, Error> TextExtractor::preprocess(
    const peek::core::DecodedImage& image) {
  auto view = detail::image_to_mat(image);
  if (!view) {
    return std::unexpected(Error{ErrorCode::DecodeError, "text: unreadable image"});
  }
  cv::Mat gray = detail::to_gray(*view);
  cv::normalize(gray, gray, 0, 255, cv::NORM_MINMAX);

  const int shorter = std::min(gray.cols, gray.rows);
  if (shorter > 0 && shorter < kMinOcrSide) {
    const double scale = static_cast<double>(kMinOcrSide) / shorter;
    cv::resize(gray, gray, cv::Size(), scale, scale, cv::INTER_CUBIC);
  }
  if (!gray.isContinuous()) gray = gray.clone();
  return detail::mat_to_image(gray, image.source_format());
}

std::expected<peek::core::PartialResult, Error> TextExtractor::analyze(
    const peek::core::DecodedImage& image) const {
  try {
    auto gray = preprocess(image);
    if (!gray) return std::unexpected(gray.error());

    auto raw = engine_->recognize(*gray);
    if (!raw) {
      Error err = raw.error();
      if (err.code != ErrorCode::DecodeError) err.code = ErrorCode::AnalyzerError;
      return std::unexpected(std::move(err));
    }
    return summarize_text(*raw);
  } catch (const cv::Exception& e) {
    return std::unexpected(Error{ErrorCode::AnalyzerError, std::string("text: ") + e.what()});
  }
}

}  // namespace peek::vision
