#include <peek/vision/annotation_renderer.hpp>
#include "image_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <stdexcept>
#include <utility>

namespace peek::vision {

using peek::core::Error;
using peek::core::ErrorCode;
using peek::core::ImageFormat;

namespace {

const cv::Scalar kBoxColor(0, 255, 0);  // BGR green
constexpr int kBoxThickness = 2;

}  // namespace

std::expected<RenderedAnnotation, Error> render_annotation(
    std::span<const std::byte> original, const std::vector<peek::core::FaceBox>& faces) {
  try {
    cv::Mat canvas = detail::decode_to_mat(original);
    if (canvas.empty()) {
      return std::unexpected(Error{ErrorCode::DecodeError, "annotation: original not decodable"});
    }
    for (const auto& f : faces) {
      cv::rectangle(canvas, cv::Rect(f.x, f.y, f.width, f.height), kBoxColor, kBoxThickness);
    }

    RenderedAnnotation out;
    auto encoded = detail::encode_mat(canvas, peek::core::sniff_format(original), &out.format);
    if (!encoded) return std::unexpected(encoded.error());
    out.bytes = std::move(*encoded);
    return out;
  } catch (const cv::Exception& e) {
    return std::unexpected(Error{ErrorCode::AnalyzerError, std::string("annotation: ") + e.what()});
  }
}

std::string annotated_key_for(std::string_view original_key, ImageFormat written_format) {
  const auto slash = original_key.rfind('/');
  const auto dot = original_key.rfind('.');
  const bool has_ext = dot != std::string_view::npos &&
                       (slash == std::string_view::npos || dot > slash);
  std::string key(has_ext ? original_key.substr(0, dot) : original_key);
  key += "_annotated.";
  key += peek::core::extension_of(written_format);
  return key;
}

AnnotationRenderer::AnnotationRenderer(std::shared_ptr<peek::storage::IStorageBackend> storage,
                                       bool render_when_no_faces)
    : storage_(std::move(storage)), render_when_no_faces_(render_when_no_faces) {
  if (!storage_) throw std::invalid_argument("AnnotationRenderer: storage is required");
}

std::expected<std::optional<RenderedAnnotation>, Error> AnnotationRenderer::render(
    std::span<const std::byte> original, const std::vector<peek::core::FaceBox>& faces) const {
  if (faces.empty() && !render_when_no_faces_) return std::optional<RenderedAnnotation>{};
  auto rendered = render_annotation(original, faces);
  if (!rendered) return std::unexpected(rendered.error());
  return std::optional<RenderedAnnotation>(std::move(*rendered));
}

std::expected<std::string, Error> AnnotationRenderer::store(
    std::string_view original_key, const RenderedAnnotation& annotation) const {
  std::string key = annotated_key_for(original_key, annotation.format);
  auto put = storage_->put(key, annotation.bytes, peek::core::content_type_of(annotation.format));
  if (!put) return std::unexpected(put.error());
  return key;
}

std::expected<std::optional<std::string>, Error> AnnotationRenderer::render_and_store(
    std::string_view original_key,
    std::span<const std::byte> original,
    const std::vector<peek::core::FaceBox>& faces) const {
  auto rendered = render(original, faces);
  if (!rendered) return std::unexpected(rendered.error());
  if (!*rendered) return std::optional<std::string>{};
  auto key = store(original_key, **rendered);
  if (!key) return std::unexpected(key.error());
  return std::optional<std::string>(std::move(*key));
}

}  // namespace peek::vision
