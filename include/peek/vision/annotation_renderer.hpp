#pragma once

#include <peek/core/error.hpp>
#include <peek/core/image_format.hpp>
#include <peek/core/insights.hpp>
#include <peek/storage/storage_backend.hpp>
#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace peek::vision {

/// Encoded annotated image, not yet stored.
struct RenderedAnnotation {
  std::vector<std::byte> bytes;
  peek::core::ImageFormat format{peek::core::ImageFormat::Unknown};
};

/// Decodes original bytes, draws a green 2 px rectangle per face on a copy and
/// re-encodes in the original container format (GIF is written as PNG).
[[nodiscard]] std::expected<RenderedAnnotation, peek::core::Error> render_annotation(
    std::span<const std::byte> original, const std::vector<peek::core::FaceBox>& faces);

/// "<dir>/<stem>_annotated.<ext>" for an original key and the format actually written.
[[nodiscard]] std::string annotated_key_for(std::string_view original_key,
                                            peek::core::ImageFormat written_format);

/// Renders face annotations and stores them next to the original.
class AnnotationRenderer {
 public:
  /// Throws std::invalid_argument if storage is null.
  AnnotationRenderer(std::shared_ptr<peek::storage::IStorageBackend> storage,
                     bool render_when_no_faces = false);

  /// Renders without storing. nullopt when skipped by the zero-face policy.
  [[nodiscard]] std::expected<std::optional<RenderedAnnotation>, peek::core::Error> render(
      std::span<const std::byte> original,
      const std::vector<peek::core::FaceBox>& faces) const;

  /// Writes a rendered annotation under annotated_key_for(original_key, ...).
  [[nodiscard]] std::expected<std::string, peek::core::Error> store(
      std::string_view original_key, const RenderedAnnotation& annotation) const;

  /// render() followed by store(). nullopt when skipped.
  [[nodiscard]] std::expected<std::optional<std::string>, peek::core::Error> render_and_store(
      std::string_view original_key,
      std::span<const std::byte> original,
      const std::vector<peek::core::FaceBox>& faces) const;

  [[nodiscard]] bool render_when_no_faces() const noexcept { return render_when_no_faces_; }

 private:
  std::shared_ptr<peek::storage::IStorageBackend> storage_;
  bool render_when_no_faces_;
};

}  // namespace peek::vision
