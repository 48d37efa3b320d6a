#pragma once

#include <peek/core/error.hpp>
#include <peek/core/image.hpp>
#include <peek/core/insights.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string_view>
#include <variant>

namespace peek::core {

/// The closed set of analyzers. Values index AnalyzerSet slots.
enum class AnalyzerKind : std::uint8_t {
  Color = 0,
  Quality,
  Face,
  Text,
  Scene,
};

inline constexpr std::size_t kAnalyzerCount = 5;

[[nodiscard]] std::string_view to_string(AnalyzerKind kind) noexcept;

/// Output of one analyzer; the alternative matches the analyzer's kind.
using PartialResult =
    std::variant<ColorResult, QualityResult, FaceResult, TextResult, SceneResult>;

/// Stateless capability: decoded image -> partial result.
/// analyze() is const and must not keep per-call state in the object, so one
/// instance may serve several images (or the same image) concurrently.
/// Unreadable input is reported as ErrorCode::DecodeError; anything else as
/// ErrorCode::AnalyzerError. Whether that is fatal is not the analyzer's call.
class IAnalyzer {
 public:
  virtual ~IAnalyzer() = default;

  [[nodiscard]] virtual AnalyzerKind kind() const noexcept = 0;

  [[nodiscard]] virtual std::expected<PartialResult, Error> analyze(
      const DecodedImage& image) const = 0;
};

}  // namespace peek::core
