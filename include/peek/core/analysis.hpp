#pragma once

#include <peek/core/analyzer.hpp>
#include <peek/core/error.hpp>
#include <peek/core/image.hpp>
#include <peek/core/insights.hpp>
#include <array>
#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace peek::core {

/// Callback for per-analyzer timing: (kind, duration_ms). Optional; pass to run().
using AnalyzerTimingCallback = std::function<void(AnalyzerKind kind, double duration_ms)>;

/// One result slot per analyzer, indexed by AnalyzerKind.
using AnalyzerOutcomes = std::array<std::expected<PartialResult, Error>, kAnalyzerCount>;

/// Fixed array of the five analyzers. Not a registry: each kind has exactly one slot.
class AnalyzerSet {
 public:
  AnalyzerSet() = default;

  /// Places the analyzer in the slot named by its kind(), replacing any previous one.
  void set(std::unique_ptr<IAnalyzer> analyzer);

  [[nodiscard]] const IAnalyzer* get(AnalyzerKind kind) const noexcept {
    return slots_[static_cast<std::size_t>(kind)].get();
  }

  [[nodiscard]] std::size_t configured_count() const noexcept;

  /// Runs one analyzer, converting a missing slot or a thrown exception into
  /// ErrorCode::AnalyzerError. Safe to call concurrently for different kinds.
  [[nodiscard]] std::expected<PartialResult, Error> run_one(AnalyzerKind kind,
                                                            const DecodedImage& image) const;

  /// Runs all analyzers in kind order on the calling thread.
  /// If timing_cb is non-null it is called after each analyzer.
  [[nodiscard]] AnalyzerOutcomes run(const DecodedImage& image,
                                     AnalyzerTimingCallback* timing_cb = nullptr) const;

 private:
  std::array<std::unique_ptr<IAnalyzer>, kAnalyzerCount> slots_;
};

/// Insights plus the names of analyzers whose fields are null.
struct Aggregate {
  Insights insights;
  std::vector<std::string> failed_analyzers;
};

/// Folds analyzer outcomes into one Insights payload. Individual failures
/// leave their fields empty; if every analyzer failed the result is
/// ErrorCode::PipelineError. Out-of-range values are clamped.
[[nodiscard]] std::expected<Aggregate, Error> aggregate(AnalyzerOutcomes outcomes);

/// Clamps every numeric field to its declared range (brightness [0,255],
/// quality [0,100], scene confidence [0,1], scores >= 0).
void clamp_to_ranges(Insights& insights) noexcept;

}  // namespace peek::core
