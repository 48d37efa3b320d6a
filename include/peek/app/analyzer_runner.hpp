#pragma once

#include <peek/core/analysis.hpp>
#include <peek/core/image.hpp>
#include <expected>
#include <functional>

namespace peek::app {

/// Called with each analyzer's outcome as soon as it is produced, before the
/// remaining analyzers finish. May be invoked from TBB worker threads.
using AnalyzerResultCallback = std::function<void(
    peek::core::AnalyzerKind kind,
    const std::expected<peek::core::PartialResult, peek::core::Error>& outcome)>;

/// Runs the five analyzers concurrently on TBB workers over one shared,
/// read-only image. Outcomes are indexed by AnalyzerKind as in AnalyzerSet::run().
/// timing_cb, if non-null, may be invoked from TBB worker threads.
[[nodiscard]] peek::core::AnalyzerOutcomes run_analyzers_tbb(
    const peek::core::AnalyzerSet& analyzers,
    const peek::core::DecodedImage& image,
    peek::core::AnalyzerTimingCallback* timing_cb = nullptr,
    const AnalyzerResultCallback* result_cb = nullptr);

/// run_analyzers_tbb() when parallel is true, else the analyzers in kind
/// order on the calling thread.
[[nodiscard]] peek::core::AnalyzerOutcomes run_analyzers(
    const peek::core::AnalyzerSet& analyzers,
    const peek::core::DecodedImage& image,
    bool parallel,
    peek::core::AnalyzerTimingCallback* timing_cb = nullptr,
    const AnalyzerResultCallback* result_cb = nullptr);

}  // namespace peek::app
