#include <peek/app/analyzer_runner.hpp>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <chrono>
#include <cstddef>

namespace peek::app {

using peek::core::AnalyzerKind;
using peek::core::AnalyzerOutcomes;

namespace {

void run_slot(const peek::core::AnalyzerSet& analyzers,
              const peek::core::DecodedImage& image,
              std::size_t i,
              AnalyzerOutcomes& outcomes,
              peek::core::AnalyzerTimingCallback* timing_cb,
              const AnalyzerResultCallback* result_cb) {
  const auto kind = static_cast<AnalyzerKind>(i);
  const auto start = std::chrono::steady_clock::now();
  outcomes[i] = analyzers.run_one(kind, image);
  if (timing_cb) {
    const auto end = std::chrono::steady_clock::now();
    (*timing_cb)(kind, std::chrono::duration<double, std::milli>(end - start).count());
  }
  if (result_cb) (*result_cb)(kind, outcomes[i]);
}

}  // namespace

AnalyzerOutcomes run_analyzers_tbb(const peek::core::AnalyzerSet& analyzers,
                                   const peek::core::DecodedImage& image,
                                   peek::core::AnalyzerTimingCallback* timing_cb,
                                   const AnalyzerResultCallback* result_cb) {
  AnalyzerOutcomes outcomes;
  // Each task writes only its own slot.
  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, peek::core::kAnalyzerCount, 1),
      [&](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          run_slot(analyzers, image, i, outcomes, timing_cb, result_cb);
        }
      });
  return outcomes;
}

AnalyzerOutcomes run_analyzers(const peek::core::AnalyzerSet& analyzers,
                               const peek::core::DecodedImage& image,
                               bool parallel,
                               peek::core::AnalyzerTimingCallback* timing_cb,
                               const AnalyzerResultCallback* result_cb) {
  if (parallel) return run_analyzers_tbb(analyzers, image, timing_cb, result_cb);
  AnalyzerOutcomes outcomes;
  for (std::size_t i = 0; i < peek::core::kAnalyzerCount; ++i) {
    run_slot(analyzers, image, i, outcomes, timing_cb, result_cb);
  }
  return outcomes;
}

}  // namespace peek::app
