#pragma once

#include <peek/core/analysis.hpp>
#include <peek/core/error.hpp>
#include <peek/core/insight_record.hpp>
#include <peek/storage/storage_backend.hpp>
#include <peek/store/result_store.hpp>
#include <peek/vision/annotation_renderer.hpp>
#include <chrono>
#include <expected>
#include <memory>
#include <string>
#include <string_view>

namespace peek::app {

struct OrchestratorOptions {
  /// Budget for fetch + decode + analyzers + annotation.
  std::chrono::milliseconds job_timeout{60000};
  /// Run analyzers on TBB workers instead of sequentially.
  bool parallel_analyzers{true};
};

/// Drives one job from `processing` to exactly one terminal state.
///
/// The work runs on a helper thread under a wall-clock deadline. When the
/// deadline passes the record is failed with reason "timeout", partial
/// results are dropped, and an annotation written after the deadline is
/// removed again. The helper thread keeps the collaborators alive through
/// shared ownership, so it may outlive the call.
class Orchestrator {
 public:
  /// Throws std::invalid_argument if storage, store or analyzers is null.
  /// renderer may be null (no annotations).
  Orchestrator(std::shared_ptr<peek::storage::IStorageBackend> storage,
               std::shared_ptr<peek::store::IResultStore> store,
               std::shared_ptr<const peek::core::AnalyzerSet> analyzers,
               std::shared_ptr<const peek::vision::AnnotationRenderer> renderer,
               OrchestratorOptions options = {});

  /// Processes the job and returns the record's terminal status. A record
  /// that is already terminal is left untouched (redelivery is a no-op).
  /// Errors only when the result store itself cannot be read or written.
  [[nodiscard]] std::expected<peek::core::JobStatus, peek::core::Error> run(
      const std::string& job_id);

  [[nodiscard]] const OrchestratorOptions& options() const noexcept { return options_; }

  /// Machine-readable reason stored for a job-level error.
  [[nodiscard]] static std::string_view failure_reason(const peek::core::Error& error) noexcept;

 private:
  std::expected<peek::core::JobStatus, peek::core::Error> execute(
      const peek::core::InsightRecord& record);
  std::expected<peek::core::JobStatus, peek::core::Error> finish_failed(
      const std::string& job_id, const peek::core::Error& error, std::int64_t elapsed_ms);

  std::shared_ptr<peek::storage::IStorageBackend> storage_;
  std::shared_ptr<peek::store::IResultStore> store_;
  std::shared_ptr<const peek::core::AnalyzerSet> analyzers_;
  std::shared_ptr<const peek::vision::AnnotationRenderer> renderer_;
  OrchestratorOptions options_;
};

}  // namespace peek::app
