#pragma once

#include <peek/app/orchestrator.hpp>
#include <peek/app/worker_pool.hpp>
#include <peek/core/error.hpp>
#include <peek/core/insight_record.hpp>
#include <peek/storage/storage_backend.hpp>
#include <peek/store/result_store.hpp>
#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace peek::app {

struct AnalysisServiceOptions {
  /// Uploads above this are rejected before anything is stored.
  std::size_t max_upload_bytes{16u * 1024u * 1024u};
  WorkerPoolConfig pool;
};

/// Entry point: accepts uploads, schedules analysis and serves results.
///
/// submit() stores the original and creates the `processing` record before
/// the job is queued, so a crash after submit() leaves a record that
/// recover_pending() picks up on the next start.
class AnalysisService {
 public:
  /// Throws std::invalid_argument if a collaborator is null.
  AnalysisService(std::shared_ptr<peek::storage::IStorageBackend> storage,
                  std::shared_ptr<peek::store::IResultStore> store,
                  std::shared_ptr<Orchestrator> orchestrator,
                  AnalysisServiceOptions options = {});

  ~AnalysisService();

  AnalysisService(const AnalysisService&) = delete;
  AnalysisService& operator=(const AnalysisService&) = delete;

  /// Validates (size, magic bytes, declared content type), stores the
  /// original, creates the record and enqueues the job. Returns the job id.
  /// ValidationError leaves storage and the result store unchanged.
  [[nodiscard]] std::expected<std::string, peek::core::Error> submit(
      std::span<const std::byte> original,
      std::string_view content_type,
      std::string_view filename = {});

  /// NotFound for an unknown id.
  [[nodiscard]] std::expected<peek::core::InsightRecord, peek::core::Error> get_result(
      const std::string& job_id) const;

  [[nodiscard]] std::expected<peek::storage::Bytes, peek::core::Error> get_original(
      const std::string& job_id) const;

  /// NotFound unless the job completed and an annotation was rendered.
  [[nodiscard]] std::expected<peek::storage::Bytes, peek::core::Error> get_annotated(
      const std::string& job_id) const;

  /// Public link to the original; nullopt means "use get_original()".
  [[nodiscard]] std::expected<std::optional<std::string>, peek::core::Error> get_original_url(
      const std::string& job_id) const;

  [[nodiscard]] std::expected<std::optional<std::string>, peek::core::Error> get_annotated_url(
      const std::string& job_id) const;

  /// Re-enqueues records left in `processing` (e.g. by a previous process).
  /// Returns how many were queued.
  std::expected<std::size_t, peek::core::Error> recover_pending();

  /// Blocks until every queued job reached a terminal state.
  void wait_idle();

  /// Stops the workers; queued jobs stay `processing` for recover_pending().
  void shutdown();

  [[nodiscard]] const AnalysisServiceOptions& options() const noexcept { return options_; }

 private:
  std::expected<std::string, peek::core::Error> annotated_key(const std::string& job_id) const;

  std::shared_ptr<peek::storage::IStorageBackend> storage_;
  std::shared_ptr<peek::store::IResultStore> store_;
  std::shared_ptr<Orchestrator> orchestrator_;
  AnalysisServiceOptions options_;
  WorkerPool pool_;
};

}  // namespace peek::app
