#include <peek/app/analysis_service.hpp>
#include <peek/core/image_format.hpp>
#include <peek/core/logging.hpp>
#include <peek/storage/crypto.hpp>
#include <stdexcept>
#include <string>
#include <utility>

namespace peek::app {

using peek::core::Error;
using peek::core::ErrorCode;
using peek::core::ImageFormat;
using peek::core::JobStatus;

namespace {

/// Checked before the worker pool captures it.
std::shared_ptr<Orchestrator> require(std::shared_ptr<Orchestrator> orchestrator) {
  if (!orchestrator) throw std::invalid_argument("AnalysisService: orchestrator is required");
  return orchestrator;
}

}  // namespace

AnalysisService::AnalysisService(std::shared_ptr<peek::storage::IStorageBackend> storage,
                                 std::shared_ptr<peek::store::IResultStore> store,
                                 std::shared_ptr<Orchestrator> orchestrator,
                                 AnalysisServiceOptions options)
    : storage_(std::move(storage)),
      store_(std::move(store)),
      orchestrator_(require(std::move(orchestrator))),
      options_(options),
      pool_(options.pool, [orch = orchestrator_](const std::string& job_id) {
        if (auto status = orch->run(job_id); !status) {
          peek::core::logger()->error("job {}: not finalized: {}", job_id,
                                      status.error().message);
        }
      }) {
  if (!storage_ || !store_) {
    throw std::invalid_argument("AnalysisService: storage and store are required");
  }
}

AnalysisService::~AnalysisService() { pool_.shutdown(); }

std::expected<std::string, Error> AnalysisService::submit(std::span<const std::byte> original,
                                                          std::string_view content_type,
                                                          std::string_view filename) {
  if (original.size() > options_.max_upload_bytes) {
    return std::unexpected(Error{ErrorCode::ValidationError,
                                 "payload of " + std::to_string(original.size()) +
                                     " bytes exceeds limit of " +
                                     std::to_string(options_.max_upload_bytes)});
  }
  if (original.empty()) {
    return std::unexpected(Error{ErrorCode::ValidationError, "empty payload"});
  }
  const ImageFormat sniffed = peek::core::sniff_format(original);
  if (sniffed == ImageFormat::Unknown) {
    return std::unexpected(Error{ErrorCode::ValidationError, "unsupported image format"});
  }
  const ImageFormat declared = peek::core::format_from_content_type(content_type);
  if (declared != sniffed) {
    return std::unexpected(Error{ErrorCode::ValidationError,
                                 "content type '" + std::string(content_type) +
                                     "' does not match payload (" +
                                     std::string(peek::core::content_type_of(sniffed)) + ")"});
  }

  const std::string canonical_type(peek::core::content_type_of(sniffed));
  const std::string suggested = "upload." + std::string(peek::core::extension_of(sniffed));
  auto key = storage_->save(original, suggested, canonical_type);
  if (!key) return std::unexpected(key.error());

  peek::core::InsightRecord record;
  record.id = peek::storage::random_hex(16);
  record.status = JobStatus::Processing;
  record.created_at_ms = peek::store::now_ms();
  record.updated_at_ms = record.created_at_ms;
  record.asset.original_key = *key;
  record.asset.content_type = canonical_type;
  record.asset.size_bytes = original.size();
  record.asset.checksum = peek::storage::sha256_hex(original);
  record.asset.filename = peek::storage::sanitize_filename(filename);

  if (auto created = store_->create(record); !created) {
    if (auto removed = storage_->remove(*key); !removed) {
      peek::core::logger()->warn("upload {} not removed after failed insert: {}", *key,
                                 removed.error().message);
    }
    return std::unexpected(created.error());
  }

  if (!pool_.enqueue(record.id)) {
    peek::core::logger()->warn("job {}: not queued (service stopping); left for recovery",
                               record.id);
  } else {
    peek::core::logger()->info("job {}: accepted {} ({} bytes)", record.id, canonical_type,
                               original.size());
  }
  return record.id;
}

std::expected<peek::core::InsightRecord, Error> AnalysisService::get_result(
    const std::string& job_id) const {
  return store_->get(job_id);
}

std::expected<peek::storage::Bytes, Error> AnalysisService::get_original(
    const std::string& job_id) const {
  auto record = store_->get(job_id);
  if (!record) return std::unexpected(record.error());
  return storage_->fetch(record->asset.original_key);
}

std::expected<std::string, Error> AnalysisService::annotated_key(const std::string& job_id) const {
  auto record = store_->get(job_id);
  if (!record) return std::unexpected(record.error());
  if (record->status != JobStatus::Completed || !record->asset.annotated_key) {
    return std::unexpected(Error{ErrorCode::NotFound, "no annotated image for job " + job_id});
  }
  return *record->asset.annotated_key;
}

std::expected<peek::storage::Bytes, Error> AnalysisService::get_annotated(
    const std::string& job_id) const {
  auto key = annotated_key(job_id);
  if (!key) return std::unexpected(key.error());
  return storage_->fetch(*key);
}

std::expected<std::optional<std::string>, Error> AnalysisService::get_original_url(
    const std::string& job_id) const {
  auto record = store_->get(job_id);
  if (!record) return std::unexpected(record.error());
  return storage_->public_url(record->asset.original_key);
}

std::expected<std::optional<std::string>, Error> AnalysisService::get_annotated_url(
    const std::string& job_id) const {
  auto key = annotated_key(job_id);
  if (!key) return std::unexpected(key.error());
  return storage_->public_url(*key);
}

std::expected<std::size_t, Error> AnalysisService::recover_pending() {
  auto ids = store_->list_ids(JobStatus::Processing);
  if (!ids) return std::unexpected(ids.error());
  std::size_t queued = 0;
  for (auto& id : *ids) {
    if (pool_.enqueue(id)) ++queued;
  }
  if (queued > 0) peek::core::logger()->info("recovered {} pending job(s)", queued);
  return queued;
}

void AnalysisService::wait_idle() { pool_.wait_idle(); }

void AnalysisService::shutdown() {
  const auto dropped = pool_.shutdown();
  if (!dropped.empty()) {
    peek::core::logger()->info("{} queued job(s) left for recovery", dropped.size());
  }
}

}  // namespace peek::app
