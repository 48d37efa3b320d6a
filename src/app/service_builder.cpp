#include <peek/app/service_builder.hpp>
#include <peek/core/logging.hpp>
#include <peek/storage/local_storage_backend.hpp>
#include <peek/storage/s3_storage_backend.hpp>
#include <peek/store/sqlite_result_store.hpp>
#include <peek/vision/annotation_renderer.hpp>
#include <peek/vision/color_analyzer.hpp>
#include <peek/vision/face_detector.hpp>
#include <peek/vision/mock_ocr_engine.hpp>
#include <peek/vision/quality_analyzer.hpp>
#include <peek/vision/scene_detector.hpp>
#include <peek/vision/text_extractor.hpp>
#ifdef PEEK_HAS_TESSERACT
#include <peek/vision/tesseract_ocr_engine.hpp>
#endif
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace peek::app {

namespace {

std::optional<std::string> non_empty(const std::string& s) {
  if (s.empty()) return std::nullopt;
  return s;
}

}  // namespace

std::shared_ptr<peek::storage::IStorageBackend> build_storage(const ServiceConfig& config) {
  if (config.storage_backend == StorageBackendType::Local) {
    return std::make_shared<peek::storage::LocalStorageBackend>(
        std::filesystem::path(config.storage_root), non_empty(config.public_base_url));
  }
  peek::storage::S3Options opts;
  opts.endpoint = effective_s3_endpoint(config);
  opts.bucket = config.s3_bucket;
  opts.credentials.access_key_id = config.s3_access_key_id;
  opts.credentials.secret_access_key = config.s3_secret_access_key;
  opts.credentials.region = config.s3_region;
  opts.public_domain = non_empty(config.s3_public_domain);
  opts.max_attempts = config.storage_max_retries;
  opts.retry_base_delay = config.storage_retry_base;
  return std::make_shared<peek::storage::S3StorageBackend>(std::move(opts));
}

std::shared_ptr<peek::store::IResultStore> build_result_store(const ServiceConfig& config) {
  const std::filesystem::path db(config.database_path);
  if (db.has_parent_path() && config.database_path != ":memory:") {
    std::filesystem::create_directories(db.parent_path());
  }
  return std::make_shared<peek::store::SqliteResultStore>(config.database_path);
}

std::shared_ptr<const peek::vision::IOcrEngine> build_ocr_engine(const ServiceConfig& config) {
  if (config.ocr_backend == OcrBackendType::Mock) {
    return std::make_shared<peek::vision::MockOcrEngine>();
  }
#ifdef PEEK_HAS_TESSERACT
  try {
    return std::make_shared<peek::vision::TesseractOcrEngine>(config.tessdata_path,
                                                              config.ocr_language);
  } catch (const std::exception& e) {
    peek::core::logger()->warn("text extraction disabled: {}", e.what());
    return nullptr;
  }
#else
  peek::core::logger()->warn("text extraction disabled: built without Tesseract");
  return nullptr;
#endif
}

std::shared_ptr<const peek::core::AnalyzerSet> build_analyzers(const ServiceConfig& config) {
  auto set = std::make_shared<peek::core::AnalyzerSet>();
  set->set(std::make_unique<peek::vision::ColorAnalyzer>(config.dominant_color_count));
  set->set(std::make_unique<peek::vision::QualityAnalyzer>());

  auto faces = std::make_unique<peek::vision::FaceDetector>(config.face_cascade_path);
  if (!faces->model_available()) {
    peek::core::logger()->warn("face cascade not loadable: {}", faces->cascade_path());
  }
  set->set(std::move(faces));

  if (auto engine = build_ocr_engine(config)) {
    set->set(std::make_unique<peek::vision::TextExtractor>(std::move(engine)));
  }
  set->set(std::make_unique<peek::vision::SceneDetector>());
  return set;
}

std::unique_ptr<AnalysisService> make_analysis_service(const ServiceConfig& config) {
  if (auto valid = validate_config(config); !valid) {
    throw std::invalid_argument(valid.error().message);
  }
  if (!peek::core::set_log_level(config.log_level)) {
    peek::core::logger()->warn("unknown log_level '{}', keeping current level", config.log_level);
  }

  auto storage = build_storage(config);
  auto store = build_result_store(config);
  auto renderer =
      std::make_shared<peek::vision::AnnotationRenderer>(storage, config.render_when_no_faces);

  OrchestratorOptions orch;
  orch.job_timeout = config.job_timeout;
  orch.parallel_analyzers = config.parallel_analyzers;
  auto orchestrator =
      std::make_shared<Orchestrator>(storage, store, build_analyzers(config), renderer, orch);

  AnalysisServiceOptions opts;
  opts.max_upload_bytes = config.max_upload_bytes;
  opts.pool.worker_count = config.worker_count;
  return std::make_unique<AnalysisService>(std::move(storage), std::move(store),
                                           std::move(orchestrator), opts);
}

}  // namespace peek::app
