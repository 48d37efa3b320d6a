#pragma once

#include <peek/app/analysis_service.hpp>
#include <peek/app/config.hpp>
#include <peek/core/analysis.hpp>
#include <peek/storage/storage_backend.hpp>
#include <peek/store/result_store.hpp>
#include <peek/vision/ocr_engine.hpp>
#include <memory>

namespace peek::app {

/// Local or S3 backend from config. Throws on setup failure.
std::shared_ptr<peek::storage::IStorageBackend> build_storage(const ServiceConfig& config);

/// SQLite store at config.database_path. Throws std::runtime_error on failure.
std::shared_ptr<peek::store::IResultStore> build_result_store(const ServiceConfig& config);

/// OCR engine for config.ocr_backend, or null when the engine is unavailable
/// (not built in, or its language data cannot be loaded).
std::shared_ptr<const peek::vision::IOcrEngine> build_ocr_engine(const ServiceConfig& config);

/// All five analyzers. The text slot stays empty when no OCR engine is
/// available; its fields are then reported as failed on every job.
std::shared_ptr<const peek::core::AnalyzerSet> build_analyzers(const ServiceConfig& config);

/// Storage, result store, analyzers, renderer, orchestrator and service.
std::unique_ptr<AnalysisService> make_analysis_service(const ServiceConfig& config);

}  // namespace peek::app
