#pragma once

#include <peek/core/error.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace peek::app {

enum class StorageBackendType {
  Local,
  S3,
};

enum class OcrBackendType {
  Tesseract,
  Mock,  // scripted, returns no text unless told otherwise
};

/// Service configuration. Every field has a default (see default_config()).
struct ServiceConfig {
  // Storage
  StorageBackendType storage_backend{StorageBackendType::Local};
  std::string storage_root{"./peek-data/storage"};
  std::string public_base_url;  // local backend; empty: no public URLs
  std::string s3_endpoint;      // empty: derived from s3_account_id (Cloudflare R2)
  std::string s3_account_id;
  std::string s3_bucket{"peek"};
  std::string s3_region{"auto"};
  std::string s3_access_key_id;
  std::string s3_secret_access_key;
  std::string s3_public_domain;
  std::uint32_t storage_max_retries{3};
  std::chrono::milliseconds storage_retry_base{1000};

  // Result store
  std::string database_path{"./peek-data/peek.db"};

  // Scheduling
  std::size_t worker_count{4};
  std::chrono::milliseconds job_timeout{60000};
  std::size_t max_upload_bytes{16u * 1024u * 1024u};
  bool parallel_analyzers{true};

  // Analyzers
  std::size_t dominant_color_count{5};
  std::string face_cascade_path{
      "/usr/share/opencv4/haarcascades/haarcascade_frontalface_default.xml"};
  OcrBackendType ocr_backend{OcrBackendType::Tesseract};
  std::string tessdata_path;
  std::string ocr_language{"eng"};
  bool render_when_no_faces{false};

  std::string log_level{"info"};
};

/// Default config when no file is provided.
ServiceConfig default_config();

/// Applies one key=value setting. Unknown keys are ignored; malformed values
/// give ErrorCode::InvalidConfig.
std::expected<void, peek::core::Error> apply_setting(ServiceConfig& config,
                                                     std::string_view key,
                                                     std::string_view value);

/// Loads a key=value file (one per line, '#' comments) over the defaults.
/// InvalidConfig if the file cannot be read or a value is malformed.
std::expected<ServiceConfig, peek::core::Error> load_config(const std::string& path);

/// Applies PEEK_<UPPERCASE_KEY> environment variables, e.g. PEEK_S3_SECRET_ACCESS_KEY.
std::expected<void, peek::core::Error> apply_env_overrides(ServiceConfig& config);

/// Cross-field checks (non-zero workers, S3 credentials present, ...).
std::expected<void, peek::core::Error> validate_config(const ServiceConfig& config);

/// Endpoint the S3 backend talks to: s3_endpoint, else the R2 endpoint for s3_account_id.
std::string effective_s3_endpoint(const ServiceConfig& config);

}  // namespace peek::app
