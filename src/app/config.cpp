#include <peek/app/config.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <string>
#include <type_traits>

namespace peek::app {

using peek::core::Error;
using peek::core::ErrorCode;

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

Error invalid(std::string_view key, std::string_view value) {
  return Error{ErrorCode::InvalidConfig,
               "invalid value for " + std::string(key) + ": '" + std::string(value) + "'"};
}

template <typename T>
std::expected<T, Error> parse_uint(std::string_view key, std::string_view value) {
  T out{};
  const auto* end = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(value.data(), end, out);
  if (ec != std::errc() || ptr != end) return std::unexpected(invalid(key, value));
  return out;
}

std::expected<bool, Error> parse_bool(std::string_view key, std::string_view value) {
  if (value == "true" || value == "1" || value == "yes" || value == "on") return true;
  if (value == "false" || value == "0" || value == "no" || value == "off") return false;
  return std::unexpected(invalid(key, value));
}

/// Every key apply_setting() understands; used for environment lookups.
constexpr std::array<std::string_view, 24> kKeys = {
    "storage_backend",      "storage_root",          "public_base_url",
    "s3_endpoint",          "s3_account_id",         "s3_bucket",
    "s3_region",            "s3_access_key_id",      "s3_secret_access_key",
    "s3_public_domain",     "storage_max_retries",   "storage_retry_base_ms",
    "database_path",        "worker_count",          "job_timeout_ms",
    "max_upload_bytes",     "dominant_color_count",  "face_cascade_path",
    "ocr_backend",          "tessdata_path",         "ocr_language",
    "render_when_no_faces", "parallel_analyzers",    "log_level",
};

}  // namespace

ServiceConfig default_config() { return ServiceConfig{}; }

std::expected<void, Error> apply_setting(ServiceConfig& c,
                                         std::string_view key,
                                         std::string_view value) {
  auto assign_uint = [&](auto& field) -> std::expected<void, Error> {
    using T = std::remove_reference_t<decltype(field)>;
    auto v = parse_uint<T>(key, value);
    if (!v) return std::unexpected(v.error());
    field = *v;
    return {};
  };
  auto assign_ms = [&](std::chrono::milliseconds& field) -> std::expected<void, Error> {
    auto v = parse_uint<std::uint64_t>(key, value);
    if (!v) return std::unexpected(v.error());
    field = std::chrono::milliseconds(*v);
    return {};
  };
  auto assign_bool = [&](bool& field) -> std::expected<void, Error> {
    auto v = parse_bool(key, value);
    if (!v) return std::unexpected(v.error());
    field = *v;
    return {};
  };

  if (key == "storage_backend") {
    if (value == "local") c.storage_backend = StorageBackendType::Local;
    else if (value == "s3" || value == "r2") c.storage_backend = StorageBackendType::S3;
    else return std::unexpected(invalid(key, value));
  }
  else if (key == "storage_root") c.storage_root = value;
  else if (key == "public_base_url") c.public_base_url = value;
  else if (key == "s3_endpoint") c.s3_endpoint = value;
  else if (key == "s3_account_id") c.s3_account_id = value;
  else if (key == "s3_bucket") c.s3_bucket = value;
  else if (key == "s3_region") c.s3_region = value;
  else if (key == "s3_access_key_id") c.s3_access_key_id = value;
  else if (key == "s3_secret_access_key") c.s3_secret_access_key = value;
  else if (key == "s3_public_domain") c.s3_public_domain = value;
  else if (key == "storage_max_retries") return assign_uint(c.storage_max_retries);
  else if (key == "storage_retry_base_ms") return assign_ms(c.storage_retry_base);
  else if (key == "database_path") c.database_path = value;
  else if (key == "worker_count") return assign_uint(c.worker_count);
  else if (key == "job_timeout_ms") return assign_ms(c.job_timeout);
  else if (key == "max_upload_bytes") return assign_uint(c.max_upload_bytes);
  else if (key == "dominant_color_count") return assign_uint(c.dominant_color_count);
  else if (key == "face_cascade_path") c.face_cascade_path = value;
  else if (key == "ocr_backend") {
    if (value == "tesseract") c.ocr_backend = OcrBackendType::Tesseract;
    else if (value == "mock") c.ocr_backend = OcrBackendType::Mock;
    else return std::unexpected(invalid(key, value));
  }
  else if (key == "tessdata_path") c.tessdata_path = value;
  else if (key == "ocr_language") c.ocr_language = value;
  else if (key == "render_when_no_faces") return assign_bool(c.render_when_no_faces);
  else if (key == "parallel_analyzers") return assign_bool(c.parallel_analyzers);
  else if (key == "log_level") c.log_level = value;
  return {};
}

std::expected<ServiceConfig, Error> load_config(const std::string& path) {
  ServiceConfig c = default_config();
  std::ifstream f(path);
  if (!f) {
    return std::unexpected(Error{ErrorCode::InvalidConfig, "cannot read config file " + path});
  }

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;
    if (auto r = apply_setting(c, key, value); !r) return std::unexpected(r.error());
  }
  return c;
}

std::expected<void, Error> apply_env_overrides(ServiceConfig& c) {
  for (std::string_view key : kKeys) {
    std::string name = "PEEK_";
    std::transform(key.begin(), key.end(), std::back_inserter(name),
                   [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) continue;
    if (auto r = apply_setting(c, key, value); !r) return std::unexpected(r.error());
  }
  return {};
}

std::expected<void, Error> validate_config(const ServiceConfig& c) {
  auto fail = [](std::string msg) { return std::unexpected(Error{ErrorCode::InvalidConfig, std::move(msg)}); };

  if (c.worker_count == 0) return fail("worker_count must be at least 1");
  if (c.job_timeout.count() <= 0) return fail("job_timeout_ms must be positive");
  if (c.max_upload_bytes == 0) return fail("max_upload_bytes must be positive");
  if (c.dominant_color_count == 0) return fail("dominant_color_count must be at least 1");
  if (c.storage_max_retries == 0) return fail("storage_max_retries must be at least 1");
  if (c.database_path.empty()) return fail("database_path is required");

  if (c.storage_backend == StorageBackendType::Local) {
    if (c.storage_root.empty()) return fail("storage_root is required for local storage");
  } else {
    if (effective_s3_endpoint(c).empty()) return fail("s3_endpoint or s3_account_id is required");
    if (c.s3_bucket.empty()) return fail("s3_bucket is required");
    if (c.s3_access_key_id.empty() || c.s3_secret_access_key.empty()) {
      return fail("s3_access_key_id and s3_secret_access_key are required");
    }
  }
  if (c.ocr_backend == OcrBackendType::Tesseract && c.ocr_language.empty()) {
    return fail("ocr_language is required for tesseract");
  }
  return {};
}

std::string effective_s3_endpoint(const ServiceConfig& c) {
  if (!c.s3_endpoint.empty()) return c.s3_endpoint;
  if (c.s3_account_id.empty()) return {};
  return "https://" + c.s3_account_id + ".r2.cloudflarestorage.com";
}

}  // namespace peek::app
