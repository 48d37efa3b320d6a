#include <peek/storage/s3_storage_backend.hpp>
#include <peek/storage/crypto.hpp>
#include <peek/core/logging.hpp>
#include <curl/curl.h>
#include <algorithm>
#include <cstring>
#include <memory>
#include <mutex>
#include <stdexcept>

namespace peek::storage {

using peek::core::Error;
using peek::core::ErrorCode;

namespace {

constexpr std::string_view kCacheControl = "Cache-Control: public, max-age=31536000";

void ensure_curl_global_init() {
  static std::once_flag once;
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
  auto* out = static_cast<Bytes*>(userdata);
  const std::size_t n = size * nmemb;
  const auto* begin = reinterpret_cast<const std::byte*>(ptr);
  out->insert(out->end(), begin, begin + n);
  return n;
}

struct UploadCursor {
  std::span<const std::byte> data;
  std::size_t offset{0};
};

std::size_t read_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
  auto* cursor = static_cast<UploadCursor*>(userdata);
  const std::size_t remaining = cursor->data.size() - cursor->offset;
  const std::size_t n = std::min(size * nitems, remaining);
  std::memcpy(buffer, cursor->data.data() + cursor->offset, n);
  cursor->offset += n;
  return n;
}

bool transient_status(long status) { return status == 429 || status >= 500; }

std::string body_excerpt(const Bytes& body) {
  const std::size_t n = std::min<std::size_t>(body.size(), 256);
  return std::string(reinterpret_cast<const char*>(body.data()), n);
}

}  // namespace

S3StorageBackend::S3StorageBackend(S3Options options) : options_(std::move(options)) {
  if (options_.endpoint.empty() || options_.bucket.empty()) {
    throw std::invalid_argument("S3StorageBackend: endpoint and bucket are required");
  }
  if (options_.credentials.access_key_id.empty() ||
      options_.credentials.secret_access_key.empty()) {
    throw std::invalid_argument("S3StorageBackend: credentials are not configured");
  }
  ensure_curl_global_init();

  std::string endpoint = options_.endpoint;
  while (!endpoint.empty() && endpoint.back() == '/') endpoint.pop_back();
  const auto scheme_end = endpoint.find("://");
  const std::size_t host_begin = scheme_end == std::string::npos ? 0 : scheme_end + 3;
  const auto path_begin = endpoint.find('/', host_begin);
  host_ = endpoint.substr(host_begin, path_begin == std::string::npos ? std::string::npos
                                                                      : path_begin - host_begin);
  base_ = (scheme_end == std::string::npos ? std::string("https://") : std::string()) +
          endpoint.substr(0, path_begin);

  if (options_.public_domain) {
    while (!options_.public_domain->empty() && options_.public_domain->back() == '/') {
      options_.public_domain->pop_back();
    }
  }

  retry_.max_attempts = options_.max_attempts;
  retry_.base_delay = options_.retry_base_delay;
  retry_.on_retry = [](std::size_t attempt, const Error& e) {
    peek::core::logger()->warn("object store request failed (attempt {}): {}", attempt, e.message);
  };
}

std::string S3StorageBackend::canonical_uri(const std::string& key) const {
  return "/" + uri_encode(options_.bucket, true) + "/" + uri_encode(key, false);
}

std::expected<S3StorageBackend::Response, AttemptError> S3StorageBackend::perform(
    const std::string& method,
    const std::string& key,
    std::span<const std::byte> body,
    std::string_view content_type) const {
  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
  if (!curl) {
    return std::unexpected(AttemptError{Error{ErrorCode::StorageError, "curl_easy_init failed"}, true});
  }

  const std::string uri = canonical_uri(key);
  const std::string url = base_ + uri;
  const std::string payload_hash = sha256_hex(body);
  const SignedHeaders signed_headers =
      sign_request(options_.credentials, method, host_, uri, "", payload_hash,
                   amz_timestamp(std::chrono::system_clock::now()));

  curl_slist* raw_headers = nullptr;
  raw_headers = curl_slist_append(raw_headers, ("Authorization: " + signed_headers.authorization).c_str());
  raw_headers = curl_slist_append(raw_headers, ("x-amz-date: " + signed_headers.amz_date).c_str());
  raw_headers = curl_slist_append(
      raw_headers, ("x-amz-content-sha256: " + signed_headers.content_sha256).c_str());
  if (method == "PUT") {
    if (!content_type.empty()) {
      raw_headers =
          curl_slist_append(raw_headers, ("Content-Type: " + std::string(content_type)).c_str());
    }
    raw_headers = curl_slist_append(raw_headers, std::string(kCacheControl).c_str());
    raw_headers = curl_slist_append(raw_headers, "Expect:");
  }
  std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(raw_headers,
                                                                       &curl_slist_free_all);

  Response response;
  UploadCursor cursor{body, 0};
  CURL* h = curl.get();
  curl_easy_setopt(h, CURLOPT_URL, url.c_str());
  curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(h, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(options_.request_timeout.count()));
  curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
  if (method == "PUT") {
    curl_easy_setopt(h, CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(h, CURLOPT_READFUNCTION, read_callback);
    curl_easy_setopt(h, CURLOPT_READDATA, &cursor);
    curl_easy_setopt(h, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(body.size()));
  } else if (method == "HEAD") {
    curl_easy_setopt(h, CURLOPT_NOBODY, 1L);
  } else if (method != "GET") {
    curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, method.c_str());
  }

  const CURLcode rc = curl_easy_perform(h);
  if (rc != CURLE_OK) {
    return std::unexpected(AttemptError{
        Error{ErrorCode::StorageError, method + " " + key + ": " + curl_easy_strerror(rc)}, true});
  }
  curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &response.status);

  if (response.status == 404) {
    return std::unexpected(AttemptError{Error{ErrorCode::NotFound, "no object at key " + key}, false});
  }
  if (response.status < 200 || response.status >= 300) {
    return std::unexpected(AttemptError{
        Error{ErrorCode::StorageError, method + " " + key + ": HTTP " +
                                           std::to_string(response.status) + " " +
                                           body_excerpt(response.body)},
        transient_status(response.status)});
  }
  return response;
}

std::expected<void, Error> S3StorageBackend::put(const std::string& key,
                                                 std::span<const std::byte> bytes,
                                                 std::string_view content_type) {
  if (auto valid = validate_key(key); !valid) {
    return std::unexpected(valid.error());
  }
  auto result = with_retry(retry_, [&]() -> std::expected<void, AttemptError> {
    auto r = perform("PUT", key, bytes, content_type);
    if (!r) return std::unexpected(r.error());
    return {};
  });
  if (result) {
    peek::core::logger()->debug("stored {} ({} bytes) in bucket {}", key, bytes.size(),
                               options_.bucket);
  }
  return result;
}

std::expected<Bytes, Error> S3StorageBackend::fetch(const std::string& key) const {
  if (auto valid = validate_key(key); !valid) {
    return std::unexpected(valid.error());
  }
  return with_retry(retry_, [&]() -> std::expected<Bytes, AttemptError> {
    auto r = perform("GET", key, {}, {});
    if (!r) return std::unexpected(r.error());
    return std::move(r->body);
  });
}

std::expected<void, Error> S3StorageBackend::remove(const std::string& key) {
  if (auto valid = validate_key(key); !valid) {
    return std::unexpected(valid.error());
  }
  auto result = with_retry(retry_, [&]() -> std::expected<void, AttemptError> {
    auto r = perform("DELETE", key, {}, {});
    if (!r && r.error().error.code != ErrorCode::NotFound) return std::unexpected(r.error());
    return {};
  });
  return result;
}

std::expected<bool, Error> S3StorageBackend::exists(const std::string& key) const {
  if (auto valid = validate_key(key); !valid) {
    return std::unexpected(valid.error());
  }
  return with_retry(retry_, [&]() -> std::expected<bool, AttemptError> {
    auto r = perform("HEAD", key, {}, {});
    if (r) return true;
    if (r.error().error.code == ErrorCode::NotFound) return false;
    return std::unexpected(r.error());
  });
}

std::optional<std::string> S3StorageBackend::public_url(const std::string& key) const {
  if (!options_.public_domain || !validate_key(key)) return std::nullopt;
  return *options_.public_domain + "/" + key;
}

std::string S3StorageBackend::presigned_url(const std::string& key, std::chrono::seconds ttl) const {
  return presign_get_url(options_.credentials, base_, host_, canonical_uri(key), ttl,
                         amz_timestamp(std::chrono::system_clock::now()));
}

}  // namespace peek::storage
