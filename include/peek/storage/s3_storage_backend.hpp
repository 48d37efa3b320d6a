#pragma once

#include <peek/storage/retry.hpp>
#include <peek/storage/s3_signer.hpp>
#include <peek/storage/storage_backend.hpp>
#include <chrono>
#include <optional>
#include <string>

namespace peek::storage {

/// Connection settings for an S3-compatible bucket.
struct S3Options {
  /// "https://<account>.r2.cloudflarestorage.com" or any S3 endpoint. Path-style
  /// addressing is used: <endpoint>/<bucket>/<key>.
  std::string endpoint;
  std::string bucket{"peek"};
  S3Credentials credentials;
  /// If set, public_url(key) returns "<public_domain>/<key>".
  std::optional<std::string> public_domain;
  std::size_t max_attempts{3};
  std::chrono::milliseconds retry_base_delay{1000};
  std::chrono::seconds request_timeout{30};
};

/// Object-store backend over libcurl with SigV4 signing.
///
/// Transport errors, HTTP 5xx and 429 are retried with exponential backoff;
/// 404 maps to ErrorCode::NotFound; other statuses are ErrorCode::StorageError.
/// Every call uses its own curl easy handle, so the backend is safe to share
/// across threads.
class S3StorageBackend : public IStorageBackend {
 public:
  /// Throws std::invalid_argument if endpoint, bucket or credentials are missing.
  explicit S3StorageBackend(S3Options options);

  [[nodiscard]] std::expected<void, peek::core::Error> put(
      const std::string& key,
      std::span<const std::byte> bytes,
      std::string_view content_type) override;

  [[nodiscard]] std::expected<Bytes, peek::core::Error> fetch(
      const std::string& key) const override;

  [[nodiscard]] std::expected<void, peek::core::Error> remove(const std::string& key) override;

  [[nodiscard]] std::expected<bool, peek::core::Error> exists(
      const std::string& key) const override;

  [[nodiscard]] std::optional<std::string> public_url(const std::string& key) const override;

  /// Short-lived signed GET link; not a stable public URL.
  [[nodiscard]] std::string presigned_url(const std::string& key,
                                          std::chrono::seconds ttl = std::chrono::hours(24)) const;

  /// Replaces the sleep used between retries (tests).
  void set_retry_sleep(std::function<void(std::chrono::milliseconds)> sleep) {
    retry_.sleep = std::move(sleep);
  }

 private:
  struct Response {
    long status{0};
    Bytes body;
  };

  std::expected<Response, AttemptError> perform(const std::string& method,
                                                const std::string& key,
                                                std::span<const std::byte> body,
                                                std::string_view content_type) const;

  std::string canonical_uri(const std::string& key) const;

  S3Options options_;
  std::string base_;  // scheme://authority of the endpoint
  std::string host_;
  RetryPolicy retry_;
};

}  // namespace peek::storage
