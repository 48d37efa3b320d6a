#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace peek::storage {

/// AWS Signature Version 4 for S3-compatible endpoints (AWS, Cloudflare R2, MinIO).
/// Requests are signed over host, x-amz-content-sha256 and x-amz-date only.

struct S3Credentials {
  std::string access_key_id;
  std::string secret_access_key;
  std::string region{"auto"};
  std::string service{"s3"};
};

struct SignedHeaders {
  std::string authorization;
  std::string amz_date;          // "20130524T000000Z"
  std::string content_sha256;    // hex payload hash or "UNSIGNED-PAYLOAD"
};

/// RFC 3986 percent-encoding; '/' is kept when encode_slash is false (object paths).
[[nodiscard]] std::string uri_encode(std::string_view s, bool encode_slash);

/// "YYYYMMDDTHHMMSSZ" in UTC.
[[nodiscard]] std::string amz_timestamp(std::chrono::system_clock::time_point t);

/// kSigning = HMAC(HMAC(HMAC(HMAC("AWS4" + secret, date), region), service), "aws4_request").
[[nodiscard]] std::vector<unsigned char> derive_signing_key(std::string_view secret,
                                                            std::string_view date,
                                                            std::string_view region,
                                                            std::string_view service);

/// Header-based signature for one request.
/// \param canonical_uri Already-encoded absolute path, e.g. "/bucket/images/a.png".
/// \param canonical_query Already-sorted, encoded query string; empty if none.
[[nodiscard]] SignedHeaders sign_request(const S3Credentials& creds,
                                         std::string_view method,
                                         std::string_view host,
                                         std::string_view canonical_uri,
                                         std::string_view canonical_query,
                                         std::string_view payload_sha256,
                                         std::string_view amz_date);

/// Query-string signed GET URL valid for `expires`.
/// \param base "https://host" (scheme and authority, no trailing slash).
[[nodiscard]] std::string presign_get_url(const S3Credentials& creds,
                                          std::string_view base,
                                          std::string_view host,
                                          std::string_view canonical_uri,
                                          std::chrono::seconds expires,
                                          std::string_view amz_date);

}  // namespace peek::storage
