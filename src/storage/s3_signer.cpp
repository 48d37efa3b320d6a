#include <peek/storage/s3_signer.hpp>
#include <peek/storage/crypto.hpp>
#include <ctime>
#include <span>

namespace peek::storage {

namespace {

constexpr std::string_view kAlgorithm = "AWS4-HMAC-SHA256";

std::vector<unsigned char> hmac(std::span<const unsigned char> key, std::string_view data) {
  return hmac_sha256(key, data);
}

std::string credential_scope(const S3Credentials& creds, std::string_view date) {
  return std::string(date) + "/" + creds.region + "/" + creds.service + "/aws4_request";
}

std::string signature_for(const S3Credentials& creds,
                          std::string_view amz_date,
                          const std::string& canonical_request) {
  const std::string_view date = amz_date.substr(0, 8);
  const std::string string_to_sign = std::string(kAlgorithm) + "\n" + std::string(amz_date) +
                                     "\n" + credential_scope(creds, date) + "\n" +
                                     sha256_hex(canonical_request);
  const auto key = derive_signing_key(creds.secret_access_key, date, creds.region, creds.service);
  return to_hex(hmac(key, string_to_sign));
}

}  // namespace

std::string uri_encode(std::string_view s, bool encode_slash) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(s.size() * 3);
  for (unsigned char c : s) {
    const bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                            (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' ||
                            c == '~';
    if (unreserved || (c == '/' && !encode_slash)) {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0F]);
    }
  }
  return out;
}

std::string amz_timestamp(std::chrono::system_clock::time_point t) {
  const std::time_t secs = std::chrono::system_clock::to_time_t(t);
  std::tm tm{};
  gmtime_r(&secs, &tm);
  char buf[20];
  std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm);
  return buf;
}

std::vector<unsigned char> derive_signing_key(std::string_view secret,
                                              std::string_view date,
                                              std::string_view region,
                                              std::string_view service) {
  const std::string seed = "AWS4" + std::string(secret);
  const auto k_date = hmac(std::span<const unsigned char>(
                               reinterpret_cast<const unsigned char*>(seed.data()), seed.size()),
                           date);
  const auto k_region = hmac(k_date, region);
  const auto k_service = hmac(k_region, service);
  return hmac(k_service, "aws4_request");
}

SignedHeaders sign_request(const S3Credentials& creds,
                           std::string_view method,
                           std::string_view host,
                           std::string_view canonical_uri,
                           std::string_view canonical_query,
                           std::string_view payload_sha256,
                           std::string_view amz_date) {
  static constexpr std::string_view kSignedHeaders = "host;x-amz-content-sha256;x-amz-date";

  std::string canonical_request;
  canonical_request.append(method).append("\n");
  canonical_request.append(canonical_uri).append("\n");
  canonical_request.append(canonical_query).append("\n");
  canonical_request.append("host:").append(host).append("\n");
  canonical_request.append("x-amz-content-sha256:").append(payload_sha256).append("\n");
  canonical_request.append("x-amz-date:").append(amz_date).append("\n\n");
  canonical_request.append(kSignedHeaders).append("\n");
  canonical_request.append(payload_sha256);

  SignedHeaders out;
  out.amz_date = std::string(amz_date);
  out.content_sha256 = std::string(payload_sha256);
  out.authorization = std::string(kAlgorithm) + " Credential=" + creds.access_key_id + "/" +
                      credential_scope(creds, amz_date.substr(0, 8)) +
                      ", SignedHeaders=" + std::string(kSignedHeaders) +
                      ", Signature=" + signature_for(creds, amz_date, canonical_request);
  return out;
}

std::string presign_get_url(const S3Credentials& creds,
                            std::string_view base,
                            std::string_view host,
                            std::string_view canonical_uri,
                            std::chrono::seconds expires,
                            std::string_view amz_date) {
  const std::string credential =
      creds.access_key_id + "/" + credential_scope(creds, amz_date.substr(0, 8));

  // Parameters in byte order of their names.
  std::string query;
  query.append("X-Amz-Algorithm=").append(kAlgorithm);
  query.append("&X-Amz-Credential=").append(uri_encode(credential, true));
  query.append("&X-Amz-Date=").append(amz_date);
  query.append("&X-Amz-Expires=").append(std::to_string(expires.count()));
  query.append("&X-Amz-SignedHeaders=host");

  std::string canonical_request;
  canonical_request.append("GET\n");
  canonical_request.append(canonical_uri).append("\n");
  canonical_request.append(query).append("\n");
  canonical_request.append("host:").append(host).append("\n\n");
  canonical_request.append("host\n");
  canonical_request.append("UNSIGNED-PAYLOAD");

  return std::string(base) + std::string(canonical_uri) + "?" + query +
         "&X-Amz-Signature=" + signature_for(creds, amz_date, canonical_request);
}

}  // namespace peek::storage
