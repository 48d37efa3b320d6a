#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace peek::storage {

/// Lowercase hex SHA-256 of the input (OpenSSL EVP).
[[nodiscard]] std::string sha256_hex(std::span<const std::byte> data);
[[nodiscard]] std::string sha256_hex(std::string_view data);

/// Raw HMAC-SHA256 digest (32 bytes).
[[nodiscard]] std::vector<unsigned char> hmac_sha256(std::span<const unsigned char> key,
                                                     std::string_view data);

[[nodiscard]] std::string to_hex(std::span<const unsigned char> bytes);

/// `n` bytes from the OpenSSL CSPRNG as 2n hex characters.
/// Throws std::runtime_error if the generator is unavailable.
[[nodiscard]] std::string random_hex(std::size_t n);

}  // namespace peek::storage
