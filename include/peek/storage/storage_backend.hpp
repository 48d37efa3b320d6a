#pragma once

#include <peek/core/error.hpp>
#include <cstddef>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace peek::storage {

using Bytes = std::vector<std::byte>;

/// Uniform blob storage over local disk or an S3-compatible object store.
///
/// Keys are relative, '/'-separated paths ("images/20240501_120000_ab12.png").
/// Implementations must tolerate concurrent reads of immutable keys and
/// concurrent writes of distinct keys without external locking.
class IStorageBackend {
 public:
  virtual ~IStorageBackend() = default;

  /// Stores bytes under a freshly generated key (see generate_key) and returns it.
  [[nodiscard]] std::expected<std::string, peek::core::Error> save(
      std::span<const std::byte> bytes,
      std::string_view suggested_name,
      std::string_view content_type = {});

  /// Writes bytes under an explicit key, replacing any existing object.
  [[nodiscard]] virtual std::expected<void, peek::core::Error> put(
      const std::string& key,
      std::span<const std::byte> bytes,
      std::string_view content_type) = 0;

  /// Reads an object. ErrorCode::NotFound if the key is absent.
  [[nodiscard]] virtual std::expected<Bytes, peek::core::Error> fetch(
      const std::string& key) const = 0;

  /// Deletes an object. Deleting an absent key succeeds.
  [[nodiscard]] virtual std::expected<void, peek::core::Error> remove(const std::string& key) = 0;

  [[nodiscard]] virtual std::expected<bool, peek::core::Error> exists(
      const std::string& key) const = 0;

  /// Stable public link, or nullopt when the backend only allows short-lived
  /// signed access. Callers fall back to fetch() when absent.
  [[nodiscard]] virtual std::optional<std::string> public_url(const std::string& key) const = 0;
};

/// "images/<YYYYmmdd_HHMMSS>_<16 hex>.<ext>"; ext from the sanitized name, "bin" if none.
[[nodiscard]] std::string generate_key(std::string_view suggested_name);

/// Basename with "..", '/', '\\' and NUL removed and whitespace trimmed.
/// Empty if nothing usable remains.
[[nodiscard]] std::string sanitize_filename(std::string_view filename);

/// Rejects empty keys, absolute keys, "..", backslashes and NUL bytes.
[[nodiscard]] std::expected<void, peek::core::Error> validate_key(std::string_view key);

}  // namespace peek::storage
