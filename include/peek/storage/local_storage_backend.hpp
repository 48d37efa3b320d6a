#pragma once

#include <peek/storage/storage_backend.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace peek::storage {

/// Filesystem backend rooted at a directory; key "a/b.png" lives at <root>/a/b.png.
/// Writes go to a temporary sibling and are renamed into place, so readers
/// never observe a partially written object.
class LocalStorageBackend : public IStorageBackend {
 public:
  /// \param root Created if missing.
  /// \param public_base_url If set, public_url(key) returns "<base>/<key>".
  explicit LocalStorageBackend(std::filesystem::path root,
                               std::optional<std::string> public_base_url = std::nullopt);

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

  [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

 private:
  std::filesystem::path path_for(const std::string& key) const { return root_ / key; }

  std::filesystem::path root_;
  std::optional<std::string> public_base_url_;
};

}  // namespace peek::storage
