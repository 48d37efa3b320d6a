#include <peek/storage/local_storage_backend.hpp>
#include <peek/storage/crypto.hpp>
#include <fstream>
#include <system_error>

namespace peek::storage {

namespace fs = std::filesystem;
using peek::core::Error;
using peek::core::ErrorCode;

LocalStorageBackend::LocalStorageBackend(fs::path root, std::optional<std::string> public_base_url)
    : root_(std::move(root)), public_base_url_(std::move(public_base_url)) {
  fs::create_directories(root_);
  if (public_base_url_) {
    while (!public_base_url_->empty() && public_base_url_->back() == '/') {
      public_base_url_->pop_back();
    }
  }
}

std::expected<void, Error> LocalStorageBackend::put(const std::string& key,
                                                    std::span<const std::byte> bytes,
                                                    std::string_view /*content_type*/) {
  if (auto valid = validate_key(key); !valid) {
    return std::unexpected(valid.error());
  }

  const fs::path target = path_for(key);
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec) {
    return std::unexpected(Error{ErrorCode::StorageError, "mkdir " + target.parent_path().string() +
                                                              ": " + ec.message()});
  }

  fs::path tmp = target;
  tmp += ".tmp-" + random_hex(4);
  {
    std::ofstream os(tmp, std::ios::binary | std::ios::trunc);
    if (!os) {
      return std::unexpected(Error{ErrorCode::StorageError, "cannot open " + tmp.string()});
    }
    os.write(reinterpret_cast<const char*>(bytes.data()),
             static_cast<std::streamsize>(bytes.size()));
    os.flush();
    if (!os) {
      os.close();
      fs::remove(tmp, ec);
      return std::unexpected(Error{ErrorCode::StorageError, "short write to " + tmp.string()});
    }
  }

  fs::rename(tmp, target, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(tmp, ignored);
    return std::unexpected(Error{ErrorCode::StorageError, "rename to " + target.string() + ": " +
                                                              ec.message()});
  }
  return {};
}

std::expected<Bytes, Error> LocalStorageBackend::fetch(const std::string& key) const {
  if (auto valid = validate_key(key); !valid) {
    return std::unexpected(valid.error());
  }

  const fs::path p = path_for(key);
  std::error_code ec;
  if (!fs::is_regular_file(p, ec)) {
    return std::unexpected(Error{ErrorCode::NotFound, "no object at key " + key});
  }

  std::ifstream is(p, std::ios::binary);
  if (!is) {
    return std::unexpected(Error{ErrorCode::StorageError, "cannot open " + p.string()});
  }
  const auto size = fs::file_size(p, ec);
  if (ec) {
    return std::unexpected(Error{ErrorCode::StorageError, "stat " + p.string() + ": " + ec.message()});
  }
  Bytes data(static_cast<std::size_t>(size));
  is.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
  if (static_cast<std::size_t>(is.gcount()) != data.size()) {
    return std::unexpected(Error{ErrorCode::StorageError, "short read from " + p.string()});
  }
  return data;
}

std::expected<void, Error> LocalStorageBackend::remove(const std::string& key) {
  if (auto valid = validate_key(key); !valid) {
    return std::unexpected(valid.error());
  }
  std::error_code ec;
  fs::remove(path_for(key), ec);
  if (ec) {
    return std::unexpected(Error{ErrorCode::StorageError, "remove " + key + ": " + ec.message()});
  }
  return {};
}

std::expected<bool, Error> LocalStorageBackend::exists(const std::string& key) const {
  if (auto valid = validate_key(key); !valid) {
    return std::unexpected(valid.error());
  }
  std::error_code ec;
  const bool present = fs::is_regular_file(path_for(key), ec);
  if (ec && ec != std::errc::no_such_file_or_directory) {
    return std::unexpected(Error{ErrorCode::StorageError, "stat " + key + ": " + ec.message()});
  }
  return present;
}

std::optional<std::string> LocalStorageBackend::public_url(const std::string& key) const {
  if (!public_base_url_ || !validate_key(key)) return std::nullopt;
  return *public_base_url_ + "/" + key;
}

}  // namespace peek::storage
