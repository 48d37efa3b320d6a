#include <peek/storage/storage_backend.hpp>
#include <peek/storage/crypto.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>

namespace peek::storage {

using peek::core::Error;
using peek::core::ErrorCode;

std::expected<std::string, Error> IStorageBackend::save(std::span<const std::byte> bytes,
                                                        std::string_view suggested_name,
                                                        std::string_view content_type) {
  std::string key = generate_key(suggested_name);
  auto written = put(key, bytes, content_type);
  if (!written) {
    return std::unexpected(written.error());
  }
  return key;
}

std::string sanitize_filename(std::string_view filename) {
  const auto slash = filename.find_last_of("/\\");
  if (slash != std::string_view::npos) filename = filename.substr(slash + 1);

  std::string out;
  out.reserve(filename.size());
  for (std::size_t i = 0; i < filename.size(); ++i) {
    const char c = filename[i];
    if (c == '\0') continue;
    if (c == '.' && i + 1 < filename.size() && filename[i + 1] == '.') {
      ++i;
      continue;
    }
    out.push_back(c);
  }

  const auto first = out.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return {};
  const auto last = out.find_last_not_of(" \t\r\n");
  return out.substr(first, last - first + 1);
}

std::string generate_key(std::string_view suggested_name) {
  const std::string name = sanitize_filename(suggested_name);
  std::string ext = "bin";
  const auto dot = name.rfind('.');
  if (dot != std::string::npos && dot + 1 < name.size()) {
    std::string candidate = name.substr(dot + 1);
    const bool alnum = std::all_of(candidate.begin(), candidate.end(),
                                   [](unsigned char c) { return std::isalnum(c) != 0; });
    if (alnum && candidate.size() <= 8) {
      std::transform(candidate.begin(), candidate.end(), candidate.begin(),
                     [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
      ext = std::move(candidate);
    }
  }

  const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  gmtime_r(&now, &tm);
  char stamp[32];
  std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &tm);

  return "images/" + std::string(stamp) + "_" + random_hex(8) + "." + ext;
}

std::expected<void, Error> validate_key(std::string_view key) {
  if (key.empty()) {
    return std::unexpected(Error{ErrorCode::ValidationError, "empty storage key"});
  }
  if (key.front() == '/' || key.find("..") != std::string_view::npos ||
      key.find('\\') != std::string_view::npos || key.find('\0') != std::string_view::npos) {
    return std::unexpected(
        Error{ErrorCode::ValidationError, "invalid storage key: " + std::string(key)});
  }
  return {};
}

}  // namespace peek::storage
