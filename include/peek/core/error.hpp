#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace peek::core {

/// Error codes; used with std::expected for recoverable failures.
enum class ErrorCode {
  None = 0,
  ValidationError,  // bad upload or bad key; rejected before a job exists
  DecodeError,      // bytes are not a decodable image
  AnalyzerError,    // one capability failed; degrades the payload only
  PipelineError,    // every analyzer failed
  Timeout,
  StorageError,
  NotFound,
  InvalidConfig,
  StoreError,       // result store (SQLite) failure
  AlreadyTerminal,  // record already left `processing`
};

/// Code plus a human-readable detail message.
struct Error {
  ErrorCode code{ErrorCode::None};
  std::string message;

  Error() = default;
  Error(ErrorCode c, std::string msg = {}) : code(c), message(std::move(msg)) {}

  friend bool operator==(const Error& a, const Error& b) noexcept {
    return a.code == b.code;
  }
  friend bool operator==(const Error& a, ErrorCode c) noexcept {
    return a.code == c;
  }
};

/// Machine-readable reason string, e.g. "decode_error", "timeout".
[[nodiscard]] std::string_view to_string(ErrorCode code) noexcept;

}  // namespace peek::core
