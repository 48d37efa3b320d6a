#include <peek/core/error.hpp>

namespace peek::core {

std::string_view to_string(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::None:
      return "none";
    case ErrorCode::ValidationError:
      return "validation_error";
    case ErrorCode::DecodeError:
      return "decode_error";
    case ErrorCode::AnalyzerError:
      return "analyzer_error";
    case ErrorCode::PipelineError:
      return "pipeline_error";
    case ErrorCode::Timeout:
      return "timeout";
    case ErrorCode::StorageError:
      return "storage_error";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::InvalidConfig:
      return "invalid_config";
    case ErrorCode::StoreError:
      return "store_error";
    case ErrorCode::AlreadyTerminal:
      return "already_terminal";
  }
  return "unknown";
}

}  // namespace peek::core
