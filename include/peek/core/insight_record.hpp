#pragma once

#include <peek/core/insights.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace peek::core {

/// Record state machine: Processing -> Completed | Failed, exactly once.
enum class JobStatus : std::uint8_t {
  Processing,
  Completed,
  Failed,
};

[[nodiscard]] std::string_view to_string(JobStatus status) noexcept;
[[nodiscard]] std::optional<JobStatus> parse_job_status(std::string_view s) noexcept;

/// Uploaded image. The job id doubles as the asset id (one asset per job).
/// annotated_key is a reference to a derived artifact, not an owned blob; the
/// artifact may be purged without touching the record's insights.
struct ImageAsset {
  std::string original_key;
  std::optional<std::string> annotated_key;
  std::string content_type;
  std::uint64_t size_bytes{0};
  std::string checksum;  // SHA-256, lowercase hex
  std::string filename;  // sanitized client filename; may be empty
  std::optional<std::uint32_t> width;
  std::optional<std::uint32_t> height;
};

/// Client-visible result of one job.
struct InsightRecord {
  std::string id;
  JobStatus status{JobStatus::Processing};
  std::int64_t created_at_ms{0};  // unix epoch, milliseconds
  std::int64_t updated_at_ms{0};
  ImageAsset asset;

  /// Present only when status == Completed.
  std::optional<Insights> insights;
  /// Machine-readable failure reason when status == Failed ("timeout", ...).
  std::optional<std::string> reason;
  /// Analyzers whose fields are null in a completed record.
  std::vector<std::string> failed_analyzers;
  std::optional<std::int64_t> processing_time_ms;

  [[nodiscard]] bool terminal() const noexcept { return status != JobStatus::Processing; }
};

}  // namespace peek::core
