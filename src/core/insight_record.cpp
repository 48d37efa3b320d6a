#include <peek/core/insight_record.hpp>

namespace peek::core {

std::string_view to_string(JobStatus status) noexcept {
  switch (status) {
    case JobStatus::Processing:
      return "processing";
    case JobStatus::Completed:
      return "completed";
    case JobStatus::Failed:
    default:
      return "failed";
  }
}

std::optional<JobStatus> parse_job_status(std::string_view s) noexcept {
  if (s == "processing") return JobStatus::Processing;
  if (s == "completed") return JobStatus::Completed;
  if (s == "failed") return JobStatus::Failed;
  return std::nullopt;
}

}  // namespace peek::core
