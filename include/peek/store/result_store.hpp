#pragma once

#include <peek/core/error.hpp>
#include <peek/core/insight_record.hpp>
#include <peek/core/insights.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace peek::store {

/// Everything written by the single processing -> completed transition.
struct Completion {
  peek::core::Insights insights;
  std::vector<std::string> failed_analyzers;
  std::optional<std::string> annotated_key;
  std::optional<std::uint32_t> width;
  std::optional<std::uint32_t> height;
  std::int64_t processing_time_ms{0};
};

/// Durable table of insight records keyed by job id.
///
/// complete() and fail() only apply to a record still in `processing`; a
/// second terminal write fails with ErrorCode::AlreadyTerminal and leaves the
/// record untouched. Each terminal write is one atomic update.
class IResultStore {
 public:
  virtual ~IResultStore() = default;

  /// Inserts a new record; its status must be Processing.
  [[nodiscard]] virtual std::expected<void, peek::core::Error> create(
      const peek::core::InsightRecord& record) = 0;

  /// ErrorCode::NotFound for an unknown id.
  [[nodiscard]] virtual std::expected<peek::core::InsightRecord, peek::core::Error> get(
      const std::string& id) const = 0;

  [[nodiscard]] virtual std::expected<void, peek::core::Error> complete(
      const std::string& id, const Completion& completion, std::int64_t now_ms) = 0;

  [[nodiscard]] virtual std::expected<void, peek::core::Error> fail(
      const std::string& id,
      std::string_view reason,
      std::int64_t processing_time_ms,
      std::int64_t now_ms) = 0;

  /// Ids with the given status, oldest first.
  [[nodiscard]] virtual std::expected<std::vector<std::string>, peek::core::Error> list_ids(
      peek::core::JobStatus status) const = 0;

  [[nodiscard]] virtual std::expected<std::size_t, peek::core::Error> count() const = 0;
};

/// Current wall-clock time in unix milliseconds.
[[nodiscard]] std::int64_t now_ms();

}  // namespace peek::store
