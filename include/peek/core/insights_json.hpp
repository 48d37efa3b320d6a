#pragma once

#include <peek/core/error.hpp>
#include <peek/core/insight_record.hpp>
#include <peek/core/insights.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace peek::core {

/// Field order follows the client schema, so documents are stable byte-for-byte.
using Json = nlohmann::ordered_json;

/// The `insights` object: exactly the client-facing fields, failed analyzers as null.
[[nodiscard]] Json insights_to_json(const Insights& insights);

[[nodiscard]] std::expected<Insights, Error> insights_from_json(const Json& j);

/// Compact text form used for the result store's insights column.
[[nodiscard]] std::string serialize_insights(const Insights& insights);

[[nodiscard]] std::expected<Insights, Error> parse_insights(std::string_view text);

/// Client view of a record: id, status, timestamps, reason when failed,
/// insights only when completed.
[[nodiscard]] Json record_to_json(const InsightRecord& record);

/// ISO-8601 UTC with millisecond precision, e.g. "2024-05-01T12:00:00.000Z".
[[nodiscard]] std::string format_timestamp(std::int64_t epoch_ms);

}  // namespace peek::core
