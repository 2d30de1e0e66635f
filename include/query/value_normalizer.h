#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "schema/record_schema.h"

namespace quanta {
namespace query {

/// Parses YYYY-MM-DD[(T| )hh:mm[:ss[.fff]][Z|+hh:mm|-hh:mm]] and renders it in UTC as
/// YYYY-MM-DDTHH:MM:SS[.fff]Z. nullopt if the text is not a date-time.
std::optional<std::string> normalizeDateTime(const std::string& text);

inline bool looksLikeDateTime(const std::string& text) {
    return normalizeDateTime(text).has_value();
}

/// Milliseconds since the Unix epoch as YYYY-MM-DDTHH:MM:SS.fffZ
std::string formatEpochMillis(int64_t millis);

/// Metric samples ({"time","value"} objects, or arrays of them) as an array sorted by time.
/// Plain values become a single sample with a null time.
nlohmann::json normalizeMetricSamples(const nlohmann::json& value);

/// Value of the most recent sample; null for an empty series
nlohmann::json latestSampleValue(const nlohmann::json& value);

/// Output form of a stored value given its attribute definition:
/// date-times in UTC ISO form, numeric strings of numeric attributes as numbers,
/// metric series sorted by time (a single sample collapses to its value).
nlohmann::json normalizeValue(const nlohmann::json& value, const AttributeDefinition& def);

} // namespace query
} // namespace quanta
