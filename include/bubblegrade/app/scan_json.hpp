#pragma once

#include <bubblegrade/core/scan_result.hpp>
#include <nlohmann/json.hpp>
#include <string>

namespace bubblegrade::app {

/// ISO 8601 UTC with seconds precision, e.g. "2024-03-01T10:15:00Z".
[[nodiscard]] std::string format_timestamp(bubblegrade::core::Timestamp t);

/// Export view of a scan record. Absent optionals are omitted; a curp field also
/// carries its "analysis" breakdown.
[[nodiscard]] nlohmann::json to_json(const bubblegrade::core::ScanResult& scan);

}  // namespace bubblegrade::app
