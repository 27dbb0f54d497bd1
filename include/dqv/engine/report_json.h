#pragma once

#include "dqv/core/result.h"
#include "dqv/engine/report.h"

#include <nlohmann/json.hpp>

#include <string>

namespace dqv::engine {

/// Serialize Report to JSON (deterministic, sorted keys)
[[nodiscard]] nlohmann::json report_to_json(const Report& report);

/// Deserialize Report from JSON. Missing fields take their defaults; a field of the
/// wrong type throws nlohmann::json::exception, and an unknown kind, severity, status or
/// reason throws std::invalid_argument.
[[nodiscard]] Report report_from_json(const nlohmann::json& j);

/// Serialize to stable JSON string (sorted keys, no whitespace)
[[nodiscard]] std::string report_to_json_string(const Report& report);

/// Parse a stored report document.
[[nodiscard]] core::Result<Report, std::string> parse_report_json(const std::string& text);

}  // namespace dqv::engine
