#pragma once

#include "cli_config.h"

#include <string>

namespace dqv::cli {

// validate_validate_config checks cross-flag preconditions of `dqv_cli validate`.
//
// Returns: "" on success, non-empty error message on failure.
// Caller is responsible for printing the error and exiting with code 1.
//
// Preconditions checked (first failure is returned):
// - --rules is present
// - exactly one dataset source: --data, or --sqlite together with --table
// - --table is only meaningful with --sqlite
// - --redis, when present, is a valid Redis URI (format only, no connection)
// - --reference-data names are unique
[[nodiscard]] std::string validate_validate_config(const ValidateConfig& config);

// validate_show_report_config: --audit-db plus exactly one of --report-id / --dataset.
[[nodiscard]] std::string validate_show_report_config(const ShowReportConfig& config);

}  // namespace dqv::cli
