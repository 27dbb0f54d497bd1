#pragma once

#include "shared/arg_parser.h"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dqv::cli {

// ValidateConfig holds every flag of `dqv_cli validate`.
// Optional fields mean "not configured"; checks across fields live in
// validate_validate_config().
struct ValidateConfig {
  std::optional<std::string> rules_path;    // NOLINT(readability-identifier-naming)
  std::optional<std::string> data_path;     // NOLINT(readability-identifier-naming)
  std::optional<std::string> sqlite_path;   // NOLINT(readability-identifier-naming)
  std::optional<std::string> table;         // NOLINT(readability-identifier-naming)
  std::optional<std::string> id_column;     // NOLINT(readability-identifier-naming)
  std::size_t partitions{4};                // NOLINT(readability-identifier-naming)
  std::size_t threads{0};                   // 0 = hardware concurrency
  std::optional<std::size_t> sample_capacity;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> reference_db;  // NOLINT(readability-identifier-naming)
  // --reference-data name=path, in command-line order
  std::vector<std::pair<std::string, std::string>> reference_data;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> redis_uri;     // NOLINT(readability-identifier-naming)
  std::optional<std::string> audit_db;      // NOLINT(readability-identifier-naming)
  std::optional<std::string> report_out;    // NOLINT(readability-identifier-naming)
  bool json_output{false};                  // NOLINT(readability-identifier-naming)
};

// ShowReportConfig holds the flags of `dqv_cli show-report`.
struct ShowReportConfig {
  std::optional<std::string> audit_db;   // NOLINT(readability-identifier-naming)
  std::optional<std::string> report_id;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> dataset;    // NOLINT(readability-identifier-naming)
  bool json_output{false};               // NOLINT(readability-identifier-naming)
};

[[nodiscard]] std::vector<apps::Option<ValidateConfig>> validate_option_registry();
[[nodiscard]] std::vector<apps::Option<ShowReportConfig>> show_report_option_registry();

// Parses argv[2..] (argv[1] is the subcommand).
[[nodiscard]] apps::ParsedOptions<ValidateConfig> parse_validate_args(
    int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
[[nodiscard]] apps::ParsedOptions<ShowReportConfig> parse_show_report_args(
    int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

}  // namespace dqv::cli
