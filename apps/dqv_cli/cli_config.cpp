#include "cli_config.h"

#include <charconv>

namespace dqv::cli {

namespace {

// ────────────────────────────────────────────────────────────────
// Value parsing
// ────────────────────────────────────────────────────────────────

std::optional<std::size_t> parse_count(const std::string& value) {
  std::size_t parsed = 0;
  const auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (value.empty() || ec != std::errc{} || end != value.data() + value.size()) {
    return std::nullopt;
  }
  return parsed;
}

std::string handle_positive_count(const std::string& flag, const std::string& value,
                                  std::size_t& out) {
  const auto parsed = parse_count(value);
  if (!parsed.has_value() || *parsed == 0) {
    return "Invalid " + flag + ": " + value + " (expected a positive integer)";
  }
  out = *parsed;
  return "";
}

// ────────────────────────────────────────────────────────────────
// validate handlers
// ────────────────────────────────────────────────────────────────

std::string handle_threads(ValidateConfig& config, const std::string& value) {
  const auto parsed = parse_count(value);
  if (!parsed.has_value()) {
    return "Invalid --threads: " + value + " (expected a non-negative integer)";
  }
  config.threads = *parsed;
  return "";
}

std::string handle_sample_capacity(ValidateConfig& config, const std::string& value) {
  std::size_t capacity = 0;
  auto error = handle_positive_count("--sample-capacity", value, capacity);
  if (error.empty()) {
    config.sample_capacity = capacity;
  }
  return error;
}

std::string handle_reference_data(ValidateConfig& config, const std::string& value) {
  const auto eq = value.find('=');
  if (eq == std::string::npos || eq == 0 || eq + 1 == value.size()) {
    return "Invalid --reference-data: " + value + " (expected name=path)";
  }
  config.reference_data.emplace_back(value.substr(0, eq), value.substr(eq + 1));
  return "";
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Option registries
// ────────────────────────────────────────────────────────────────

std::vector<apps::Option<ValidateConfig>> validate_option_registry() {
  return {
      {"--rules", true, "Rule set JSON document (required)",
       [](ValidateConfig& c, const std::string& v) {
         c.rules_path = v;
         return std::string{};
       }},
      {"--data", true, "Dataset as a JSON array or JSON Lines file",
       [](ValidateConfig& c, const std::string& v) {
         c.data_path = v;
         return std::string{};
       }},
      {"--sqlite", true, "SQLite database holding the dataset table",
       [](ValidateConfig& c, const std::string& v) {
         c.sqlite_path = v;
         return std::string{};
       }},
      {"--table", true, "Dataset table inside --sqlite",
       [](ValidateConfig& c, const std::string& v) {
         c.table = v;
         return std::string{};
       }},
      {"--id-column", true, "Column used as record id in diagnostics",
       [](ValidateConfig& c, const std::string& v) {
         c.id_column = v;
         return std::string{};
       }},
      {"--partitions", true, "Number of partitions to split the dataset into (default 4)",
       [](ValidateConfig& c, const std::string& v) {
         return handle_positive_count("--partitions", v, c.partitions);
       }},
      {"--threads", true, "Worker threads (default: hardware concurrency)", handle_threads},
      {"--sample-capacity", true, "Failures kept per rule (default 100)", handle_sample_capacity},
      {"--reference-db", true, "SQLite database resolving table.column references",
       [](ValidateConfig& c, const std::string& v) {
         c.reference_db = v;
         return std::string{};
       }},
      {"--reference-data", true, "Reference dataset name=path (JSON); repeatable",
       handle_reference_data},
      {"--redis", true, "Redis URI resolving references from dqv:reference:<id> sets",
       [](ValidateConfig& c, const std::string& v) {
         c.redis_uri = v;
         return std::string{};
       }},
      {"--audit-db", true, "SQLite database for the audit trail and stored reports",
       [](ValidateConfig& c, const std::string& v) {
         c.audit_db = v;
         return std::string{};
       }},
      {"--report-out", true, "Write the report JSON to this file",
       [](ValidateConfig& c, const std::string& v) {
         c.report_out = v;
         return std::string{};
       }},
      {"--json", false, "Print the report as JSON instead of the summary table",
       [](ValidateConfig& c, const std::string& /*v*/) {
         c.json_output = true;
         return std::string{};
       }},
  };
}

std::vector<apps::Option<ShowReportConfig>> show_report_option_registry() {
  return {
      {"--audit-db", true, "SQLite database written by validate --audit-db (required)",
       [](ShowReportConfig& c, const std::string& v) {
         c.audit_db = v;
         return std::string{};
       }},
      {"--report-id", true, "Report to print",
       [](ShowReportConfig& c, const std::string& v) {
         c.report_id = v;
         return std::string{};
       }},
      {"--dataset", true, "List the stored reports of a dataset",
       [](ShowReportConfig& c, const std::string& v) {
         c.dataset = v;
         return std::string{};
       }},
      {"--json", false, "Print the report as JSON",
       [](ShowReportConfig& c, const std::string& /*v*/) {
         c.json_output = true;
         return std::string{};
       }},
  };
}

apps::ParsedOptions<ValidateConfig> parse_validate_args(int argc, char* argv[]) {
  return apps::parse_options(argc, argv, validate_option_registry(), 2);
}

apps::ParsedOptions<ShowReportConfig> parse_show_report_args(int argc, char* argv[]) {
  return apps::parse_options(argc, argv, show_report_option_registry(), 2);
}

}  // namespace dqv::cli
