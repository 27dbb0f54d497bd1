#pragma once

#include "dqv/engine/aggregator.h"
#include "dqv/engine/report.h"
#include "dqv/rules/rule_set.h"

#include <cstddef>
#include <string>

namespace dqv::engine {

// Run identity stamped onto the report.
struct ReportHeader {
  std::string report_id;        // NOLINT(readability-identifier-naming)
  std::string run_id;           // NOLINT(readability-identifier-naming)
  std::string dataset_name;     // NOLINT(readability-identifier-naming)
  std::size_t sample_capacity{0};  // NOLINT(readability-identifier-naming)
  std::string created_at;       // NOLINT(readability-identifier-naming)
};

[[nodiscard]] double compute_pass_rate(std::uint64_t pass_count, std::uint64_t fail_count) noexcept;

// build_report is a pure transformation of aggregated metrics into a Report.
// metrics.rules must follow rule_set order (as produced by aggregate()).
// Throws std::invalid_argument otherwise.
[[nodiscard]] Report build_report(const ReportHeader& header, const rules::RuleSet& rule_set,
                                  AggregatedMetrics metrics);

}  // namespace dqv::engine
