#pragma once

#include "dqv/rules/outcome.h"
#include "dqv/rules/rule_spec.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace dqv::engine {

// RuleReport is the dataset-wide result of one rule.
// total = pass_count + fail_count + error_count.
// pass_rate = pass_count / (pass_count + fail_count), 1.0 when both are zero; error
// outcomes are not data-quality verdicts and stay out of the rate.
struct RuleReport {
  std::string name;                                // NOLINT(readability-identifier-naming)
  rules::RuleKind kind{rules::RuleKind::kNotNull};  // NOLINT(readability-identifier-naming)
  rules::Severity severity{rules::Severity::kError};  // NOLINT(readability-identifier-naming)
  std::vector<std::string> columns;                // NOLINT(readability-identifier-naming)
  std::uint64_t pass_count{0};                     // NOLINT(readability-identifier-naming)
  std::uint64_t fail_count{0};                     // NOLINT(readability-identifier-naming)
  std::uint64_t error_count{0};                    // NOLINT(readability-identifier-naming)
  std::uint64_t total{0};                          // NOLINT(readability-identifier-naming)
  double pass_rate{1.0};                           // NOLINT(readability-identifier-naming)
  bool passed{true};                               // fail_count == 0
  std::vector<rules::Outcome> failure_sample;      // NOLINT(readability-identifier-naming)
  std::vector<rules::Outcome> error_sample;        // NOLINT(readability-identifier-naming)
};

// Report is the single result of a validation run. It is built once by
// build_report() and handed to the caller, which owns it; nothing in the engine keeps
// or mutates it afterwards.
// overall_passed is true iff no Error-severity rule has fail_count > 0.
struct Report {
  std::string report_id;                 // NOLINT(readability-identifier-naming)
  std::string run_id;                    // NOLINT(readability-identifier-naming)
  std::string rule_set_id;               // NOLINT(readability-identifier-naming)
  std::string rule_set_version;          // NOLINT(readability-identifier-naming)
  std::string rule_set_fingerprint;      // NOLINT(readability-identifier-naming)
  std::string dataset_name;              // NOLINT(readability-identifier-naming)
  std::size_t partition_count{0};        // NOLINT(readability-identifier-naming)
  std::uint64_t record_count{0};         // NOLINT(readability-identifier-naming)
  std::size_t sample_capacity{0};        // NOLINT(readability-identifier-naming)
  std::string created_at;                // NOLINT(readability-identifier-naming)
  std::vector<RuleReport> rules;         // rule set order
  bool overall_passed{true};             // NOLINT(readability-identifier-naming)

  // Returns nullptr when no rule has that name.
  [[nodiscard]] const RuleReport* find(const std::string& rule_name) const;
};

}  // namespace dqv::engine
