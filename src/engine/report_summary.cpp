#include "dqv/engine/report_summary.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace dqv::engine {

namespace {

std::string format_rate(const double rate) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2) << rate * 100.0 << "%";
  return oss.str();
}

}  // namespace

std::string format_summary(const Report& report, const std::size_t max_sample_lines) {
  std::size_t name_width = 4;
  for (const auto& rule : report.rules) {
    name_width = std::max(name_width, rule.name.size());
  }

  std::ostringstream out;
  out << "Dataset: " << report.dataset_name << " (" << report.record_count << " records, "
      << report.partition_count << " partitions)\n";
  out << "Rule set: " << report.rule_set_id << " v" << report.rule_set_version << " ["
      << report.rule_set_fingerprint << "]\n\n";

  out << std::left << std::setw(static_cast<int>(name_width)) << "name" << "  "
      << std::setw(8) << "severity" << "  " << std::setw(6) << "passed" << "  " << std::right
      << std::setw(10) << "failures" << "  " << std::setw(8) << "errors" << "  "
      << std::setw(10) << "total" << "  " << std::setw(9) << "pass rate" << "\n";

  for (const auto& rule : report.rules) {
    out << std::left << std::setw(static_cast<int>(name_width)) << rule.name << "  "
        << std::setw(8) << rules::to_string(rule.severity) << "  " << std::setw(6)
        << (rule.passed ? "yes" : "no") << "  " << std::right << std::setw(10)
        << rule.fail_count << "  " << std::setw(8) << rule.error_count << "  " << std::setw(10)
        << rule.total << "  " << std::setw(9) << format_rate(rule.pass_rate) << "\n";
  }

  for (const auto& rule : report.rules) {
    if (rule.passed) {
      continue;
    }
    out << "\nRule failed: " << rule.name << " - " << rule.fail_count << "/" << rule.total
        << " failures\n";
    const std::size_t shown = std::min(max_sample_lines, rule.failure_sample.size());
    for (std::size_t i = 0; i < shown; ++i) {
      const auto& outcome = rule.failure_sample[i];
      out << "  record " << outcome.record_id << ": " << rules::to_string(outcome.reason);
      if (!outcome.observed_value.empty()) {
        out << " (" << outcome.observed_value << ")";
      }
      out << "\n";
    }
    if (rule.fail_count > shown) {
      out << "  ... " << (rule.fail_count - shown) << " more\n";
    }
  }

  out << "\nOverall: " << (report.overall_passed ? "PASSED" : "FAILED") << "\n";
  return out.str();
}

}  // namespace dqv::engine
