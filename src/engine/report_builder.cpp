#include "dqv/engine/report_builder.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace dqv::engine {

const RuleReport* Report::find(const std::string& rule_name) const {
  const auto it = std::find_if(rules.begin(), rules.end(),
                               [&rule_name](const RuleReport& r) { return r.name == rule_name; });
  return it == rules.end() ? nullptr : &*it;
}

double compute_pass_rate(const std::uint64_t pass_count, const std::uint64_t fail_count) noexcept {
  const std::uint64_t judged = pass_count + fail_count;
  if (judged == 0) {
    return 1.0;
  }
  return static_cast<double>(pass_count) / static_cast<double>(judged);
}

Report build_report(const ReportHeader& header, const rules::RuleSet& rule_set,
                    AggregatedMetrics metrics) {
  if (metrics.rules.size() != rule_set.size()) {
    throw std::invalid_argument("aggregated metrics do not match the rule set");
  }

  Report report;
  report.report_id = header.report_id;
  report.run_id = header.run_id;
  report.rule_set_id = rule_set.rule_set_id();
  report.rule_set_version = rule_set.version();
  report.rule_set_fingerprint = rule_set.fingerprint();
  report.dataset_name = header.dataset_name;
  report.partition_count = metrics.partition_count;
  report.record_count = metrics.record_count;
  report.sample_capacity = header.sample_capacity;
  report.created_at = header.created_at;
  report.rules.reserve(metrics.rules.size());

  for (std::size_t i = 0; i < metrics.rules.size(); ++i) {
    const auto& rule = *rule_set.rules()[i];
    auto& m = metrics.rules[i];
    if (m.rule_name != rule.name()) {
      throw std::invalid_argument("metrics for '" + m.rule_name + "' out of rule set order");
    }

    RuleReport entry;
    entry.name = std::move(m.rule_name);
    entry.kind = rule.kind();
    entry.severity = rule.severity();
    entry.columns = rule.columns();
    entry.pass_count = m.pass_count;
    entry.fail_count = m.fail_count;
    entry.error_count = m.error_count;
    entry.total = m.pass_count + m.fail_count + m.error_count;
    entry.pass_rate = compute_pass_rate(m.pass_count, m.fail_count);
    entry.passed = m.fail_count == 0;
    entry.failure_sample = std::move(m.failure_sample);
    entry.error_sample = std::move(m.error_sample);

    if (entry.severity == rules::Severity::kError && !entry.passed) {
      report.overall_passed = false;
    }
    report.rules.push_back(std::move(entry));
  }

  return report;
}

}  // namespace dqv::engine
