#include "dqv/engine/report_json.h"

#include <optional>
#include <stdexcept>
#include <string>

namespace dqv::engine {

namespace {

// Unknown enum spellings are rejected rather than mapped to a default.
template <typename Enum>
Enum require_known(const std::optional<Enum>& parsed, const char* field,
                   const std::string& text) {
  if (!parsed.has_value()) {
    throw std::invalid_argument(std::string("unknown ") + field + " '" + text + "'");
  }
  return *parsed;
}

nlohmann::json outcome_to_json(const rules::Outcome& outcome) {
  nlohmann::json j;
  j["rule_name"] = outcome.rule_name;
  j["record_id"] = outcome.record_id;
  j["status"] = std::string(rules::to_string(outcome.status));
  j["reason"] = std::string(rules::to_string(outcome.reason));
  j["observed_value"] = outcome.observed_value;
  if (!outcome.message.empty()) {
    j["message"] = outcome.message;
  }
  j["partition_index"] = outcome.partition_index;
  j["sequence"] = outcome.sequence;
  return j;
}

rules::Outcome outcome_from_json(const nlohmann::json& j) {
  rules::Outcome outcome;
  outcome.rule_name = j.value("rule_name", "");
  outcome.record_id = j.value("record_id", "");
  const std::string status = j.value("status", "failed");
  outcome.status = require_known(rules::parse_outcome_status(status), "status", status);
  const std::string reason = j.value("reason", "none");
  outcome.reason = require_known(rules::parse_failure_reason(reason), "reason", reason);
  outcome.observed_value = j.value("observed_value", "");
  outcome.message = j.value("message", "");
  outcome.partition_index = j.value("partition_index", std::size_t{0});
  outcome.sequence = j.value("sequence", std::uint64_t{0});
  return outcome;
}

nlohmann::json outcomes_to_json(const std::vector<rules::Outcome>& outcomes) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& outcome : outcomes) {
    arr.push_back(outcome_to_json(outcome));
  }
  return arr;
}

std::vector<rules::Outcome> outcomes_from_json(const nlohmann::json& j, const char* field) {
  std::vector<rules::Outcome> outcomes;
  if (j.contains(field)) {
    for (const auto& item : j.at(field)) {
      outcomes.push_back(outcome_from_json(item));
    }
  }
  return outcomes;
}

}  // namespace

nlohmann::json report_to_json(const Report& report) {
  nlohmann::json j;
  j["report_id"] = report.report_id;
  j["run_id"] = report.run_id;
  j["rule_set_id"] = report.rule_set_id;
  j["rule_set_version"] = report.rule_set_version;
  j["rule_set_fingerprint"] = report.rule_set_fingerprint;
  j["dataset_name"] = report.dataset_name;
  j["partition_count"] = report.partition_count;
  j["record_count"] = report.record_count;
  j["sample_capacity"] = report.sample_capacity;
  j["created_at"] = report.created_at;
  j["overall_passed"] = report.overall_passed;

  nlohmann::json rules_json = nlohmann::json::array();
  for (const auto& rule : report.rules) {
    nlohmann::json r;
    r["name"] = rule.name;
    r["kind"] = std::string(rules::to_string(rule.kind));
    r["severity"] = std::string(rules::to_string(rule.severity));
    r["columns"] = rule.columns;
    r["pass_count"] = rule.pass_count;
    r["fail_count"] = rule.fail_count;
    r["error_count"] = rule.error_count;
    r["total"] = rule.total;
    r["pass_rate"] = rule.pass_rate;
    r["passed"] = rule.passed;
    r["failure_sample"] = outcomes_to_json(rule.failure_sample);
    r["error_sample"] = outcomes_to_json(rule.error_sample);
    rules_json.push_back(r);
  }
  j["rules"] = rules_json;

  return j;
}

Report report_from_json(const nlohmann::json& j) {
  Report report;
  report.report_id = j.value("report_id", "");
  report.run_id = j.value("run_id", "");
  report.rule_set_id = j.value("rule_set_id", "");
  report.rule_set_version = j.value("rule_set_version", "");
  report.rule_set_fingerprint = j.value("rule_set_fingerprint", "");
  report.dataset_name = j.value("dataset_name", "");
  report.partition_count = j.value("partition_count", std::size_t{0});
  report.record_count = j.value("record_count", std::uint64_t{0});
  report.sample_capacity = j.value("sample_capacity", std::size_t{0});
  report.created_at = j.value("created_at", "");
  report.overall_passed = j.value("overall_passed", true);

  if (j.contains("rules")) {
    for (const auto& r : j.at("rules")) {
      RuleReport rule;
      rule.name = r.value("name", "");
      const std::string kind = r.value("kind", "");
      rule.kind = require_known(rules::parse_rule_kind(kind), "rule kind", kind);
      const std::string severity = r.value("severity", "error");
      rule.severity = require_known(rules::parse_severity(severity), "severity", severity);
      if (r.contains("columns")) {
        rule.columns = r.at("columns").get<std::vector<std::string>>();
      }
      rule.pass_count = r.value("pass_count", std::uint64_t{0});
      rule.fail_count = r.value("fail_count", std::uint64_t{0});
      rule.error_count = r.value("error_count", std::uint64_t{0});
      rule.total = r.value("total", rule.pass_count + rule.fail_count + rule.error_count);
      rule.pass_rate = r.value("pass_rate", 1.0);
      rule.passed = r.value("passed", rule.fail_count == 0);
      rule.failure_sample = outcomes_from_json(r, "failure_sample");
      rule.error_sample = outcomes_from_json(r, "error_sample");
      report.rules.push_back(std::move(rule));
    }
  }

  return report;
}

std::string report_to_json_string(const Report& report) {
  return report_to_json(report).dump();
}

core::Result<Report, std::string> parse_report_json(const std::string& text) {
  try {
    return core::Result<Report, std::string>::ok(report_from_json(nlohmann::json::parse(text)));
  } catch (const nlohmann::json::exception& e) {
    return core::Result<Report, std::string>::err(std::string("malformed report JSON: ") +
                                                  e.what());
  } catch (const std::invalid_argument& e) {
    return core::Result<Report, std::string>::err(std::string("malformed report JSON: ") +
                                                  e.what());
  }
}

}  // namespace dqv::engine
