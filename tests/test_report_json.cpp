#include "dqv/engine/report_json.h"
#include "dqv/engine/report_summary.h"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

using namespace dqv;

namespace {

engine::Report sample_report() {
  engine::Report report;
  report.report_id = "report-3";
  report.run_id = "run-0";
  report.rule_set_id = "orders";
  report.rule_set_version = "2";
  report.rule_set_fingerprint = "00ff00ff00ff00ff";
  report.dataset_name = "orders";
  report.partition_count = 2;
  report.record_count = 4;
  report.sample_capacity = 10;
  report.created_at = "2026-01-01T00:00:00Z";
  report.overall_passed = false;

  engine::RuleReport unique;
  unique.name = "order_unique";
  unique.kind = rules::RuleKind::kUnique;
  unique.columns = {"order_no"};
  unique.pass_count = 2;
  unique.fail_count = 2;
  unique.total = 4;
  unique.pass_rate = 0.5;
  unique.passed = false;
  for (std::uint64_t seq : {0U, 1U}) {
    rules::Outcome outcome;
    outcome.rule_name = "order_unique";
    outcome.record_id = "A-" + std::to_string(seq);
    outcome.status = rules::OutcomeStatus::kFailed;
    outcome.reason = rules::FailureReason::kDuplicateKey;
    outcome.observed_value = "A";
    outcome.partition_index = 1;
    outcome.sequence = seq;
    unique.failure_sample.push_back(outcome);
  }
  report.rules.push_back(unique);

  engine::RuleReport note;
  note.name = "note_check";
  note.kind = rules::RuleKind::kCustom;
  note.severity = rules::Severity::kWarning;
  note.pass_count = 3;
  note.error_count = 1;
  note.total = 4;
  rules::Outcome error;
  error.rule_name = "note_check";
  error.record_id = "A-3";
  error.status = rules::OutcomeStatus::kError;
  error.reason = rules::FailureReason::kEvaluationError;
  error.message = "predicate threw";
  note.error_sample.push_back(error);
  report.rules.push_back(note);

  return report;
}

}  // namespace

TEST_CASE("report_to_json: stable document with rule details", "[report][json]") {
  const auto report = sample_report();
  const auto j = engine::report_to_json(report);

  CHECK(j.at("report_id") == "report-3");
  CHECK(j.at("overall_passed") == false);
  REQUIRE(j.at("rules").size() == 2);
  CHECK(j.at("rules")[0].at("kind") == "unique");
  CHECK(j.at("rules")[0].at("failure_sample")[1].at("reason") == "duplicate key");
  CHECK(j.at("rules")[1].at("severity") == "warning");
  CHECK(j.at("rules")[1].at("error_sample")[0].at("message") == "predicate threw");

  CHECK(engine::report_to_json_string(report) == engine::report_to_json_string(report));
}

TEST_CASE("parse_report_json: reads back a stored report", "[report][json]") {
  const auto report = sample_report();
  const auto parsed = engine::parse_report_json(engine::report_to_json_string(report));
  REQUIRE(parsed.has_value());
  const auto& r = parsed.value();

  CHECK(r.report_id == report.report_id);
  CHECK(r.rule_set_fingerprint == report.rule_set_fingerprint);
  CHECK(r.record_count == 4);
  CHECK_FALSE(r.overall_passed);
  REQUIRE(r.rules.size() == 2);
  CHECK(r.rules[0].kind == rules::RuleKind::kUnique);
  CHECK(r.rules[0].columns == std::vector<std::string>{"order_no"});
  REQUIRE(r.rules[0].failure_sample.size() == 2);
  CHECK(r.rules[0].failure_sample[1].record_id == "A-1");
  CHECK(r.rules[0].failure_sample[1].partition_index == 1);
  CHECK(r.rules[1].error_sample[0].status == rules::OutcomeStatus::kError);
  CHECK(engine::report_to_json_string(r) == engine::report_to_json_string(report));
}

TEST_CASE("parse_report_json: malformed input is an error", "[report][json]") {
  CHECK_FALSE(engine::parse_report_json("{not json").has_value());
  CHECK_FALSE(engine::parse_report_json(R"({"record_count": "many"})").has_value());
}

TEST_CASE("parse_report_json: unknown enum spellings are rejected", "[report][json]") {
  const auto stored = engine::report_to_json(sample_report());

  auto bad_kind = stored;
  bad_kind["rules"][0]["kind"] = "uniqe";
  const auto kind_result = engine::parse_report_json(bad_kind.dump());
  REQUIRE_FALSE(kind_result.has_value());
  CHECK(kind_result.error().find("uniqe") != std::string::npos);

  auto bad_severity = stored;
  bad_severity["rules"][1]["severity"] = "fatal";
  CHECK_FALSE(engine::parse_report_json(bad_severity.dump()).has_value());

  auto bad_reason = stored;
  bad_reason["rules"][0]["failure_sample"][0]["reason"] = "gremlins";
  CHECK_FALSE(engine::parse_report_json(bad_reason.dump()).has_value());
}

TEST_CASE("format_summary: table, failing rules and verdict", "[report][summary]") {
  const auto summary = engine::format_summary(sample_report());

  CHECK(summary.find("Dataset: orders (4 records, 2 partitions)") != std::string::npos);
  CHECK(summary.find("order_unique") != std::string::npos);
  CHECK(summary.find("50.00%") != std::string::npos);
  CHECK(summary.find("Rule failed: order_unique - 2/4 failures") != std::string::npos);
  CHECK(summary.find("record A-0: duplicate key (A)") != std::string::npos);
  CHECK(summary.find("Rule failed: note_check") == std::string::npos);
  CHECK(summary.find("Overall: FAILED") != std::string::npos);

  SECTION("sample lines are capped") {
    const auto capped = engine::format_summary(sample_report(), 1);
    CHECK(capped.find("record A-1") == std::string::npos);
    CHECK(capped.find("... 1 more") != std::string::npos);
  }
}
