#include "dqv/engine/report_builder.h"

#include <catch2/catch_matchers_floating_point.hpp>
#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace dqv;
using Catch::Matchers::WithinAbs;

namespace {

rules::RuleSet make_rule_set() {
  auto definition = rules::rule_set_definition_from_json(nlohmann::json::parse(R"({
    "rule_set_id": "orders", "version": "7",
    "rules": [
      {"name": "blocking", "kind": "not_null", "column": "id"},
      {"name": "advisory", "kind": "not_null", "column": "note", "severity": "warning"}
    ]
  })"));
  REQUIRE(definition.has_value());
  auto rule_set = rules::build_rule_set(definition.value());
  REQUIRE(rule_set.has_value());
  return std::move(rule_set.value());
}

engine::AggregatedMetrics metrics(std::uint64_t blocking_fails, std::uint64_t advisory_fails) {
  engine::AggregatedMetrics m;
  m.partition_count = 2;
  m.record_count = 10;
  m.rules.push_back({"blocking", 10 - blocking_fails, blocking_fails, 0, {}, {}});
  m.rules.push_back({"advisory", 10 - advisory_fails, advisory_fails, 0, {}, {}});
  return m;
}

const engine::ReportHeader kHeader{"report-1", "run-0", "orders_2026", 100,
                                   "2026-01-01T00:00:00Z"};

}  // namespace

TEST_CASE("compute_pass_rate: errors excluded, empty is a full pass", "[engine][report]") {
  CHECK(engine::compute_pass_rate(0, 0) == 1.0);
  CHECK_THAT(engine::compute_pass_rate(3, 1), WithinAbs(0.75, 1e-12));
  CHECK(engine::compute_pass_rate(0, 4) == 0.0);
}

TEST_CASE("build_report: header and rule set identity are stamped", "[engine][report]") {
  const auto rule_set = make_rule_set();
  const auto report = engine::build_report(kHeader, rule_set, metrics(0, 0));

  CHECK(report.report_id == "report-1");
  CHECK(report.run_id == "run-0");
  CHECK(report.rule_set_id == "orders");
  CHECK(report.rule_set_version == "7");
  CHECK(report.rule_set_fingerprint == rule_set.fingerprint());
  CHECK(report.dataset_name == "orders_2026");
  CHECK(report.partition_count == 2);
  CHECK(report.record_count == 10);
  CHECK(report.created_at == "2026-01-01T00:00:00Z");
  CHECK(report.overall_passed);

  const auto* blocking = report.find("blocking");
  REQUIRE(blocking != nullptr);
  CHECK(blocking->kind == rules::RuleKind::kNotNull);
  CHECK(blocking->columns == std::vector<std::string>{"id"});
  CHECK(blocking->total == 10);
  CHECK(blocking->pass_rate == 1.0);
  CHECK(report.find("missing") == nullptr);
}

TEST_CASE("build_report: only error-severity failures fail the gate", "[engine][report]") {
  const auto rule_set = make_rule_set();

  SECTION("warning failures leave overall_passed true") {
    const auto report = engine::build_report(kHeader, rule_set, metrics(0, 4));
    CHECK(report.overall_passed);
    CHECK_FALSE(report.find("advisory")->passed);
    CHECK_THAT(report.find("advisory")->pass_rate, WithinAbs(0.6, 1e-12));
  }

  SECTION("error failures set overall_passed false") {
    const auto report = engine::build_report(kHeader, rule_set, metrics(1, 0));
    CHECK_FALSE(report.overall_passed);
    CHECK_FALSE(report.find("blocking")->passed);
  }
}

TEST_CASE("build_report: error outcomes count toward total but not the rate",
          "[engine][report]") {
  const auto rule_set = make_rule_set();
  auto m = metrics(0, 0);
  m.rules[0].pass_count = 8;
  m.rules[0].error_count = 2;

  const auto report = engine::build_report(kHeader, rule_set, m);
  const auto* blocking = report.find("blocking");
  CHECK(blocking->total == 10);
  CHECK(blocking->pass_rate == 1.0);
  CHECK(blocking->passed);
  CHECK(report.overall_passed);
}

TEST_CASE("build_report: metrics out of rule set order are rejected", "[engine][report]") {
  const auto rule_set = make_rule_set();
  auto m = metrics(0, 0);
  std::swap(m.rules[0], m.rules[1]);
  CHECK_THROWS_AS(engine::build_report(kHeader, rule_set, m), std::invalid_argument);

  m.rules.pop_back();
  CHECK_THROWS_AS(engine::build_report(kHeader, rule_set, m), std::invalid_argument);
}
