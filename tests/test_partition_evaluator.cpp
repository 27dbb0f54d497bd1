#include "dqv/engine/partition_evaluator.h"
#include "dqv/rules/kinds/unique_rule.h"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <vector>

using namespace dqv;

namespace {

rules::RuleSet make_rule_set(const std::string& json,
                             const rules::CustomPredicateRegistry& predicates = {}) {
  auto definition = rules::rule_set_definition_from_json(nlohmann::json::parse(json));
  REQUIRE(definition.has_value());
  auto rule_set = rules::build_rule_set(definition.value(), predicates);
  REQUIRE(rule_set.has_value());
  return std::move(rule_set.value());
}

data::Partition partition_of(std::size_t index, const std::vector<std::int64_t>& ids) {
  data::Partition partition;
  partition.index = index;
  for (const auto id : ids) {
    data::Record record;
    record.record_id = std::to_string(id);
    record.columns["id"] = id;
    partition.records.push_back(std::move(record));
  }
  return partition;
}

}  // namespace

TEST_CASE("PartitionEvaluator: one outcome per record per rule", "[engine][evaluator]") {
  const auto rule_set = make_rule_set(R"({"rules": [
    {"name": "id_present", "kind": "not_null", "column": "id"},
    {"name": "id_small", "kind": "range", "column": "id", "params": {"max": 2}}
  ]})");
  const reference::ReferenceHandles references;
  const engine::PartitionEvaluator evaluator(rule_set, references, 10);

  const auto partial = evaluator.evaluate(partition_of(3, {1, 2, 3, 4}));
  REQUIRE(partial.has_value());
  CHECK(partial->partition_count == 1);
  CHECK(partial->record_count == 4);
  REQUIRE(partial->rules.size() == 2);

  const auto& present = partial->rules[0];
  CHECK(present.rule_name == "id_present");
  CHECK(present.pass_count == 4);
  CHECK(present.fail_count == 0);

  const auto& small = partial->rules[1];
  CHECK(small.pass_count == 2);
  CHECK(small.fail_count == 2);
  REQUIRE(small.failure_sample.size() == 2);
  const auto& first = small.failure_sample.outcomes()[0];
  CHECK(first.record_id == "3");
  CHECK(first.partition_index == 3);
  CHECK(first.sequence == 2);
  CHECK(first.reason == rules::FailureReason::kOutOfRange);
  CHECK(first.observed_value == "3");
}

TEST_CASE("PartitionEvaluator: local duplicates fail every record carrying the key",
          "[engine][evaluator][unique]") {
  const auto rule_set =
      make_rule_set(R"({"rules": [{"name": "id_unique", "kind": "unique", "column": "id"}]})");
  const reference::ReferenceHandles references;
  const engine::PartitionEvaluator evaluator(rule_set, references, 10);

  const auto partial = evaluator.evaluate(partition_of(0, {1, 2, 1, 1}));
  REQUIRE(partial.has_value());
  const auto& tally = partial->rules[0];
  CHECK(tally.fail_count == 3);
  CHECK(tally.pass_count == 1);

  std::vector<std::uint64_t> sequences;
  for (const auto& outcome : tally.failure_sample.outcomes()) {
    sequences.push_back(outcome.sequence);
    CHECK(outcome.reason == rules::FailureReason::kDuplicateKey);
  }
  CHECK(sequences == std::vector<std::uint64_t>{0, 2, 3});

  data::Record one;
  one.columns["id"] = std::int64_t{1};
  data::Record two;
  two.columns["id"] = std::int64_t{2};
  const auto& duplicated = tally.key_observations.at(rules::composite_key(one, {"id"}));
  CHECK(duplicated.occurrences == 3);
  CHECK(duplicated.provisional_passes == 0);
  const auto& single = tally.key_observations.at(rules::composite_key(two, {"id"}));
  CHECK(single.occurrences == 1);
  CHECK(single.provisional_passes == 1);
  CHECK(single.provisional_sample.size() == 1);
}

TEST_CASE("PartitionEvaluator: a throwing rule becomes an error outcome",
          "[engine][evaluator][errors]") {
  rules::CustomPredicateRegistry predicates;
  predicates.register_predicate("explodes_on_two", [](const data::Record& record) -> bool {
    if (std::get<std::int64_t>(record.get("id")) == 2) {
      throw std::runtime_error("boom");
    }
    return true;
  });
  const auto rule_set = make_rule_set(R"({"rules": [
    {"name": "check", "kind": "custom", "params": {"predicate": "explodes_on_two"}},
    {"name": "id_present", "kind": "not_null", "column": "id"}
  ]})",
                                      predicates);
  const reference::ReferenceHandles references;
  const engine::PartitionEvaluator evaluator(rule_set, references, 10);

  const auto partial = evaluator.evaluate(partition_of(0, {1, 2, 3}));
  REQUIRE(partial.has_value());

  const auto& check = partial->rules[0];
  CHECK(check.pass_count == 2);
  CHECK(check.fail_count == 0);
  CHECK(check.error_count == 1);
  REQUIRE(check.error_sample.size() == 1);
  CHECK(check.error_sample.outcomes()[0].status == rules::OutcomeStatus::kError);
  CHECK(check.error_sample.outcomes()[0].message == "boom");

  // The other rule is unaffected.
  CHECK(partial->rules[1].pass_count == 3);
}

TEST_CASE("PartitionEvaluator: failure sample is bounded", "[engine][evaluator][sample]") {
  const auto rule_set = make_rule_set(
      R"({"rules": [{"name": "neg", "kind": "range", "column": "id", "params": {"max": -1}}]})");
  const reference::ReferenceHandles references;
  const engine::PartitionEvaluator evaluator(rule_set, references, 2);

  const auto partial = evaluator.evaluate(partition_of(0, {1, 2, 3, 4, 5}));
  REQUIRE(partial.has_value());
  CHECK(partial->rules[0].fail_count == 5);
  CHECK(partial->rules[0].failure_sample.size() == 2);
}

TEST_CASE("PartitionEvaluator: stop request abandons the partition", "[engine][evaluator]") {
  const auto rule_set =
      make_rule_set(R"({"rules": [{"name": "id_present", "kind": "not_null", "column": "id"}]})");
  const reference::ReferenceHandles references;
  const engine::PartitionEvaluator evaluator(rule_set, references, 10);

  std::stop_source source;
  source.request_stop();
  CHECK_FALSE(evaluator.evaluate(partition_of(0, {1, 2}), source.get_token()).has_value());
}

TEST_CASE("PartitionEvaluator: an oversized regex input is an error outcome, not a failure",
          "[engine][evaluator][errors]") {
  const auto rule_set = make_rule_set(R"({"rules": [
    {"name": "slug_format", "kind": "regex", "column": "slug", "params": {"pattern": "[a-z]+"}}
  ]})");
  const reference::ReferenceHandles references;
  const engine::PartitionEvaluator evaluator(rule_set, references, 10);

  data::Partition partition;
  partition.index = 0;
  for (const auto* slug : {"abc", "", "Bad"}) {
    data::Record record;
    record.record_id = std::to_string(partition.records.size());
    record.columns["slug"] = std::string(slug);
    partition.records.push_back(std::move(record));
  }
  partition.records[1].columns["slug"] = std::string(std::size_t{1} << 20, 'a');

  const auto partial = evaluator.evaluate(partition);
  REQUIRE(partial.has_value());
  const auto& tally = partial->rules[0];
  CHECK(tally.pass_count == 1);
  CHECK(tally.fail_count == 1);
  CHECK(tally.error_count == 1);
  REQUIRE(tally.error_sample.size() == 1);
  CHECK(tally.error_sample.outcomes()[0].record_id == "1");
}
