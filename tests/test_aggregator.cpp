#include "dqv/engine/aggregator.h"
#include "dqv/engine/partition_evaluator.h"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <stdexcept>

using namespace dqv;

namespace {

rules::RuleSet make_rule_set(const std::string& json) {
  auto definition = rules::rule_set_definition_from_json(nlohmann::json::parse(json));
  REQUIRE(definition.has_value());
  auto rule_set = rules::build_rule_set(definition.value());
  REQUIRE(rule_set.has_value());
  return std::move(rule_set.value());
}

data::Partition partition_of(std::size_t index, const std::vector<std::int64_t>& ids) {
  data::Partition partition;
  partition.index = index;
  for (const auto id : ids) {
    data::Record record;
    record.record_id = std::to_string(index) + "/" + std::to_string(id);
    record.columns["id"] = id;
    partition.records.push_back(std::move(record));
  }
  return partition;
}

std::vector<std::string> sample_ids(const std::vector<rules::Outcome>& sample) {
  std::vector<std::string> ids;
  for (const auto& outcome : sample) {
    ids.push_back(outcome.record_id);
  }
  return ids;
}

const char* const kRules = R"({"rules": [
  {"name": "id_unique", "kind": "unique", "column": "id"},
  {"name": "id_small", "kind": "range", "column": "id", "params": {"max": 5}}
]})";

}  // namespace

TEST_CASE("aggregate: duplicate key across partitions fails both records",
          "[engine][aggregator][unique]") {
  const auto rule_set = make_rule_set(kRules);
  const reference::ReferenceHandles references;
  const engine::PartitionEvaluator evaluator(rule_set, references, 10);

  std::vector<engine::PartialResult> partials;
  partials.push_back(*evaluator.evaluate(partition_of(0, {1, 5})));
  partials.push_back(*evaluator.evaluate(partition_of(1, {5, 7})));

  const auto metrics = engine::aggregate(rule_set, 10, partials);
  CHECK(metrics.partition_count == 2);
  CHECK(metrics.record_count == 4);
  REQUIRE(metrics.rules.size() == 2);

  const auto& unique = metrics.rules[0];
  CHECK(unique.rule_name == "id_unique");
  CHECK(unique.fail_count == 2);
  CHECK(unique.pass_count == 2);
  CHECK(sample_ids(unique.failure_sample) == std::vector<std::string>{"0/5", "1/5"});

  const auto& small = metrics.rules[1];
  CHECK(small.fail_count == 1);
  CHECK(small.pass_count == 3);
}

TEST_CASE("aggregate: local and cross-partition duplicates are counted once each",
          "[engine][aggregator][unique]") {
  const auto rule_set = make_rule_set(kRules);
  const reference::ReferenceHandles references;
  const engine::PartitionEvaluator evaluator(rule_set, references, 10);

  // id 3 appears twice in partition 0 and once in partition 2.
  std::vector<engine::PartialResult> partials;
  partials.push_back(*evaluator.evaluate(partition_of(0, {3, 3})));
  partials.push_back(*evaluator.evaluate(partition_of(1, {4})));
  partials.push_back(*evaluator.evaluate(partition_of(2, {3})));

  const auto metrics = engine::aggregate(rule_set, 10, partials);
  const auto& unique = metrics.rules[0];
  CHECK(unique.fail_count == 3);
  CHECK(unique.pass_count == 1);
  CHECK(unique.pass_count + unique.fail_count + unique.error_count == metrics.record_count);
}

TEST_CASE("merge: order of partials does not change the result", "[engine][aggregator]") {
  const auto rule_set = make_rule_set(kRules);
  const reference::ReferenceHandles references;
  const engine::PartitionEvaluator evaluator(rule_set, references, 2);

  const auto p0 = *evaluator.evaluate(partition_of(0, {9, 1, 8}));
  const auto p1 = *evaluator.evaluate(partition_of(1, {1, 6}));
  const auto p2 = *evaluator.evaluate(partition_of(2, {7, 9}));

  const auto identity = engine::empty_partial_result(rule_set, 2);
  const auto forward =
      engine::finalize(engine::merge(engine::merge(engine::merge(identity, p0), p1), p2));
  const auto backward =
      engine::finalize(engine::merge(engine::merge(engine::merge(identity, p2), p0), p1));
  const auto grouped = engine::finalize(engine::merge(p0, engine::merge(p1, p2)));

  for (const auto* other : {&backward, &grouped}) {
    REQUIRE(other->rules.size() == forward.rules.size());
    CHECK(other->record_count == forward.record_count);
    for (std::size_t i = 0; i < forward.rules.size(); ++i) {
      CHECK(other->rules[i].pass_count == forward.rules[i].pass_count);
      CHECK(other->rules[i].fail_count == forward.rules[i].fail_count);
      CHECK(sample_ids(other->rules[i].failure_sample) ==
            sample_ids(forward.rules[i].failure_sample));
    }
  }

  // Unique: 9 and 1 duplicated across partitions; sample keeps the earliest two.
  CHECK(forward.rules[0].fail_count == 4);
  CHECK(sample_ids(forward.rules[0].failure_sample) == std::vector<std::string>{"0/9", "0/1"});
}

TEST_CASE("aggregate: no partitions gives zero counts", "[engine][aggregator]") {
  const auto rule_set = make_rule_set(kRules);
  const auto metrics = engine::aggregate(rule_set, 10, {});
  CHECK(metrics.partition_count == 0);
  CHECK(metrics.record_count == 0);
  REQUIRE(metrics.rules.size() == 2);
  CHECK(metrics.rules[0].pass_count == 0);
  CHECK(metrics.rules[0].fail_count == 0);
}

TEST_CASE("merge: mismatched rule tallies are rejected", "[engine][aggregator]") {
  const auto rule_set = make_rule_set(kRules);
  const auto other = make_rule_set(R"({"rules": [{"name": "x", "kind": "not_null", "column": "id"}]})");
  CHECK_THROWS_AS(engine::merge(engine::empty_partial_result(rule_set, 1),
                                engine::empty_partial_result(other, 1)),
                  std::invalid_argument);
}
