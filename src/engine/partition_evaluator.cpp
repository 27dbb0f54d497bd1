#include "dqv/engine/partition_evaluator.h"

#include <exception>
#include <string>
#include <utility>

namespace dqv::engine {

namespace {

struct LocalKey {
  std::uint64_t count{0};
  rules::Outcome first;
};

rules::Outcome make_outcome(const rules::ValidationRule& rule, const data::Record& record,
                            const std::size_t partition_index, const std::uint64_t sequence) {
  rules::Outcome outcome;
  outcome.rule_name = std::string(rule.name());
  outcome.record_id = record.record_id;
  outcome.partition_index = partition_index;
  outcome.sequence = sequence;
  return outcome;
}

void record_failure(RuleTally& tally, rules::Outcome outcome, const rules::FailureReason reason,
                    std::string observed) {
  outcome.status = rules::OutcomeStatus::kFailed;
  outcome.reason = reason;
  outcome.observed_value = std::move(observed);
  ++tally.fail_count;
  tally.failure_sample.offer(std::move(outcome));
}

void record_error(RuleTally& tally, rules::Outcome outcome, std::string message) {
  outcome.status = rules::OutcomeStatus::kError;
  outcome.reason = rules::FailureReason::kEvaluationError;
  outcome.message = std::move(message);
  ++tally.error_count;
  tally.error_sample.offer(std::move(outcome));
}

}  // namespace

PartitionEvaluator::PartitionEvaluator(const rules::RuleSet& rule_set,
                                       const reference::ReferenceHandles& references,
                                       const std::size_t sample_capacity)
    : rule_set_(rule_set), references_(references), sample_capacity_(sample_capacity) {}

std::optional<PartialResult> PartitionEvaluator::evaluate(const data::Partition& partition,
                                                          std::stop_token stop) const {
  const rules::RuleContext context{references_};

  PartialResult result;
  result.partition_count = 1;
  result.record_count = partition.records.size();
  result.rules.reserve(rule_set_.size());

  for (const auto& rule : rule_set_.rules()) {
    RuleTally tally;
    tally.rule_name = std::string(rule->name());
    tally.failure_sample = BoundedSample(sample_capacity_);
    tally.error_sample = BoundedSample(sample_capacity_);

    std::unordered_map<std::string, LocalKey> local_keys;

    for (std::size_t i = 0; i < partition.records.size(); ++i) {
      if (stop.stop_requested()) {
        return std::nullopt;
      }

      const auto& record = partition.records[i];
      auto outcome = make_outcome(*rule, record, partition.index, i);

      rules::Verdict verdict;
      try {
        verdict = rule->evaluate(record, context);
      } catch (const std::exception& e) {
        record_error(tally, std::move(outcome), e.what());
        continue;
      } catch (...) {
        record_error(tally, std::move(outcome), "non-standard exception");
        continue;
      }

      if (!verdict.passed) {
        record_failure(tally, std::move(outcome), verdict.reason,
                       std::move(verdict.observed_value));
        continue;
      }

      if (!verdict.key.has_value()) {
        ++tally.pass_count;
        continue;
      }

      // Keyed verdict: the second sighting fails both records, later ones fail alone.
      auto& local = local_keys[*verdict.key];
      ++local.count;
      if (local.count == 1) {
        outcome.observed_value = std::move(verdict.observed_value);
        local.first = std::move(outcome);
        continue;
      }
      if (local.count == 2) {
        record_failure(tally, local.first, rules::FailureReason::kDuplicateKey,
                       local.first.observed_value);
      }
      record_failure(tally, std::move(outcome), rules::FailureReason::kDuplicateKey,
                     std::move(verdict.observed_value));
    }

    for (auto& [key, local] : local_keys) {
      KeyObservation observation;
      observation.occurrences = local.count;
      observation.provisional_sample = BoundedSample(sample_capacity_);
      if (local.count == 1) {
        ++tally.pass_count;
        observation.provisional_passes = 1;
        local.first.status = rules::OutcomeStatus::kFailed;
        local.first.reason = rules::FailureReason::kDuplicateKey;
        observation.provisional_sample.offer(std::move(local.first));
      }
      tally.key_observations.emplace(key, std::move(observation));
    }

    result.rules.push_back(std::move(tally));
  }

  return result;
}

}  // namespace dqv::engine
