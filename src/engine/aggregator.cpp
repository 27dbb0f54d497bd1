#include "dqv/engine/aggregator.h"

#include <stdexcept>
#include <utility>

namespace dqv::engine {

PartialResult empty_partial_result(const rules::RuleSet& rule_set,
                                   const std::size_t sample_capacity) {
  PartialResult result;
  result.rules.reserve(rule_set.size());
  for (const auto& rule : rule_set.rules()) {
    RuleTally tally;
    tally.rule_name = std::string(rule->name());
    tally.failure_sample = BoundedSample(sample_capacity);
    tally.error_sample = BoundedSample(sample_capacity);
    result.rules.push_back(std::move(tally));
  }
  return result;
}

PartialResult merge(PartialResult a, const PartialResult& b) {
  if (a.rules.size() != b.rules.size()) {
    throw std::invalid_argument("cannot merge partial results of different rule sets");
  }

  a.partition_count += b.partition_count;
  a.record_count += b.record_count;

  for (std::size_t i = 0; i < a.rules.size(); ++i) {
    auto& into = a.rules[i];
    const auto& from = b.rules[i];
    if (into.rule_name != from.rule_name) {
      throw std::invalid_argument("rule order mismatch: '" + into.rule_name + "' vs '" +
                                  from.rule_name + "'");
    }

    into.pass_count += from.pass_count;
    into.fail_count += from.fail_count;
    into.error_count += from.error_count;
    into.failure_sample.merge(from.failure_sample);
    into.error_sample.merge(from.error_sample);

    for (const auto& [key, observation] : from.key_observations) {
      auto [it, inserted] = into.key_observations.try_emplace(key, observation);
      if (inserted) {
        continue;
      }
      auto& existing = it->second;
      existing.occurrences += observation.occurrences;
      existing.provisional_passes += observation.provisional_passes;
      existing.provisional_sample.merge(observation.provisional_sample);
    }
  }

  return a;
}

AggregatedMetrics finalize(PartialResult merged) {
  AggregatedMetrics metrics;
  metrics.partition_count = merged.partition_count;
  metrics.record_count = merged.record_count;
  metrics.rules.reserve(merged.rules.size());

  for (auto& tally : merged.rules) {
    for (auto& [key, observation] : tally.key_observations) {
      if (observation.occurrences < 2 || observation.provisional_passes == 0) {
        continue;
      }
      tally.pass_count -= observation.provisional_passes;
      tally.fail_count += observation.provisional_passes;
      tally.failure_sample.merge(observation.provisional_sample);
    }

    RuleMetrics rule;
    rule.rule_name = std::move(tally.rule_name);
    rule.pass_count = tally.pass_count;
    rule.fail_count = tally.fail_count;
    rule.error_count = tally.error_count;
    rule.failure_sample = tally.failure_sample.outcomes();
    rule.error_sample = tally.error_sample.outcomes();
    metrics.rules.push_back(std::move(rule));
  }

  return metrics;
}

AggregatedMetrics aggregate(const rules::RuleSet& rule_set, const std::size_t sample_capacity,
                            const std::vector<PartialResult>& partials) {
  PartialResult merged = empty_partial_result(rule_set, sample_capacity);
  for (const auto& partial : partials) {
    merged = merge(std::move(merged), partial);
  }
  return finalize(std::move(merged));
}

}  // namespace dqv::engine
