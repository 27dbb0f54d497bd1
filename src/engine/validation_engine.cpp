#include "dqv/engine/validation_engine.h"

#include "dqv/core/version.h"
#include "dqv/engine/aggregator.h"
#include "dqv/engine/partition_evaluator.h"
#include "dqv/engine/report_builder.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <exception>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace dqv::engine {

namespace {

// Per-partition slot written by exactly one worker.
struct PartitionSlot {
  std::optional<PartialResult> result;
  // "could not be loaded: ..." or "could not be evaluated: ...".
  std::optional<std::string> load_error;
};

// Names of the ReferentialIntegrity rules reading reference_id, in rule set order.
std::vector<std::string> rules_using_reference(const rules::RuleSet& rule_set,
                                               const std::string& reference_id) {
  std::vector<std::string> names;
  for (const auto& rule : rule_set.rules()) {
    if (rule->kind() == rules::RuleKind::kReferentialIntegrity &&
        rule->spec().params.reference == reference_id) {
      names.emplace_back(rule->name());
    }
  }
  return names;
}

}  // namespace

std::size_t effective_parallelism(const std::size_t max_parallelism,
                                  const std::size_t partition_count) noexcept {
  std::size_t workers = max_parallelism;
  if (workers == 0) {
    workers = std::max(1U, std::thread::hardware_concurrency());
  }
  return std::max<std::size_t>(1, std::min(workers, partition_count));
}

ValidationEngine::ValidationEngine(storage::IAuditLog& audit_log, core::IIdGenerator& id_gen,
                                   core::IClock& clock, EngineConfig config)
    : audit_log_(audit_log), id_gen_(id_gen), clock_(clock), config_(config) {}

void ValidationEngine::emit(const std::string& run_id, const std::string& event_type,
                            const std::string& payload, std::vector<std::string> refs) const {
  audit_log_.append(
      {id_gen_.next("evt"), run_id, event_type, payload, clock_.now_iso8601(), std::move(refs)});
}

RunResult ValidationEngine::validate(const rules::RuleSetDefinition& definition,
                                     const rules::CustomPredicateRegistry& predicates,
                                     const data::IPartitionedDataset& dataset,
                                     const reference::IReferenceResolver& resolver,
                                     std::stop_token stop) const {
  auto rule_set = rules::build_rule_set(definition, predicates);
  if (!rule_set.has_value()) {
    const auto& error = rule_set.error();
    const std::string run_id = id_gen_.next("run");

    nlohmann::json payload;
    payload["rule_set_id"] = definition.rule_set_id;
    payload["rule_name"] = error.rule_name;
    payload["message"] = error.message;
    emit(run_id, "RuleSetRejected", payload.dump());

    return RunResult::err({RunErrorKind::kConfiguration, error.message, error.rule_name});
  }
  return run(rule_set.value(), dataset, resolver, std::move(stop));
}

RunResult ValidationEngine::run(const rules::RuleSet& rule_set,
                                const data::IPartitionedDataset& dataset,
                                const reference::IReferenceResolver& resolver,
                                std::stop_token stop) const {
  const std::string run_id = id_gen_.next("run");
  const std::string dataset_name(dataset.name());
  const std::size_t sample_capacity = rule_set.sample_capacity().value_or(config_.sample_capacity);
  const std::size_t partition_count = dataset.partition_count();

  {
    nlohmann::json payload;
    payload["run_id"] = run_id;
    payload["engine_version"] = core::kBuildVersion;
    payload["dataset"] = dataset_name;
    payload["rule_set_id"] = rule_set.rule_set_id();
    payload["rule_set_version"] = rule_set.version();
    payload["rule_set_fingerprint"] = rule_set.fingerprint();
    payload["rule_count"] = rule_set.size();
    payload["partition_count"] = partition_count;
    payload["sample_capacity"] = sample_capacity;
    emit(run_id, "ValidationRunStarted", payload.dump());
  }

  if (sample_capacity == 0) {
    return RunResult::err({RunErrorKind::kConfiguration, "sample_capacity must be positive", ""});
  }

  // Phase 1: resolve references once, before any partition is evaluated.
  reference::ReferenceHandles references;
  for (const auto& reference_id : rule_set.reference_ids()) {
    auto lookup = resolver.resolve(reference_id);
    const auto rule_names = rules_using_reference(rule_set, reference_id);

    nlohmann::json payload;
    payload["reference_id"] = reference_id;
    payload["rules"] = rule_names;
    if (!lookup.has_value()) {
      payload["error"] = lookup.error();
      emit(run_id, "ReferenceUnavailable", payload.dump(), {reference_id});
      return RunResult::err({RunErrorKind::kReferenceUnavailable,
                             "reference '" + reference_id + "' unavailable: " + lookup.error(),
                             rule_names.empty() ? std::string{} : rule_names.front()});
    }
    payload["key_count"] = lookup.value()->size();
    emit(run_id, "ReferenceResolved", payload.dump(), {reference_id});
    references.emplace(reference_id, std::move(lookup.value()));
  }

  // Phase 2: data-parallel evaluation. Workers claim partition indices from a shared
  // counter and write only to their claimed slot.
  const PartitionEvaluator evaluator(rule_set, references, sample_capacity);
  std::vector<PartitionSlot> slots(partition_count);
  std::atomic<std::size_t> next_partition{0};
  std::atomic<bool> load_failed{false};

  auto worker = [&]() {
    while (!stop.stop_requested() && !load_failed.load()) {
      const std::size_t index = next_partition.fetch_add(1);
      if (index >= partition_count) {
        return;
      }

      // Nothing may escape a worker thread. Load failures and whatever leaks out of the
      // evaluator (rule exceptions are already outcomes) both abort the run.
      const char* stage = "loaded";
      try {
        data::Partition partition = dataset.load_partition(index);
        partition.index = index;

        stage = "evaluated";
        auto partial = evaluator.evaluate(partition, stop);
        if (!partial.has_value()) {
          return;
        }
        slots[index].result = std::move(partial);
      } catch (const std::exception& e) {
        slots[index].load_error = std::string("could not be ") + stage + ": " + e.what();
        load_failed.store(true);
        return;
      }
    }
  };

  const std::size_t worker_count = effective_parallelism(config_.max_parallelism, partition_count);
  if (partition_count > 0) {
    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i) {
      workers.emplace_back(worker);
    }
    for (auto& t : workers) {
      t.join();
    }
  }

  if (load_failed.load()) {
    for (std::size_t i = 0; i < slots.size(); ++i) {
      if (!slots[i].load_error.has_value()) {
        continue;
      }
      nlohmann::json payload;
      payload["partition_index"] = i;
      payload["error"] = *slots[i].load_error;
      emit(run_id, "DatasetUnavailable", payload.dump());
      return RunResult::err({RunErrorKind::kDatasetUnavailable,
                             "partition " + std::to_string(i) + " of '" + dataset_name +
                                 "' " + *slots[i].load_error,
                             ""});
    }
  }

  if (stop.stop_requested()) {
    std::size_t completed = 0;
    for (const auto& slot : slots) {
      completed += slot.result.has_value() ? 1 : 0;
    }
    nlohmann::json payload;
    payload["partitions_completed"] = completed;
    payload["partition_count"] = partition_count;
    emit(run_id, "ValidationRunCancelled", payload.dump());
    return RunResult::err({RunErrorKind::kCancelled, "validation run cancelled", ""});
  }

  // Phase 3: reduce in partition order after the join.
  std::vector<PartialResult> partials;
  partials.reserve(partition_count);
  for (std::size_t i = 0; i < slots.size(); ++i) {
    auto& partial = *slots[i].result;

    std::uint64_t failures = 0;
    std::uint64_t errors = 0;
    for (const auto& tally : partial.rules) {
      failures += tally.fail_count;
      errors += tally.error_count;
    }
    nlohmann::json payload;
    payload["partition_index"] = i;
    payload["record_count"] = partial.record_count;
    payload["local_fail_count"] = failures;
    payload["error_count"] = errors;
    emit(run_id, "PartitionEvaluated", payload.dump());

    partials.push_back(std::move(partial));
  }

  auto metrics = aggregate(rule_set, sample_capacity, partials);

  const ReportHeader header{id_gen_.next("report"), run_id, dataset_name, sample_capacity,
                            clock_.now_iso8601()};
  Report report = build_report(header, rule_set, std::move(metrics));

  nlohmann::json rule_errors = nlohmann::json::object();
  for (const auto& rule : report.rules) {
    if (rule.error_count > 0) {
      rule_errors[rule.name] = rule.error_count;
    }
  }
  if (!rule_errors.empty()) {
    nlohmann::json payload;
    payload["error_counts"] = rule_errors;
    emit(run_id, "RuleEvaluationErrors", payload.dump(), {report.report_id});
  }

  nlohmann::json failed_rules = nlohmann::json::array();
  for (const auto& rule : report.rules) {
    if (!rule.passed) {
      failed_rules.push_back(rule.name);
    }
  }
  nlohmann::json payload;
  payload["report_id"] = report.report_id;
  payload["overall_passed"] = report.overall_passed;
  payload["record_count"] = report.record_count;
  payload["partition_count"] = report.partition_count;
  payload["failed_rules"] = failed_rules;
  emit(run_id, "ValidationRunCompleted", payload.dump(), {report.report_id});

  return RunResult::ok(std::move(report));
}

}  // namespace dqv::engine
