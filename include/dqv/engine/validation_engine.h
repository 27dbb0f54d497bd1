#pragma once

#include "dqv/core/clock.h"
#include "dqv/core/id_generator.h"
#include "dqv/core/result.h"
#include "dqv/data/partitioned_dataset.h"
#include "dqv/engine/report.h"
#include "dqv/engine/run_error.h"
#include "dqv/reference/reference_resolver.h"
#include "dqv/rules/custom_predicate_registry.h"
#include "dqv/rules/rule_set.h"
#include "dqv/storage/audit_log.h"

#include <cstddef>
#include <stop_token>
#include <string>
#include <vector>

namespace dqv::engine {

// sample_capacity bounds every per-rule failure and error sample; a rule set's own
// sample_capacity takes precedence. max_parallelism == 0 uses the hardware concurrency.
struct EngineConfig {
  std::size_t sample_capacity{100};  // NOLINT(readability-identifier-naming)
  std::size_t max_parallelism{0};    // NOLINT(readability-identifier-naming)
};

using RunResult = core::Result<Report, RunError>;

// ValidationEngine runs a rule set over a partitioned dataset and produces one Report.
//
// Run phases:
//   1. resolve every reference identifier once (failure: kReferenceUnavailable)
//   2. evaluate partitions on a bounded pool of worker threads, one PartialResult slot
//      per partition
//   3. after all workers join, aggregate the slots in partition order and build the Report
//
// A run either fails with a RunError or returns a complete Report; no partial Report
// is ever exposed. Audit events are appended with the run id as trace id:
// ValidationRunStarted, RuleSetRejected, ReferenceResolved, ReferenceUnavailable,
// DatasetUnavailable, PartitionEvaluated, RuleEvaluationErrors, ValidationRunCancelled,
// ValidationRunCompleted.
class ValidationEngine {
 public:
  ValidationEngine(storage::IAuditLog& audit_log, core::IIdGenerator& id_gen, core::IClock& clock,
                   EngineConfig config = {});

  // Builds the rule set first; a ConfigurationError fails the run before any data is read.
  [[nodiscard]] RunResult validate(const rules::RuleSetDefinition& definition,
                                   const rules::CustomPredicateRegistry& predicates,
                                   const data::IPartitionedDataset& dataset,
                                   const reference::IReferenceResolver& resolver,
                                   std::stop_token stop = {}) const;

  [[nodiscard]] RunResult run(const rules::RuleSet& rule_set,
                              const data::IPartitionedDataset& dataset,
                              const reference::IReferenceResolver& resolver,
                              std::stop_token stop = {}) const;

  [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

 private:
  void emit(const std::string& run_id, const std::string& event_type, const std::string& payload,
            std::vector<std::string> refs = {}) const;

  storage::IAuditLog& audit_log_;
  core::IIdGenerator& id_gen_;
  core::IClock& clock_;
  EngineConfig config_;
};

// Worker count for a run: never more than the partitions, at least one.
[[nodiscard]] std::size_t effective_parallelism(std::size_t max_parallelism,
                                                std::size_t partition_count) noexcept;

}  // namespace dqv::engine
