#pragma once

#include "dqv/core/clock.h"
#include "dqv/core/id_generator.h"
#include "dqv/data/partitioned_dataset.h"
#include "dqv/engine/validation_engine.h"
#include "dqv/reference/reference_resolver.h"
#include "dqv/rules/custom_predicate_registry.h"
#include "dqv/rules/rule_spec.h"
#include "dqv/storage/audit_log.h"
#include "dqv/storage/report_store.h"

#include <iosfwd>
#include <optional>
#include <string>

namespace dqv::cli {

// Process exit codes of dqv_cli.
constexpr int kExitPassed = 0;
constexpr int kExitError = 1;       // usage, configuration or run error
constexpr int kExitGateFailed = 2;  // run completed, overall_passed == false

struct ValidateRequest {
  const rules::RuleSetDefinition& definition;       // NOLINT(readability-identifier-naming)
  const data::IPartitionedDataset& dataset;         // NOLINT(readability-identifier-naming)
  const reference::IReferenceResolver& resolver;    // NOLINT(readability-identifier-naming)
  engine::EngineConfig engine_config;               // NOLINT(readability-identifier-naming)
  bool json_output{false};                          // NOLINT(readability-identifier-naming)
  std::optional<std::string> report_out;            // NOLINT(readability-identifier-naming)
};

// execute_validate runs the engine, stores the report, and prints it (summary table
// or JSON) to out. Run errors go to err.
// Only interface types: concrete datasets, resolvers and stores are chosen by the caller.
// Returns kExitPassed, kExitGateFailed or kExitError.
int execute_validate(const ValidateRequest& request,
                     const rules::CustomPredicateRegistry& predicates,
                     storage::IAuditLog& audit_log, storage::IReportStore& report_store,
                     core::IIdGenerator& id_gen, core::IClock& clock, std::ostream& out,
                     std::ostream& err);

}  // namespace dqv::cli
