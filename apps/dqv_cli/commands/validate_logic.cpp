#include "validate_logic.h"

#include "dqv/engine/report_json.h"
#include "dqv/engine/report_summary.h"

#include <fstream>
#include <ostream>

namespace dqv::cli {

int execute_validate(const ValidateRequest& request,
                     const rules::CustomPredicateRegistry& predicates,
                     storage::IAuditLog& audit_log, storage::IReportStore& report_store,
                     core::IIdGenerator& id_gen, core::IClock& clock, std::ostream& out,
                     std::ostream& err) {
  const engine::ValidationEngine engine(audit_log, id_gen, clock, request.engine_config);
  auto result = engine.validate(request.definition, predicates, request.dataset, request.resolver);

  if (!result.has_value()) {
    const auto& error = result.error();
    err << "Validation run failed (" << engine::to_string(error.kind) << ")";
    if (!error.rule_name.empty()) {
      err << " in rule '" << error.rule_name << "'";
    }
    err << ": " << error.message << "\n";
    return kExitError;
  }

  const auto& report = result.value();
  report_store.upsert(report);

  if (request.report_out.has_value()) {
    std::ofstream file(request.report_out.value());
    if (!file) {
      err << "Cannot write report to " << request.report_out.value() << "\n";
      return kExitError;
    }
    file << engine::report_to_json(report).dump(2) << "\n";
  }

  if (request.json_output) {
    out << engine::report_to_json(report).dump(2) << "\n";
  } else {
    out << engine::format_summary(report);
    out << "Report: " << report.report_id << "\n";
  }

  return report.overall_passed ? kExitPassed : kExitGateFailed;
}

}  // namespace dqv::cli
