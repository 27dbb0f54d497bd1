#include "show_report_logic.h"

#include "validate_logic.h"

#include "dqv/engine/report_json.h"
#include "dqv/engine/report_summary.h"

#include <nlohmann/json.hpp>

#include <ostream>

namespace dqv::cli {

int execute_show_report(const std::string& report_id, const storage::IReportStore& store,
                        const bool json_output, std::ostream& out, std::ostream& err) {
  const auto report = store.get(report_id);
  if (!report.has_value()) {
    err << "Report not found: " << report_id << "\n";
    return kExitError;
  }

  if (json_output) {
    out << engine::report_to_json(report.value()).dump(2) << "\n";
  } else {
    out << engine::format_summary(report.value());
  }
  return kExitPassed;
}

int execute_list_reports(const std::string& dataset_name, const storage::IReportStore& store,
                         std::ostream& out) {
  nlohmann::json listing;
  listing["dataset_name"] = dataset_name;
  listing["reports"] = nlohmann::json::array();
  for (const auto& report : store.list_by_dataset(dataset_name)) {
    nlohmann::json entry;
    entry["report_id"] = report.report_id;
    entry["run_id"] = report.run_id;
    entry["rule_set_id"] = report.rule_set_id;
    entry["created_at"] = report.created_at;
    entry["overall_passed"] = report.overall_passed;
    listing["reports"].push_back(entry);
  }

  out << listing.dump(2) << "\n";
  return kExitPassed;
}

}  // namespace dqv::cli
