#pragma once

#include "dqv/storage/report_store.h"

#include <iosfwd>
#include <string>

namespace dqv::cli {

// execute_show_report: print one stored report (summary or JSON).
// execute_list_reports: print report_id, created_at and verdict of every stored report
// of a dataset, in report_id order.
// Both take only interface types; no concrete storage headers in this TU.
int execute_show_report(const std::string& report_id, const storage::IReportStore& store,
                        bool json_output, std::ostream& out, std::ostream& err);
int execute_list_reports(const std::string& dataset_name, const storage::IReportStore& store,
                         std::ostream& out);

}  // namespace dqv::cli
