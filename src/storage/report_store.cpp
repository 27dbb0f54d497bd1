#include "dqv/storage/report_store.h"

#include <algorithm>

namespace dqv::storage {

void InMemoryReportStore::upsert(const engine::Report& report) {
  for (auto& existing : reports_) {
    if (existing.report_id == report.report_id) {
      existing = report;
      return;
    }
  }
  reports_.push_back(report);
}

std::optional<engine::Report> InMemoryReportStore::get(const std::string& report_id) const {
  for (const auto& report : reports_) {
    if (report.report_id == report_id) {
      return report;
    }
  }
  return std::nullopt;
}

std::vector<engine::Report> InMemoryReportStore::list_by_dataset(
    const std::string& dataset_name) const {
  std::vector<engine::Report> result;
  for (const auto& report : reports_) {
    if (report.dataset_name == dataset_name) {
      result.push_back(report);
    }
  }
  std::sort(result.begin(), result.end(),
            [](const engine::Report& a, const engine::Report& b) {
              return a.report_id < b.report_id;
            });
  return result;
}

}  // namespace dqv::storage
