#pragma once

#include "dqv/engine/report.h"

#include <optional>
#include <string>
#include <vector>

namespace dqv::storage {

// IReportStore persists finished validation reports.
// upsert overwrites by report_id; reports are never edited after a run, so an
// overwrite only happens when the same report is saved twice.
//
// list_by_dataset() returns reports ordered by report_id ascending.
class IReportStore {
 public:
  virtual ~IReportStore() = default;

  virtual void upsert(const engine::Report& report) = 0;

  // Returns nullopt if not found.
  [[nodiscard]] virtual std::optional<engine::Report> get(const std::string& report_id) const = 0;

  [[nodiscard]] virtual std::vector<engine::Report> list_by_dataset(
      const std::string& dataset_name) const = 0;

 protected:
  IReportStore() = default;
  IReportStore(const IReportStore&) = default;
  IReportStore& operator=(const IReportStore&) = default;
  IReportStore(IReportStore&&) = default;
  IReportStore& operator=(IReportStore&&) = default;
};

// In-memory implementation of IReportStore. Ephemeral; intended for tests and
// runs without --audit-db.
class InMemoryReportStore final : public IReportStore {
 public:
  void upsert(const engine::Report& report) override;

  [[nodiscard]] std::optional<engine::Report> get(const std::string& report_id) const override;

  [[nodiscard]] std::vector<engine::Report> list_by_dataset(
      const std::string& dataset_name) const override;

 private:
  std::vector<engine::Report> reports_;
};

}  // namespace dqv::storage
