#include "show_report.h"

#include "dqv/storage/sqlite/sqlite_db.h"
#include "dqv/storage/sqlite/sqlite_report_store.h"

#include "cli_config.h"
#include "startup_guard.h"
#include "show_report_logic.h"
#include "validate_logic.h"

#include <iostream>
#include <string>

int cmd_show_report(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto parsed = dqv::cli::parse_show_report_args(argc, argv);
  if (parsed.help_requested) {
    std::cerr << "Usage: dqv_cli show-report --audit-db <db> (--report-id <id> | --dataset "
                 "<name>) [--json]\n\n"
              << dqv::apps::format_options(dqv::cli::show_report_option_registry());
    return dqv::cli::kExitPassed;
  }
  if (!parsed.errors.empty()) {
    for (const auto& error : parsed.errors) {
      std::cerr << error << "\n";
    }
    return dqv::cli::kExitError;
  }

  const auto& config = parsed.config;
  const std::string guard_error = dqv::cli::validate_show_report_config(config);
  if (!guard_error.empty()) {
    std::cerr << guard_error << "\n";
    return dqv::cli::kExitError;
  }

  auto db_result = dqv::storage::sqlite::SqliteDb::open(config.audit_db.value());
  if (!db_result.has_value()) {
    std::cerr << "Failed to open database: " << db_result.error() << "\n";
    return dqv::cli::kExitError;
  }
  auto db = db_result.value();
  auto schema_result = db->ensure_schema_v2();
  if (!schema_result.has_value()) {
    std::cerr << "Failed to initialize schema: " << schema_result.error() << "\n";
    return dqv::cli::kExitError;
  }

  dqv::storage::sqlite::SqliteReportStore store(db);
  if (config.report_id.has_value()) {
    return dqv::cli::execute_show_report(config.report_id.value(), store, config.json_output,
                                         std::cout, std::cerr);
  }
  return dqv::cli::execute_list_reports(config.dataset.value(), store, std::cout);
}
