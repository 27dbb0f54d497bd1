#include "startup_guard.h"

#include "dqv/reference/redis/redis_config.h"

#include <set>

namespace dqv::cli {

std::string validate_validate_config(const ValidateConfig& config) {
  if (!config.rules_path.has_value()) {
    return "Error: --rules <file> is required.";
  }

  if (config.data_path.has_value() && config.sqlite_path.has_value()) {
    return "Error: --data and --sqlite are mutually exclusive.";
  }
  if (!config.data_path.has_value() && !config.sqlite_path.has_value()) {
    return "Error: a dataset is required.\n"
           "       Pass --data <file.json|file.jsonl> or --sqlite <db> --table <name>.";
  }
  if (config.sqlite_path.has_value() && !config.table.has_value()) {
    return "Error: --table <name> is required with --sqlite.";
  }
  if (config.table.has_value() && !config.sqlite_path.has_value()) {
    return "Error: --table is only valid together with --sqlite.";
  }

  if (config.redis_uri.has_value() &&
      !reference::redis::parse_redis_uri(config.redis_uri.value()).has_value()) {
    return "Error: --redis URI '" + config.redis_uri.value() +
           "' is not a valid Redis URI.\n"
           "       Accepted formats: tcp://host:port, redis://host:port[/db], tcp://host";
  }

  std::set<std::string> names;
  for (const auto& [name, path] : config.reference_data) {
    if (!names.insert(name).second) {
      return "Error: --reference-data name '" + name + "' given more than once.";
    }
  }

  return "";
}

std::string validate_show_report_config(const ShowReportConfig& config) {
  if (!config.audit_db.has_value()) {
    return "Error: --audit-db <db> is required.";
  }
  if (config.report_id.has_value() == config.dataset.has_value()) {
    return "Error: pass exactly one of --report-id <id> or --dataset <name>.";
  }
  return "";
}

}  // namespace dqv::cli
