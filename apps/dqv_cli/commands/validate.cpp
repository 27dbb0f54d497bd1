#include "validate.h"

#include "dqv/core/clock.h"
#include "dqv/core/id_generator.h"
#include "dqv/data/json_dataset.h"
#include "dqv/data/sqlite/sqlite_dataset.h"
#include "dqv/reference/redis/redis_reference_resolver.h"
#include "dqv/reference/reference_resolver.h"
#include "dqv/reference/sqlite/sqlite_reference_resolver.h"
#include "dqv/storage/audit_log.h"
#include "dqv/storage/report_store.h"
#include "dqv/storage/sqlite/sqlite_audit_log.h"
#include "dqv/storage/sqlite/sqlite_db.h"
#include "dqv/storage/sqlite/sqlite_report_store.h"

#include "cli_config.h"
#include "startup_guard.h"
#include "validate_logic.h"

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

using dqv::storage::sqlite::SqliteDb;

void print_usage() {
  std::cerr << "Usage: dqv_cli validate --rules <file> (--data <file> | --sqlite <db> --table "
               "<name>) [options]\n\n"
            << dqv::apps::format_options(dqv::cli::validate_option_registry());
}

// Open a SQLite database, or print the error and return nullptr.
std::shared_ptr<SqliteDb> open_db(const std::string& path) {
  auto db_result = SqliteDb::open(path);
  if (!db_result.has_value()) {
    std::cerr << "Failed to open database " << path << ": " << db_result.error() << "\n";
    return nullptr;
  }
  return db_result.value();
}

std::shared_ptr<const dqv::data::IPartitionedDataset> open_dataset(
    const dqv::cli::ValidateConfig& config, std::shared_ptr<SqliteDb>& dataset_db) {
  if (config.data_path.has_value()) {
    dqv::data::JsonLoadOptions options;
    options.id_column = config.id_column;
    options.partition_count = config.partitions;
    auto loaded = dqv::data::load_json_dataset(config.data_path.value(), options);
    if (!loaded.has_value()) {
      std::cerr << "Failed to load dataset: " << loaded.error() << "\n";
      return nullptr;
    }
    return loaded.value();
  }

  dataset_db = open_db(config.sqlite_path.value());
  if (!dataset_db) {
    return nullptr;
  }
  auto opened = dqv::data::sqlite::SqliteDataset::open(dataset_db, config.table.value(),
                                                       config.partitions, config.id_column);
  if (!opened.has_value()) {
    std::cerr << "Failed to open dataset: " << opened.error() << "\n";
    return nullptr;
  }
  return opened.value();
}

// Reference sources, first match wins:
//   1. --reference-data name=path datasets and the validated dataset itself
//   2. --reference-db, else the --sqlite database of the dataset
//   3. --redis
std::shared_ptr<const dqv::reference::IReferenceResolver> build_resolver(
    const dqv::cli::ValidateConfig& config,
    const std::shared_ptr<const dqv::data::IPartitionedDataset>& dataset,
    const std::shared_ptr<SqliteDb>& dataset_db) {
  std::vector<std::shared_ptr<const dqv::reference::IReferenceResolver>> chain;

  auto datasets = std::make_shared<dqv::reference::DatasetReferenceResolver>();
  datasets->add_dataset(std::string(dataset->name()), dataset);
  for (const auto& [name, path] : config.reference_data) {
    auto loaded = dqv::data::load_json_dataset(path, dqv::data::JsonLoadOptions{});
    if (!loaded.has_value()) {
      std::cerr << "Failed to load reference dataset '" << name << "': " << loaded.error()
                << "\n";
      return nullptr;
    }
    datasets->add_dataset(name, loaded.value());
  }
  chain.push_back(datasets);

  std::shared_ptr<SqliteDb> reference_db = dataset_db;
  if (config.reference_db.has_value()) {
    reference_db = open_db(config.reference_db.value());
    if (!reference_db) {
      return nullptr;
    }
  }
  if (reference_db) {
    chain.push_back(std::make_shared<dqv::reference::sqlite::SqliteReferenceResolver>(reference_db));
  }

  if (config.redis_uri.has_value()) {
    try {
      chain.push_back(
          std::make_shared<dqv::reference::redis::RedisReferenceResolver>(config.redis_uri.value()));
    } catch (const std::runtime_error& e) {
      std::cerr << e.what() << "\n";
      return nullptr;
    }
  }

  return std::make_shared<dqv::reference::ChainedReferenceResolver>(std::move(chain));
}

}  // namespace

int cmd_validate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto parsed = dqv::cli::parse_validate_args(argc, argv);
  if (parsed.help_requested) {
    print_usage();
    return dqv::cli::kExitPassed;
  }
  if (!parsed.errors.empty()) {
    for (const auto& error : parsed.errors) {
      std::cerr << error << "\n";
    }
    print_usage();
    return dqv::cli::kExitError;
  }

  const auto& config = parsed.config;
  const std::string guard_error = dqv::cli::validate_validate_config(config);
  if (!guard_error.empty()) {
    std::cerr << guard_error << "\n";
    return dqv::cli::kExitError;
  }

  auto definition = dqv::rules::load_rule_set_definition(config.rules_path.value());
  if (!definition.has_value()) {
    const auto& error = definition.error();
    std::cerr << "Invalid rule set";
    if (!error.rule_name.empty()) {
      std::cerr << " (rule '" << error.rule_name << "')";
    }
    std::cerr << ": " << error.message << "\n";
    return dqv::cli::kExitError;
  }

  std::shared_ptr<SqliteDb> dataset_db;
  const auto dataset = open_dataset(config, dataset_db);
  if (!dataset) {
    return dqv::cli::kExitError;
  }

  const auto resolver = build_resolver(config, dataset, dataset_db);
  if (!resolver) {
    return dqv::cli::kExitError;
  }

  dqv::engine::EngineConfig engine_config;
  engine_config.max_parallelism = config.threads;
  if (config.sample_capacity.has_value()) {
    engine_config.sample_capacity = config.sample_capacity.value();
  }

  const dqv::cli::ValidateRequest request{definition.value(), *dataset,        *resolver,
                                          engine_config,      config.json_output, config.report_out};
  const dqv::rules::CustomPredicateRegistry predicates;
  dqv::core::SystemIdGenerator id_gen;
  dqv::core::SystemClock clock;

  try {
    if (config.audit_db.has_value()) {
      auto db = open_db(config.audit_db.value());
      if (!db) {
        return dqv::cli::kExitError;
      }
      auto schema_result = db->ensure_schema_v2();
      if (!schema_result.has_value()) {
        std::cerr << "Failed to initialize schema: " << schema_result.error() << "\n";
        return dqv::cli::kExitError;
      }
      dqv::storage::sqlite::SqliteAuditLog audit_log(db);
      dqv::storage::sqlite::SqliteReportStore report_store(db);
      return dqv::cli::execute_validate(request, predicates, audit_log, report_store, id_gen, clock,
                                        std::cout, std::cerr);
    }

    dqv::storage::InMemoryAuditLog audit_log;
    dqv::storage::InMemoryReportStore report_store;
    return dqv::cli::execute_validate(request, predicates, audit_log, report_store, id_gen, clock,
                                      std::cout, std::cerr);
  } catch (const std::runtime_error& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return dqv::cli::kExitError;
  }
}
