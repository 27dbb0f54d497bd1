#include <catch2/catch_test_macros.hpp>

#include "cli_config.h"
#include "startup_guard.h"

using namespace dqv::cli;

namespace {

ValidateConfig json_config() {
  ValidateConfig config;
  config.rules_path = "rules.json";
  config.data_path = "orders.json";
  return config;
}

}  // namespace

// ── validate: required inputs ───────────────────────────────────────────────

TEST_CASE("validate_validate_config: --data with --rules is valid", "[startup][config]") {
  CHECK(validate_validate_config(json_config()).empty());
}

TEST_CASE("validate_validate_config: missing --rules returns error", "[startup][config]") {
  auto config = json_config();
  config.rules_path = std::nullopt;
  CHECK_FALSE(validate_validate_config(config).empty());
}

TEST_CASE("validate_validate_config: no dataset source returns error", "[startup][config]") {
  auto config = json_config();
  config.data_path = std::nullopt;
  CHECK_FALSE(validate_validate_config(config).empty());
}

// ── validate: dataset source combinations ───────────────────────────────────

TEST_CASE("validate_validate_config: --sqlite with --table is valid", "[startup][config]") {
  ValidateConfig config;
  config.rules_path = "rules.json";
  config.sqlite_path = "warehouse.db";
  config.table = "orders";
  CHECK(validate_validate_config(config).empty());
}

TEST_CASE("validate_validate_config: --data and --sqlite together returns error",
          "[startup][config]") {
  auto config = json_config();
  config.sqlite_path = "warehouse.db";
  config.table = "orders";
  CHECK(validate_validate_config(config).find("mutually exclusive") != std::string::npos);
}

TEST_CASE("validate_validate_config: --sqlite without --table returns error",
          "[startup][config]") {
  ValidateConfig config;
  config.rules_path = "rules.json";
  config.sqlite_path = "warehouse.db";
  CHECK_FALSE(validate_validate_config(config).empty());
}

TEST_CASE("validate_validate_config: --table without --sqlite returns error",
          "[startup][config]") {
  auto config = json_config();
  config.table = "orders";
  CHECK_FALSE(validate_validate_config(config).empty());
}

// ── validate: reference sources ─────────────────────────────────────────────

TEST_CASE("validate_validate_config: invalid redis URI format returns error",
          "[startup][config]") {
  auto config = json_config();
  config.redis_uri = "not-a-valid-uri";
  CHECK_FALSE(validate_validate_config(config).empty());

  config.redis_uri = "redis://127.0.0.1:6379/2";
  CHECK(validate_validate_config(config).empty());
}

TEST_CASE("validate_validate_config: duplicate --reference-data name returns error",
          "[startup][config]") {
  auto config = json_config();
  config.reference_data = {{"customers", "a.json"}, {"products", "b.json"}};
  CHECK(validate_validate_config(config).empty());

  config.reference_data.emplace_back("customers", "c.json");
  CHECK(validate_validate_config(config).find("customers") != std::string::npos);
}

// ── show-report ─────────────────────────────────────────────────────────────

TEST_CASE("validate_show_report_config: exactly one selector", "[startup][config]") {
  ShowReportConfig config;
  CHECK_FALSE(validate_show_report_config(config).empty());

  config.audit_db = "audit.db";
  CHECK_FALSE(validate_show_report_config(config).empty());

  config.report_id = "report-1";
  CHECK(validate_show_report_config(config).empty());

  config.dataset = "orders";
  CHECK_FALSE(validate_show_report_config(config).empty());
}
