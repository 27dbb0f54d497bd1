#include <catch2/catch_test_macros.hpp>

#include "cli_config.h"

#include <string>
#include <vector>

using namespace dqv::cli;

namespace {

// Owns argv storage for parse_*_args.
struct Argv {
  explicit Argv(std::vector<std::string> args) : storage(std::move(args)) {
    for (auto& arg : storage) {
      pointers.push_back(arg.data());
    }
  }
  [[nodiscard]] int argc() const { return static_cast<int>(pointers.size()); }
  char** argv() { return pointers.data(); }

  std::vector<std::string> storage;
  std::vector<char*> pointers;
};

}  // namespace

TEST_CASE("parse_validate_args: flags populate the config", "[cli][config]") {
  Argv args({"dqv_cli", "validate", "--rules", "rules.json", "--data", "orders.jsonl",
             "--partitions", "8", "--threads", "0", "--sample-capacity", "25",
             "--reference-data", "customers=customers.json", "--redis", "tcp://localhost",
             "--json"});
  const auto parsed = parse_validate_args(args.argc(), args.argv());

  REQUIRE(parsed.errors.empty());
  CHECK_FALSE(parsed.help_requested);
  const auto& config = parsed.config;
  CHECK(config.rules_path == "rules.json");
  CHECK(config.data_path == "orders.jsonl");
  CHECK(config.partitions == 8);
  CHECK(config.threads == 0);
  CHECK(config.sample_capacity == std::size_t{25});
  REQUIRE(config.reference_data.size() == 1);
  CHECK(config.reference_data[0].first == "customers");
  CHECK(config.reference_data[0].second == "customers.json");
  CHECK(config.redis_uri == "tcp://localhost");
  CHECK(config.json_output);
}

TEST_CASE("parse_validate_args: defaults", "[cli][config]") {
  Argv args({"dqv_cli", "validate"});
  const auto parsed = parse_validate_args(args.argc(), args.argv());
  CHECK(parsed.errors.empty());
  CHECK(parsed.config.partitions == 4);
  CHECK(parsed.config.threads == 0);
  CHECK_FALSE(parsed.config.sample_capacity.has_value());
  CHECK_FALSE(parsed.config.json_output);
}

TEST_CASE("parse_validate_args: every problem is reported", "[cli][config]") {
  Argv args({"dqv_cli", "validate", "--partitions", "0", "--bogus", "stray",
             "--reference-data", "no-equals-sign", "--rules"});
  const auto parsed = parse_validate_args(args.argc(), args.argv());
  CHECK(parsed.errors.size() == 5);
}

TEST_CASE("parse_show_report_args: selectors and help", "[cli][config]") {
  Argv args({"dqv_cli", "show-report", "--audit-db", "audit.db", "--dataset", "orders", "-h"});
  const auto parsed = parse_show_report_args(args.argc(), args.argv());
  CHECK(parsed.errors.empty());
  CHECK(parsed.help_requested);
  CHECK(parsed.config.audit_db == "audit.db");
  CHECK(parsed.config.dataset == "orders");
  CHECK_FALSE(parsed.config.report_id.has_value());
}

TEST_CASE("format_options: lists every validate flag", "[cli][config]") {
  const auto help = dqv::apps::format_options(validate_option_registry());
  for (const char* flag : {"--rules", "--data", "--sqlite", "--table", "--reference-db",
                           "--reference-data", "--redis", "--audit-db", "--report-out"}) {
    CHECK(help.find(flag) != std::string::npos);
  }
}
