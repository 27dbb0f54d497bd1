#include "dqv/rules/rule_set.h"

#include <catch2/catch_test_macros.hpp>

using namespace dqv::rules;

namespace {

RuleSpec make_spec(std::string name, RuleKind kind, std::vector<std::string> columns) {
  RuleSpec spec;
  spec.name = std::move(name);
  spec.kind = kind;
  spec.columns = std::move(columns);
  return spec;
}

RuleSetDefinition single_rule(RuleSpec spec) {
  RuleSetDefinition definition;
  definition.rule_set_id = "rs";
  definition.version = "1";
  definition.rules.push_back(std::move(spec));
  return definition;
}

}  // namespace

TEST_CASE("build_rule_set: valid definition keeps order and names", "[rules][config]") {
  RuleSetDefinition definition;
  definition.rule_set_id = "orders";
  definition.version = "2";
  definition.rules.push_back(make_spec("id_present", RuleKind::kNotNull, {"id"}));
  definition.rules.push_back(make_spec("id_unique", RuleKind::kUnique, {"id"}));
  auto ri = make_spec("customer_known", RuleKind::kReferentialIntegrity, {"customer_id"});
  ri.params.reference = "customers.id";
  definition.rules.push_back(ri);
  auto ri2 = make_spec("billing_known", RuleKind::kReferentialIntegrity, {"billing_id"});
  ri2.params.reference = "customers.id";
  definition.rules.push_back(ri2);

  const auto rule_set = build_rule_set(definition);
  REQUIRE(rule_set.has_value());
  const auto& rs = rule_set.value();
  CHECK(rs.rule_set_id() == "orders");
  CHECK(rs.version() == "2");
  REQUIRE(rs.size() == 4);
  CHECK(rs.rules()[0]->name() == "id_present");
  CHECK(rs.rules()[1]->is_keyed());
  CHECK_FALSE(rs.rules()[0]->is_keyed());
  REQUIRE(rs.find("customer_known") != nullptr);
  CHECK(rs.find("customer_known")->kind() == RuleKind::kReferentialIntegrity);
  CHECK(rs.find("nope") == nullptr);
  CHECK(rs.reference_ids() == std::vector<std::string>{"customers.id"});
}

TEST_CASE("build_rule_set: fingerprint depends only on the definition", "[rules][config]") {
  const auto definition = single_rule(make_spec("a", RuleKind::kNotNull, {"a"}));
  const auto first = build_rule_set(definition);
  const auto second = build_rule_set(definition);
  REQUIRE(first.has_value());
  REQUIRE(second.has_value());
  CHECK(first.value().fingerprint() == second.value().fingerprint());
  CHECK_FALSE(first.value().fingerprint().empty());

  auto changed = definition;
  changed.rules[0].severity = Severity::kWarning;
  const auto third = build_rule_set(changed);
  REQUIRE(third.has_value());
  CHECK(third.value().fingerprint() != first.value().fingerprint());
}

TEST_CASE("build_rule_set: configuration errors name the offending rule", "[rules][config]") {
  SECTION("duplicate rule name") {
    RuleSetDefinition definition = single_rule(make_spec("dup", RuleKind::kNotNull, {"a"}));
    definition.rules.push_back(make_spec("dup", RuleKind::kNotNull, {"b"}));
    const auto result = build_rule_set(definition);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().rule_name == "dup");
  }

  SECTION("empty column list") {
    const auto result = build_rule_set(single_rule(make_spec("r", RuleKind::kNotNull, {})));
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().rule_name == "r");
  }

  SECTION("range with several columns") {
    auto spec = make_spec("r", RuleKind::kRange, {"a", "b"});
    spec.params.min = 0.0;
    CHECK_FALSE(build_rule_set(single_rule(spec)).has_value());
  }

  SECTION("range without bounds") {
    CHECK_FALSE(build_rule_set(single_rule(make_spec("r", RuleKind::kRange, {"a"}))).has_value());
  }

  SECTION("range with min above max") {
    auto spec = make_spec("r", RuleKind::kRange, {"a"});
    spec.params.min = 10.0;
    spec.params.max = 1.0;
    CHECK_FALSE(build_rule_set(single_rule(spec)).has_value());
  }

  SECTION("regex without a pattern") {
    CHECK_FALSE(build_rule_set(single_rule(make_spec("r", RuleKind::kRegex, {"a"}))).has_value());
  }

  SECTION("regex that does not compile") {
    auto spec = make_spec("bad_regex", RuleKind::kRegex, {"a"});
    spec.params.pattern = "([a-z";
    const auto result = build_rule_set(single_rule(spec));
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().rule_name == "bad_regex");
  }

  SECTION("referential integrity without a reference") {
    CHECK_FALSE(build_rule_set(single_rule(make_spec("r", RuleKind::kReferentialIntegrity, {"a"})))
                    .has_value());
  }

  SECTION("custom predicate not registered") {
    auto spec = make_spec("r", RuleKind::kCustom, {});
    spec.params.predicate = "is_even";
    CHECK_FALSE(build_rule_set(single_rule(spec)).has_value());
  }

  SECTION("zero sample capacity") {
    auto definition = single_rule(make_spec("r", RuleKind::kNotNull, {"a"}));
    definition.sample_capacity = 0;
    CHECK_FALSE(build_rule_set(definition).has_value());
  }
}

TEST_CASE("build_rule_set: custom rule resolves a registered predicate", "[rules][config]") {
  CustomPredicateRegistry predicates;
  predicates.register_predicate("always", [](const dqv::data::Record&) { return true; });

  auto spec = make_spec("custom_check", RuleKind::kCustom, {});
  spec.params.predicate = "always";
  const auto result = build_rule_set(single_rule(spec), predicates);
  REQUIRE(result.has_value());
  CHECK(result.value().rules()[0]->kind() == RuleKind::kCustom);
  CHECK(predicates.names() == std::vector<std::string>{"always"});
}
