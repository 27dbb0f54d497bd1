#include "dqv/data/sqlite/sqlite_dataset.h"
#include "dqv/storage/sqlite/sqlite_db.h"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>

using namespace dqv;

namespace {

std::shared_ptr<storage::sqlite::SqliteDb> orders_db() {
  auto db_result = storage::sqlite::SqliteDb::open(":memory:");
  REQUIRE(db_result.has_value());
  auto db = db_result.value();
  REQUIRE(db->exec(R"(
    CREATE TABLE "order items" (order_no TEXT, qty INTEGER, price REAL, note TEXT);
    INSERT INTO "order items" VALUES ('A-1', 2, 9.5, NULL);
    INSERT INTO "order items" VALUES ('A-2', 1, 4.25, 'gift');
    INSERT INTO "order items" VALUES (NULL, 7, 1.0, NULL);
    INSERT INTO "order items" VALUES ('A-4', -1, 0.5, NULL);
    INSERT INTO "order items" VALUES ('A-5', 3, 2.0, NULL);
  )")
              .has_value());
  return db;
}

}  // namespace

TEST_CASE("quote_identifier: doubles embedded quotes", "[sqlite][data]") {
  CHECK(storage::sqlite::quote_identifier("orders") == "\"orders\"");
  CHECK(storage::sqlite::quote_identifier("a\"b") == "\"a\"\"b\"");
}

TEST_CASE("SqliteDataset: rows are partitioned by rowid modulo", "[sqlite][data]") {
  const auto dataset = data::sqlite::SqliteDataset::open(orders_db(), "order items", 2);
  REQUIRE(dataset.has_value());
  const auto& ds = *dataset.value();
  CHECK(ds.name() == "order items");
  CHECK(ds.partition_count() == 2);

  const auto even = ds.load_partition(0);
  const auto odd = ds.load_partition(1);
  CHECK(even.index == 0);
  CHECK(even.records.size() == 2);
  CHECK(odd.records.size() == 3);

  // rowid 1 is the first record of partition 1.
  const auto& first = odd.records.front();
  CHECK(first.record_id == "1");
  CHECK(std::get<std::string>(first.get("order_no")) == "A-1");
  CHECK(std::get<std::int64_t>(first.get("qty")) == 2);
  CHECK(std::get<double>(first.get("price")) == 9.5);
  CHECK(data::is_null(first.get("note")));

  CHECK_THROWS_AS(ds.load_partition(2), std::out_of_range);
}

TEST_CASE("SqliteDataset: negative and sparse rowids land in a partition", "[sqlite][data]") {
  auto db_result = storage::sqlite::SqliteDb::open(":memory:");
  REQUIRE(db_result.has_value());
  auto db = db_result.value();
  REQUIRE(db->exec(R"(
    CREATE TABLE readings (v TEXT);
    INSERT INTO readings (rowid, v) VALUES (-3, 'a');
    INSERT INTO readings (rowid, v) VALUES (-1, 'b');
    INSERT INTO readings (rowid, v) VALUES (1, 'c');
    INSERT INTO readings (rowid, v) VALUES (2, 'd');
    INSERT INTO readings (rowid, v) VALUES (7, 'e');
  )")
              .has_value());

  const auto dataset = data::sqlite::SqliteDataset::open(db, "readings", 3);
  REQUIRE(dataset.has_value());
  const auto& ds = *dataset.value();
  REQUIRE(ds.partition_count() == 3);

  const auto p0 = ds.load_partition(0);
  const auto p1 = ds.load_partition(1);
  const auto p2 = ds.load_partition(2);
  CHECK(p0.records.size() + p1.records.size() + p2.records.size() == 5);

  REQUIRE(p0.records.size() == 1);
  CHECK(p0.records[0].record_id == "-3");
  REQUIRE(p1.records.size() == 2);
  CHECK(p1.records[0].record_id == "1");
  CHECK(p1.records[1].record_id == "7");
  REQUIRE(p2.records.size() == 2);
  CHECK(p2.records[0].record_id == "-1");
  CHECK(p2.records[1].record_id == "2");
}

TEST_CASE("SqliteDataset: id column overrides rowid when set", "[sqlite][data]") {
  const auto dataset =
      data::sqlite::SqliteDataset::open(orders_db(), "order items", 1, std::string{"order_no"});
  REQUIRE(dataset.has_value());
  const auto partition = dataset.value()->load_partition(0);
  REQUIRE(partition.records.size() == 5);
  CHECK(partition.records[0].record_id == "A-1");
  CHECK(partition.records[2].record_id == "3");
}

TEST_CASE("SqliteDataset: partition count never exceeds row count", "[sqlite][data]") {
  const auto dataset = data::sqlite::SqliteDataset::open(orders_db(), "order items", 16);
  REQUIRE(dataset.has_value());
  CHECK(dataset.value()->partition_count() == 5);
}

TEST_CASE("SqliteDataset: missing table is an error", "[sqlite][data]") {
  const auto dataset = data::sqlite::SqliteDataset::open(orders_db(), "nope", 2);
  CHECK_FALSE(dataset.has_value());
}

TEST_CASE("SqliteDataset: empty table has no partitions", "[sqlite][data]") {
  auto db = orders_db();
  REQUIRE(db->exec("CREATE TABLE empty_t (a INTEGER)").has_value());
  const auto dataset = data::sqlite::SqliteDataset::open(db, "empty_t", 4);
  REQUIRE(dataset.has_value());
  CHECK(dataset.value()->partition_count() == 0);
}
