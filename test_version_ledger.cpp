// test_version_ledger.cpp
#include "column_planner.hpp"
#include "record_accessor.hpp"
#include "rollback_executor.hpp"
#include "schema_introspector.hpp"
#include "table_rebuilder.hpp"
#include "test_common.hpp"
#include "version_ledger.hpp"
#include <cctype>

using namespace evotable;

// Components wired by hand, the way EvoTable does it
struct Fixture {
  explicit Fixture(const TestDB &test_db)
      : db(test_db.path()), introspector(db), rebuilder(db, introspector),
        planner(db, introspector, rebuilder), records(db, introspector), ledger(db, "product"),
        executor(db, introspector, records, ledger, "product") {
    introspector.ensure_table("product");
    ledger.ensure_table();
  }

  Database db;
  SchemaIntrospector introspector;
  TableRebuilder rebuilder;
  ColumnPlanner planner;
  RecordAccessor records;
  VersionLedger ledger;
  RollbackExecutor executor;
};

TEST(ledger_layout) {
  TestDB test_db("ledger_layout");
  Fixture f(test_db);

  ASSERT_EQ(f.ledger.ledger_table(), "product_field_versions");
  TableSchema schema = f.introspector.list_columns("product_field_versions");
  std::vector<std::string> expected = {"id",        "record_id",  "field_name", "old_value",
                                       "new_value", "changed_at", "changed_by"};
  ASSERT_TRUE(schema.column_names() == expected);
  ASSERT_EQ(schema.primary_key().name, "id");

  // Opening again is harmless
  f.ledger.ensure_table();
  ASSERT_EQ(f.ledger.count(), 0u);
}

TEST(record_and_get) {
  TestDB test_db("record_and_get");
  Fixture f(test_db);

  ASSERT_TRUE(f.ledger.record(1, {}, "alice").empty());
  ASSERT_EQ(f.ledger.count(), 0u);

  std::vector<uint64_t> ids = f.ledger.record(
      1, {{"name", std::nullopt, std::string("Widget")}, {"note", std::string(""), std::nullopt}}, "alice");
  ASSERT_EQ(ids.size(), 2u);
  ASSERT_TRUE(ids[1] > ids[0]);

  auto first = f.ledger.get_by_id(ids[0]);
  ASSERT_TRUE(first.has_value());
  ASSERT_EQ(first->record_id, 1);
  ASSERT_EQ(first->field_name, "name");
  ASSERT_FALSE(first->old_value.has_value());
  ASSERT_EQ(first->new_value, std::optional<std::string>("Widget"));
  ASSERT_EQ(first->changed_by, "alice");
  // e.g. 2024-05-01T12:30:00.123456
  ASSERT_EQ(first->changed_at.size(), 26u);
  ASSERT_EQ(first->changed_at[10], 'T');

  auto second = f.ledger.get_by_id(ids[1]);
  ASSERT_EQ(second->old_value, std::optional<std::string>(""));
  ASSERT_FALSE(second->new_value.has_value());
  ASSERT_EQ(second->changed_at, first->changed_at);

  ASSERT_FALSE(f.ledger.get_by_id(ids[1] + 1).has_value());
}

TEST(list_filter_sort_limit) {
  TestDB test_db("list_filter_sort_limit");
  Fixture f(test_db);

  f.ledger.record(1, {{"b", std::nullopt, std::string("1")}}, "zed");
  f.ledger.record(2, {{"a", std::nullopt, std::string("2")}}, "amy");
  f.ledger.record(1, {{"a", std::nullopt, std::string("3")}}, "amy");
  f.ledger.record(1, {{"c", std::nullopt, std::string("4")}}, "bob");

  auto all = f.ledger.list(std::nullopt, 10);
  ASSERT_EQ(all.size(), 4u);
  ASSERT_EQ(all[0].new_value, std::optional<std::string>("4"));
  ASSERT_EQ(all[3].new_value, std::optional<std::string>("1"));

  auto for_one = f.ledger.list(1, 10, VersionSortField::Id, SortOrder::Ascending);
  ASSERT_EQ(for_one.size(), 3u);
  ASSERT_EQ(for_one[0].field_name, "b");
  ASSERT_EQ(for_one[2].field_name, "c");

  // Ties on field_name are broken by id in the same direction
  auto by_field = f.ledger.list(std::nullopt, 10, VersionSortField::FieldName, SortOrder::Ascending);
  ASSERT_EQ(by_field[0].new_value, std::optional<std::string>("2"));
  ASSERT_EQ(by_field[1].new_value, std::optional<std::string>("3"));
  ASSERT_EQ(by_field[2].field_name, "b");

  auto by_actor = f.ledger.list(std::nullopt, 2, VersionSortField::ChangedBy, SortOrder::Descending);
  ASSERT_EQ(by_actor.size(), 2u);
  ASSERT_EQ(by_actor[0].changed_by, "zed");
  ASSERT_EQ(by_actor[1].changed_by, "bob");

  ASSERT_EQ(f.ledger.list(std::nullopt, 0).size(), 0u);
  ASSERT_EQ(f.ledger.list(99, 10).size(), 0u);
}

TEST(parse_sort_options) {
  ASSERT_TRUE(parse_version_sort_field("changed_at") == VersionSortField::ChangedAt);
  ASSERT_TRUE(parse_version_sort_field("RECORD_ID") == VersionSortField::RecordId);
  ASSERT_TRUE(parse_sort_order("asc") == SortOrder::Ascending);
  ASSERT_TRUE(parse_sort_order("Descending") == SortOrder::Descending);
  ASSERT_THROWS_CODE(parse_version_sort_field("id; DROP TABLE product"), ErrorCode::IdentifierInvalid);
  ASSERT_THROWS_CODE(parse_sort_order("sideways"), ErrorCode::IdentifierInvalid);
}

TEST(ledger_is_append_only) {
  TestDB test_db("ledger_is_append_only");
  Fixture f(test_db);
  f.ledger.record(1, {{"name", std::nullopt, std::string("Widget")}}, "alice");

  ASSERT_THROWS_CODE(f.db.execute("UPDATE product_field_versions SET new_value = 'x'"),
                     ErrorCode::StorageFailure);
  ASSERT_THROWS_CODE(f.db.execute("DELETE FROM product_field_versions"), ErrorCode::StorageFailure);
  ASSERT_THROWS_CODE(f.db.execute("DROP TABLE product_field_versions"), ErrorCode::StorageFailure);
  ASSERT_THROWS_CODE(f.db.execute("ALTER TABLE product_field_versions ADD COLUMN x TEXT"),
                     ErrorCode::StorageFailure);
  ASSERT_THROWS_CODE(f.planner.run_raw_statement("product", "DELETE FROM product_field_versions"),
                     ErrorCode::MigrationFailure);

  ASSERT_EQ(f.ledger.count(), 1u);
  ASSERT_EQ(f.ledger.list(std::nullopt, 1)[0].new_value, std::optional<std::string>("Widget"));
}

TEST(rollback_and_roll_forward) {
  TestDB test_db("rollback_and_roll_forward");
  Fixture f(test_db);
  f.planner.add_column("product", "name", "TEXT", std::nullopt);

  int64_t id = f.records.create("product", {{"name", FieldValue::text("old")}}, "create");
  f.records.update("product", id, {{"name", FieldValue::text("new")}}, "edit");
  VersionEntry change = f.ledger.list(id, 1)[0];
  ASSERT_EQ(change.old_value, std::optional<std::string>("old"));

  VersionEntry undo = f.executor.rollback(change.id, "alice");
  ASSERT_EQ(f.records.get("product", id).render("name"), "old");
  ASSERT_TRUE(undo.id > change.id);
  ASSERT_EQ(undo.record_id, id);
  ASSERT_EQ(undo.field_name, "name");
  ASSERT_EQ(undo.old_value, std::optional<std::string>("new"));
  ASSERT_EQ(undo.new_value, std::optional<std::string>("old"));
  ASSERT_EQ(undo.changed_by, "alice");

  // The original entry is untouched; the rollback itself can be rolled back
  ASSERT_EQ(f.ledger.get_by_id(change.id)->new_value, std::optional<std::string>("new"));
  VersionEntry redo = f.executor.rollback(undo.id, "bob");
  ASSERT_EQ(f.records.get("product", id).render("name"), "new");
  ASSERT_EQ(redo.old_value, std::optional<std::string>("old"));
  ASSERT_EQ(redo.new_value, std::optional<std::string>("new"));
  ASSERT_EQ(f.ledger.count(), 4u);
}

TEST(rollback_of_older_change) {
  TestDB test_db("rollback_of_older_change");
  Fixture f(test_db);
  f.planner.add_column("product", "name", "TEXT", std::nullopt);

  int64_t id = f.records.create("product", {{"name", FieldValue::text("a")}}, "create");
  f.records.update("product", id, {{"name", FieldValue::text("b")}}, "edit");
  VersionEntry a_to_b = f.ledger.list(id, 1)[0];
  f.records.update("product", id, {{"name", FieldValue::text("c")}}, "edit");

  // The appended entry inverts the rolled-back entry, not the field's latest change
  VersionEntry undo = f.executor.rollback(a_to_b.id, "alice");
  ASSERT_EQ(f.records.get("product", id).render("name"), "a");
  ASSERT_EQ(undo.old_value, std::optional<std::string>("b"));
  ASSERT_EQ(undo.new_value, std::optional<std::string>("a"));
}

TEST(utc_timestamp_format) {
  std::string stamp = utc_timestamp();
  ASSERT_EQ(stamp.size(), 26u);
  ASSERT_EQ(stamp[4], '-');
  ASSERT_EQ(stamp[10], 'T');
  ASSERT_EQ(stamp[19], '.');
  for (size_t i : {0u, 5u, 8u, 11u, 14u, 17u, 20u, 25u}) {
    ASSERT_TRUE(std::isdigit(static_cast<unsigned char>(stamp[i])));
  }
}

TEST(rollback_to_null_and_stored_cents) {
  TestDB test_db("rollback_to_null_and_stored_cents");
  Fixture f(test_db);
  f.planner.add_column("product", "price_cents", "INTEGER", std::nullopt);

  int64_t id = f.records.create("product", {{"price_cents", FieldValue::text("12.50")}}, "create");
  VersionEntry created = f.ledger.list(id, 1)[0];
  f.records.update("product", id, {{"price_cents", FieldValue::text("20")}}, "edit");
  VersionEntry changed = f.ledger.list(id, 1)[0];

  // Ledger values are stored cents and are written back without conversion
  f.executor.rollback(changed.id, "alice");
  ASSERT_EQ(f.records.get("product", id).at("price_cents").int_val, 1250);

  // Rolling back the creation entry restores NULL
  VersionEntry undo = f.executor.rollback(created.id, "alice");
  ASSERT_TRUE(f.records.get("product", id).at("price_cents").is_null());
  ASSERT_EQ(undo.old_value, std::optional<std::string>("1250"));
  ASSERT_FALSE(undo.new_value.has_value());
}

TEST(rollback_rejections) {
  TestDB test_db("rollback_rejections");
  Fixture f(test_db);
  f.planner.add_column("product", "name", "TEXT", std::nullopt);
  f.planner.add_column("product", "note", "TEXT", std::nullopt);

  int64_t id = f.records.create("product", {{"name", FieldValue::text("Widget")}, {"note", FieldValue::text("n")}},
                                "create");
  f.records.update("product", id, {{"note", FieldValue::text("m")}}, "edit");
  VersionEntry note_change = f.ledger.list(id, 1)[0];
  ASSERT_EQ(note_change.field_name, "note");
  VersionEntry name_created = f.ledger.list(id, 10, VersionSortField::FieldName, SortOrder::Ascending)[0];
  ASSERT_EQ(name_created.field_name, "name");
  size_t entries = f.ledger.count();

  ASSERT_THROWS_CODE(f.executor.rollback(note_change.id + 100, "alice"), ErrorCode::VersionNotFound);

  f.planner.drop_column("product", "note");
  ASSERT_THROWS_CODE(f.executor.rollback(note_change.id, "alice"), ErrorCode::FieldNoLongerExists);
  // History of the dropped field stays listed
  ASSERT_EQ(f.ledger.get_by_id(note_change.id)->field_name, "note");

  f.records.remove("product", id);
  ASSERT_THROWS_CODE(f.executor.rollback(name_created.id, "alice"), ErrorCode::RecordNotFound);

  ASSERT_EQ(f.ledger.count(), entries);
  ASSERT_FALSE(f.db.in_transaction());
}

int main() {
  std::cout << "Running version ledger tests..." << std::endl << std::endl;

  RUN_TEST(ledger_layout);
  RUN_TEST(record_and_get);
  RUN_TEST(list_filter_sort_limit);
  RUN_TEST(parse_sort_options);
  RUN_TEST(ledger_is_append_only);
  RUN_TEST(rollback_and_roll_forward);
  RUN_TEST(rollback_of_older_change);
  RUN_TEST(utc_timestamp_format);
  RUN_TEST(rollback_to_null_and_stored_cents);
  RUN_TEST(rollback_rejections);

  std::cout << std::endl << "All tests passed!" << std::endl;
  return 0;
}
