// test_evotable.cpp
#include "evotable.hpp"
#include "test_common.hpp"
#include <map>
#include <stdexcept>

using namespace evotable;

FieldValue text(const std::string &value) { return FieldValue::text(value); }

// Canonical values of every row, by id then column
std::map<int64_t, std::map<std::string, std::optional<std::string>>> snapshot(EvoTable &table) {
  std::map<int64_t, std::map<std::string, std::optional<std::string>>> rows;
  RecordQuery query;
  query.limit = 1000;
  for (const auto &record : table.list_records(query)) {
    for (const auto &[name, value] : record.values) {
      rows[record.id][name] = value.canonical();
    }
  }
  return rows;
}

void seed(EvoTable &table) {
  table.add_column("name", "TEXT", std::nullopt);
  table.add_column("price_cents", "INTEGER", std::nullopt);
  table.add_column("weight", "REAL", std::nullopt);
  table.add_column("image", "BLOB", std::nullopt);
  table.create_record({{"name", text("Widget")}, {"price_cents", text("12.50")}, {"weight", text("0.1")}});
  table.create_record({{"name", text("")}, {"image", FieldValue::blob({0x00, 0xff})}});
  table.create_record({{"weight", text("1e-7")}});
}

TEST(open_sanitizes_table_name) {
  TestDB test_db("open_sanitizes_table_name");
  EvoTable table(test_db.path(), "my products");
  ASSERT_EQ(table.table(), "my_products");
  ASSERT_EQ(table.list_columns().columns.size(), 1u);

  ASSERT_THROWS_CODE(EvoTable(test_db.path(), ""), ErrorCode::IdentifierInvalid);
}

TEST(reopen_keeps_state) {
  TestDB test_db("reopen_keeps_state");
  int64_t id;
  {
    EvoTable table(test_db.path(), "product");
    table.add_column("name", "TEXT", std::nullopt);
    id = table.create_record({{"name", text("Widget")}});
  }
  EvoTable table(test_db.path(), "product");
  ASSERT_EQ(table.list_columns().columns.size(), 2u);
  ASSERT_EQ(table.get_record(id).render("name"), "Widget");
  ASSERT_EQ(table.list_versions(id, 10).size(), 1u);
}

TEST(additive_change_reads_null_or_default) {
  TestDB test_db("additive_change");
  EvoTable table(test_db.path(), "product");
  seed(table);

  table.add_column("colour", "TEXT", std::nullopt);
  table.add_column("stock", "INTEGER", std::string("7"));

  TableSchema schema = table.list_columns();
  ASSERT_TRUE(schema.find("colour") != nullptr);
  ASSERT_TRUE(schema.find("stock") != nullptr);
  for (const auto &[id, row] : snapshot(table)) {
    ASSERT_FALSE(row.at("colour").has_value());
    ASSERT_EQ(row.at("stock"), std::optional<std::string>("7"));
  }
}

TEST(rebuild_keeps_retained_columns) {
  TestDB test_db("rebuild_fidelity");
  EvoTable table(test_db.path(), "product");
  seed(table);
  table.add_column("note", "TEXT", std::nullopt);
  auto before = snapshot(table);

  table.drop_column("note");
  table.modify_column("weight", "", "REAL", std::string("0"));
  auto after = snapshot(table);

  ASSERT_EQ(after.size(), before.size());
  for (const auto &[id, row] : after) {
    ASSERT_FALSE(row.count("note"));
    for (const auto &[name, value] : row) {
      ASSERT_EQ(value, before.at(id).at(name));
    }
  }
}

TEST(failed_migration_changes_nothing) {
  TestDB test_db("failed_migration");
  EvoTable table(test_db.path(), "product");
  seed(table);
  TableSchema schema_before = table.list_columns();
  auto definition_before = table.get_definition_statement();
  auto rows_before = snapshot(table);

  table.set_rebuild_stage_hook([](RebuildStage stage) {
    if (stage == RebuildStage::RenameShadow) {
      throw std::runtime_error("injected failure before rename");
    }
  });
  ASSERT_THROWS_CODE(table.drop_column("weight"), ErrorCode::MigrationFailure);
  ASSERT_THROWS_CODE(table.modify_column("name", "title", "TEXT", std::nullopt), ErrorCode::MigrationFailure);

  ASSERT_TRUE(table.list_columns().column_names() == schema_before.column_names());
  ASSERT_TRUE(snapshot(table) == rows_before);
  ASSERT_EQ(table.get_definition_statement(), definition_before);

  // Records can still be written afterwards
  table.set_rebuild_stage_hook(nullptr);
  table.create_record({{"name", text("after")}});
  ASSERT_EQ(snapshot(table).size(), rows_before.size() + 1);
}

TEST(version_completeness) {
  TestDB test_db("version_completeness");
  EvoTable table(test_db.path(), "product");
  seed(table);
  int64_t id = table.list_records(RecordQuery{}).back().id;
  size_t before = table.list_versions(std::nullopt, 1000).size();

  // Two fields differ; "12.5" and "0.10" match the stored canonical values
  FieldValues values = {{"name", text("Gizmo")},
                        {"price_cents", text("12.5")},
                        {"weight", text("0.10")},
                        {"image", text("BLOB:ab")}};
  ASSERT_EQ(table.update_record(id, values), 2u);

  values = {{"name", text("Gizmo")}, {"price_cents", text("1")}, {"weight", text("2")}, {"image", text("BLOB:cd")}};
  ASSERT_EQ(table.update_record(id, values), 3u);

  auto entries = table.list_versions(id, 3);
  ASSERT_EQ(table.list_versions(std::nullopt, 1000).size(), before + 5);
  std::map<std::string, VersionEntry> by_field;
  for (const auto &entry : entries) by_field[entry.field_name] = entry;
  ASSERT_EQ(by_field.size(), 3u);
  ASSERT_EQ(by_field["price_cents"].old_value, std::optional<std::string>("1250"));
  ASSERT_EQ(by_field["price_cents"].new_value, std::optional<std::string>("100"));
  ASSERT_EQ(by_field["weight"].new_value, std::optional<std::string>("2"));
  ASSERT_EQ(by_field["image"].old_value, std::optional<std::string>("BLOB:ab"));
  ASSERT_EQ(by_field["image"].new_value, std::optional<std::string>("BLOB:cd"));
}

TEST(rollback_reversibility) {
  TestDB test_db("rollback_reversibility");
  EvoTable table(test_db.path(), "product");
  table.add_column("F", "TEXT", std::nullopt);
  int64_t id = table.create_record({{"F", text("old")}});
  table.update_record(id, {{"F", text("new")}});

  VersionEntry latest = table.list_versions(id, 1)[0];
  VersionEntry undo = table.rollback(latest.id, "alice");
  ASSERT_EQ(table.get_record(id).render("F"), "old");
  ASSERT_EQ(undo.old_value, std::optional<std::string>("new"));
  ASSERT_EQ(undo.new_value, std::optional<std::string>("old"));

  table.rollback(undo.id, "alice");
  ASSERT_EQ(table.get_record(id).render("F"), "new");
  ASSERT_EQ(table.get_version(undo.id)->changed_by, "alice");
}

TEST(monetary_convention) {
  TestDB test_db("monetary_convention");
  EvoTable table(test_db.path(), "product");
  table.add_column("price_cents", "INTEGER", std::nullopt);

  int64_t id = table.create_record({{"price_cents", text("12.50")}});
  Record record = table.get_record(id);
  ASSERT_EQ(record.at("price_cents").type, FieldValue::INTEGER);
  ASSERT_EQ(record.at("price_cents").int_val, 1250);
  ASSERT_EQ(record.render("price_cents"), "12.50");

  int64_t rounded = table.create_record({{"price_cents", text("12.504")}});
  ASSERT_EQ(table.get_record(rounded).at("price_cents").int_val, 1250);

  // The convention needs an INTEGER column
  table.add_column("legacy_cents", "TEXT", std::nullopt);
  table.update_record(id, {{"legacy_cents", text("12.50")}});
  ASSERT_EQ(table.get_record(id).render("legacy_cents"), "12.50");
  ASSERT_EQ(table.get_record(id).at("legacy_cents").type, FieldValue::TEXT);
}

TEST(dropped_field_rollback_rejected) {
  TestDB test_db("dropped_field_rollback");
  EvoTable table(test_db.path(), "product");
  table.add_column("F", "TEXT", std::nullopt);
  table.add_column("G", "TEXT", std::nullopt);
  int64_t id = table.create_record({{"F", text("a")}, {"G", text("b")}});
  table.update_record(id, {{"F", text("c")}});
  VersionEntry entry = table.list_versions(id, 1)[0];

  table.drop_column("F");
  auto rows_before = snapshot(table);
  size_t entries_before = table.list_versions(std::nullopt, 1000).size();

  ASSERT_THROWS_CODE(table.rollback(entry.id, "alice"), ErrorCode::FieldNoLongerExists);
  ASSERT_TRUE(snapshot(table) == rows_before);
  ASSERT_EQ(table.list_versions(std::nullopt, 1000).size(), entries_before);

  // Re-adding a column of the same name makes the entry actionable again
  table.add_column("F", "TEXT", std::nullopt);
  table.rollback(entry.id, "alice");
  ASSERT_EQ(table.get_record(id).render("F"), "a");
}

int main() {
  std::cout << "Running evotable tests..." << std::endl << std::endl;

  RUN_TEST(open_sanitizes_table_name);
  RUN_TEST(reopen_keeps_state);
  RUN_TEST(additive_change_reads_null_or_default);
  RUN_TEST(rebuild_keeps_retained_columns);
  RUN_TEST(failed_migration_changes_nothing);
  RUN_TEST(version_completeness);
  RUN_TEST(rollback_reversibility);
  RUN_TEST(monetary_convention);
  RUN_TEST(dropped_field_rollback_rejected);

  std::cout << std::endl << "All tests passed!" << std::endl;
  return 0;
}
