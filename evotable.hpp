// evotable.hpp
#ifndef EVOTABLE_EVOTABLE_HPP
#define EVOTABLE_EVOTABLE_HPP

#include "column_planner.hpp"
#include "record_accessor.hpp"
#include "rollback_executor.hpp"
#include "schema_introspector.hpp"
#include "sqlite_db.hpp"
#include "table_rebuilder.hpp"
#include "table_schema.hpp"
#include "version_ledger.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace evotable {

/// One evolving table together with its change ledger
///
/// Opening creates the table with the default schema (an integer "id"
/// primary key) and the ledger table when they are missing. All
/// operations use the one connection owned here; there is no shared
/// state between EvoTable instances other than the database file.
///
/// Usage:
///   EvoTable catalog("catalog.db", "product");
///   catalog.add_column("price_cents", "INTEGER", std::nullopt);
///   int64_t id = catalog.create_record({{"price_cents", FieldValue::text("12.50")}});
///   catalog.update_record(id, {{"price_cents", FieldValue::text("9.99")}});
///   auto history = catalog.list_versions(id, 50);
///   catalog.rollback(history.front().id, "alice");
class EvoTable {
public:
  /// @param table raw table name; it is sanitized before use
  /// @throws EvoTableException IdentifierInvalid (nothing left after
  ///         sanitizing) or StorageFailure
  EvoTable(const std::string &db_path, const std::string &table);

  const std::string &table() const { return table_; }
  Database &database() { return db_; }

  // Schema

  TableSchema list_columns() const;
  std::optional<std::string> get_definition_statement() const;
  void add_column(const std::string &name, const std::string &type,
                  const std::optional<std::string> &default_value);
  void drop_column(const std::string &name);
  void modify_column(const std::string &old_name, const std::string &new_name,
                     const std::string &new_type, const std::optional<std::string> &new_default);
  void run_raw_statement(const std::string &sql);

  /// Rebuild stage hook, e.g. to abort a migration at a given stage
  void set_rebuild_stage_hook(TableRebuilder::StageHook hook);

  // Records

  int64_t create_record(const FieldValues &values, const std::string &actor = "create");
  Record get_record(int64_t id) const;
  std::vector<Record> list_records(const RecordQuery &query) const;
  std::vector<Record> compare_records(const std::vector<int64_t> &ids) const;
  size_t update_record(int64_t id, const FieldValues &values, const std::string &actor = "edit");
  void delete_record(int64_t id);

  // History

  std::vector<VersionEntry> list_versions(std::optional<int64_t> record_id, size_t limit,
                                          VersionSortField sort_field = VersionSortField::Id,
                                          SortOrder order = SortOrder::Descending) const;
  std::optional<VersionEntry> get_version(uint64_t id) const;
  VersionEntry rollback(uint64_t version_id, const std::string &actor);

private:
  std::string table_;
  Database db_;
  SchemaIntrospector introspector_;
  TableRebuilder rebuilder_;
  ColumnPlanner planner_;
  RecordAccessor records_;
  VersionLedger ledger_;
  RollbackExecutor rollback_;
};

} // namespace evotable

#endif // EVOTABLE_EVOTABLE_HPP
