// schema_introspector.hpp
#ifndef EVOTABLE_SCHEMA_INTROSPECTOR_HPP
#define EVOTABLE_SCHEMA_INTROSPECTOR_HPP

#include "sqlite_db.hpp"
#include "table_schema.hpp"
#include <optional>
#include <string>

namespace evotable {

/// Reads the live physical schema of a table
///
/// Nothing is cached: every call queries the SQLite catalog, so results
/// always reflect the latest committed (or in-transaction) schema.
class SchemaIntrospector {
public:
  explicit SchemaIntrospector(Database &db) : db_(db) {}

  /// Columns of the table in ordinal order; empty if the table does not exist
  TableSchema list_columns(const std::string &table) const;

  /// Raw CREATE TABLE text, for display and audit only
  std::optional<std::string> get_definition_statement(const std::string &table) const;

  bool table_exists(const std::string &table) const;

  /// Creates the table with the default schema (just an integer primary key) if missing
  /// @return true if the table was created
  bool ensure_table(const std::string &table, const std::string &primary_key = "id") const;

private:
  Database &db_;
};

} // namespace evotable

#endif // EVOTABLE_SCHEMA_INTROSPECTOR_HPP
