// table_schema.hpp
#ifndef EVOTABLE_TABLE_SCHEMA_HPP
#define EVOTABLE_TABLE_SCHEMA_HPP

#include <optional>
#include <string>
#include <vector>

namespace evotable {

enum class ColumnType { Integer, Real, Text, Blob };

/// Canonical SQL spelling: INTEGER, REAL, TEXT or BLOB
const char *column_type_sql(ColumnType type);

/// Parses one of the four canonical type names (case-insensitive)
/// @throws EvoTableException(TypeInvalid) for anything else
ColumnType parse_column_type(const std::string &name);

/// Maps a declared SQLite column type to a ColumnType by affinity
ColumnType column_type_from_declared(const std::string &declared);

/// Schema metadata for one column
struct ColumnDescriptor {
  int ordinal = 0;
  std::string name;
  ColumnType type = ColumnType::Text;
  // Declared type as written in the table definition; rendered back verbatim on rebuild
  std::string declared_type;
  bool nullable = true;
  // SQL literal text of the default, as reported by PRAGMA table_info
  std::optional<std::string> default_value;
  bool is_primary_key = false;
};

/// Ordered columns of one table, read fresh from the database
struct TableSchema {
  std::string table;
  std::vector<ColumnDescriptor> columns;

  bool empty() const { return columns.empty(); }

  /// Names compare the way SQLite compares them, ignoring ASCII case
  /// @return nullptr if no column has that name
  const ColumnDescriptor *find(const std::string &name) const;

  /// @throws EvoTableException(StorageFailure) unless exactly one primary-key column exists
  const ColumnDescriptor &primary_key() const;

  std::vector<std::string> column_names() const;
};

/// Column definition for CREATE TABLE / ADD COLUMN, e.g. "price_cents" INTEGER NOT NULL DEFAULT 0
std::string column_definition_sql(const ColumnDescriptor &column);

/// CREATE TABLE statement for the given columns
std::string create_table_sql(const std::string &table, const std::vector<ColumnDescriptor> &columns);

/// Renders a user-supplied default as a SQL literal for a column of the given type
///
/// DDL defaults cannot be bound as parameters, so the value is validated
/// against the type and emitted either as a numeric literal or quoted by
/// SQLite itself (sqlite3_mprintf "%Q").
/// @throws EvoTableException(TypeCoercionError) if the value does not fit the type
std::string default_literal_sql(ColumnType type, const std::string &raw);

} // namespace evotable

#endif // EVOTABLE_TABLE_SCHEMA_HPP
