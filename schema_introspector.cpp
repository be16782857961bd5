// schema_introspector.cpp
#include "schema_introspector.hpp"
#include <spdlog/spdlog.h>

namespace evotable {

TableSchema SchemaIntrospector::list_columns(const std::string &table) const {
  TableSchema schema;
  schema.table = table;

  // Table-valued form of PRAGMA table_info so the name is bound, not interpolated
  Statement stmt = db_.prepare(
      "SELECT cid, name, type, \"notnull\", dflt_value, pk FROM pragma_table_info(?) ORDER BY cid");
  stmt.bind_text(1, table);

  while (stmt.step()) {
    ColumnDescriptor column;
    column.ordinal = static_cast<int>(stmt.column_int64(0));
    column.name = stmt.column_text(1).value_or("");
    column.declared_type = stmt.column_text(2).value_or("");
    column.type = column_type_from_declared(column.declared_type);
    column.nullable = stmt.column_int64(3) == 0;
    column.default_value = stmt.column_text(4);
    column.is_primary_key = stmt.column_int64(5) != 0;
    schema.columns.push_back(std::move(column));
  }

  return schema;
}

std::optional<std::string> SchemaIntrospector::get_definition_statement(const std::string &table) const {
  Statement stmt = db_.prepare("SELECT sql FROM sqlite_master WHERE type='table' AND name=? COLLATE NOCASE");
  stmt.bind_text(1, table);
  if (stmt.step()) {
    return stmt.column_text(0);
  }
  return std::nullopt;
}

bool SchemaIntrospector::table_exists(const std::string &table) const {
  Statement stmt = db_.prepare("SELECT 1 FROM sqlite_master WHERE type='table' AND name=? COLLATE NOCASE");
  stmt.bind_text(1, table);
  return stmt.step();
}

bool SchemaIntrospector::ensure_table(const std::string &table, const std::string &primary_key) const {
  if (table_exists(table)) {
    return false;
  }

  ColumnDescriptor pk;
  pk.name = primary_key;
  pk.type = ColumnType::Integer;
  pk.declared_type = column_type_sql(ColumnType::Integer);
  pk.is_primary_key = true;

  db_.execute(create_table_sql(table, {pk}));
  spdlog::info("evotable: created table {} with default schema", table);
  return true;
}

} // namespace evotable
