// column_planner.cpp
#include "column_planner.hpp"
#include "evotable_errors.hpp"
#include "identifier.hpp"
#include <spdlog/spdlog.h>

namespace evotable {

namespace {

TableSchema require_table(SchemaIntrospector &introspector, const std::string &table) {
  TableSchema schema = introspector.list_columns(table);
  if (schema.empty()) {
    throw EvoTableException(ErrorCode::MigrationFailure, "Table does not exist: " + table);
  }
  return schema;
}

/// An empty default means "no default"
std::optional<std::string> render_default(ColumnType type, const std::optional<std::string> &raw) {
  if (!raw || raw->empty()) {
    return std::nullopt;
  }
  return default_literal_sql(type, *raw);
}

const ColumnDescriptor &require_mutable_column(const TableSchema &schema, const std::string &name) {
  const ColumnDescriptor *column = schema.find(name);
  if (!column) {
    throw EvoTableException(ErrorCode::ColumnNotFound,
                            "Column " + name + " not found in " + schema.table);
  }
  if (column->is_primary_key) {
    throw EvoTableException(ErrorCode::PrimaryKeyImmutable,
                            "Column " + name + " is the primary key of " + schema.table);
  }
  return *column;
}

} // namespace

void ColumnPlanner::add_column(const std::string &table, const std::string &name,
                               const std::string &type,
                               const std::optional<std::string> &default_value) {
  ColumnType column_type = parse_column_type(type);

  ColumnDescriptor column;
  column.name = sanitize_identifier(name);
  column.type = column_type;
  column.declared_type = column_type_sql(column_type);
  column.nullable = true;

  // Validates the name before any SQL is built
  quote_identifier(column.name);
  column.default_value = render_default(column_type, default_value);

  try {
    Transaction txn(db_);
    TableSchema schema = require_table(introspector_, table);
    if (schema.find(column.name)) {
      throw EvoTableException(ErrorCode::ColumnExists,
                              "Column " + column.name + " already exists in " + table);
    }
    db_.execute("ALTER TABLE " + quote_identifier(table) + " ADD COLUMN " +
                column_definition_sql(column));
    txn.commit();
  } catch (const EvoTableException &e) {
    if (e.code() == ErrorCode::StorageFailure) {
      throw EvoTableException(ErrorCode::MigrationFailure,
                              "Adding column " + column.name + " to " + table + " failed: " + e.what());
    }
    throw;
  }

  spdlog::info("evotable: added column {} {} to {}", column.name, column.declared_type, table);
}

void ColumnPlanner::drop_column(const std::string &table, const std::string &name) {
  const std::string column_name = sanitize_identifier(name);
  TableSchema schema = require_table(introspector_, table);
  require_mutable_column(schema, column_name);

  std::vector<ColumnDescriptor> target;
  for (const auto &column : schema.columns) {
    if (!same_identifier(column.name, column_name)) {
      target.push_back(column);
    }
  }

  rebuilder_.rebuild(table, target);
  spdlog::info("evotable: dropped column {} from {}", column_name, table);
}

void ColumnPlanner::modify_column(const std::string &table, const std::string &old_name,
                                  const std::string &new_name, const std::string &new_type,
                                  const std::optional<std::string> &new_default) {
  const std::string old_column = sanitize_identifier(old_name);
  // An empty new name keeps the old one
  const std::string new_column = new_name.empty() ? old_column : sanitize_identifier(new_name);

  TableSchema schema = require_table(introspector_, table);
  const ColumnDescriptor &existing = require_mutable_column(schema, old_column);

  ColumnType column_type = parse_column_type(new_type);
  quote_identifier(new_column);
  // A change of case only keeps the same column
  const bool renamed = !same_identifier(new_column, old_column);
  if (renamed && schema.find(new_column)) {
    throw EvoTableException(ErrorCode::ColumnExists,
                            "Column " + new_column + " already exists in " + table);
  }

  ColumnDescriptor replacement = existing;
  replacement.name = new_column;
  replacement.type = column_type;
  replacement.declared_type = column_type_sql(column_type);
  replacement.default_value = render_default(column_type, new_default);
  // A renamed column starts out empty, so NOT NULL without a default could never be satisfied
  if (renamed && !replacement.default_value) {
    replacement.nullable = true;
  }

  std::vector<ColumnDescriptor> target;
  for (const auto &column : schema.columns) {
    target.push_back(&column == &existing ? replacement : column);
  }

  rebuilder_.rebuild(table, target);
  spdlog::info("evotable: modified column {} -> {} {} in {}", old_column, new_column,
               replacement.declared_type, table);
}

void ColumnPlanner::run_raw_statement(const std::string &table, const std::string &sql) {
  spdlog::warn("evotable: raw statement against {}: {}", table, sql);
  try {
    Transaction txn(db_);
    db_.execute(sql);
    txn.commit();
  } catch (const EvoTableException &e) {
    throw EvoTableException(ErrorCode::MigrationFailure,
                            "Raw statement against " + table + " failed: " + e.what());
  }
}

} // namespace evotable
