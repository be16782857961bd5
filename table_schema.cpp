// table_schema.cpp
#include "table_schema.hpp"
#include "evotable_errors.hpp"
#include "field_value.hpp"
#include "identifier.hpp"
#include <sqlite3.h>
#include <algorithm>
#include <cctype>

namespace evotable {

namespace {

std::string to_upper(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return str;
}

} // namespace

const char *column_type_sql(ColumnType type) {
  switch (type) {
  case ColumnType::Integer:
    return "INTEGER";
  case ColumnType::Real:
    return "REAL";
  case ColumnType::Text:
    return "TEXT";
  case ColumnType::Blob:
    return "BLOB";
  }
  return "TEXT";
}

ColumnType parse_column_type(const std::string &name) {
  std::string upper = to_upper(name);
  if (upper == "INTEGER") return ColumnType::Integer;
  if (upper == "REAL") return ColumnType::Real;
  if (upper == "TEXT") return ColumnType::Text;
  if (upper == "BLOB") return ColumnType::Blob;
  throw EvoTableException(ErrorCode::TypeInvalid,
                          "Invalid column type '" + name + "': expected INTEGER, REAL, TEXT or BLOB");
}

ColumnType column_type_from_declared(const std::string &declared) {
  std::string col_type = to_upper(declared);

  // Map SQLite type affinity to our ColumnType
  if (col_type.find("INT") != std::string::npos) {
    return ColumnType::Integer;
  }
  if (col_type.find("CHAR") != std::string::npos ||
      col_type.find("CLOB") != std::string::npos ||
      col_type.find("TEXT") != std::string::npos) {
    return ColumnType::Text;
  }
  // No declared type means BLOB affinity
  if (col_type.empty() || col_type.find("BLOB") != std::string::npos) {
    return ColumnType::Blob;
  }
  if (col_type.find("REAL") != std::string::npos ||
      col_type.find("FLOA") != std::string::npos ||
      col_type.find("DOUB") != std::string::npos) {
    return ColumnType::Real;
  }
  return ColumnType::Text;
}

const ColumnDescriptor *TableSchema::find(const std::string &name) const {
  for (const auto &column : columns) {
    if (same_identifier(column.name, name)) {
      return &column;
    }
  }
  return nullptr;
}

const ColumnDescriptor &TableSchema::primary_key() const {
  const ColumnDescriptor *pk = nullptr;
  for (const auto &column : columns) {
    if (column.is_primary_key) {
      if (pk) {
        throw EvoTableException(ErrorCode::StorageFailure,
                                "Table " + table + " has a composite primary key");
      }
      pk = &column;
    }
  }
  if (!pk) {
    throw EvoTableException(ErrorCode::StorageFailure, "Table " + table + " has no primary key");
  }
  return *pk;
}

std::vector<std::string> TableSchema::column_names() const {
  std::vector<std::string> names;
  names.reserve(columns.size());
  for (const auto &column : columns) {
    names.push_back(column.name);
  }
  return names;
}

std::string column_definition_sql(const ColumnDescriptor &column) {
  std::string sql = quote_identifier(column.name);
  if (!column.declared_type.empty()) {
    sql += " " + column.declared_type;
  }
  if (column.is_primary_key) {
    sql += " PRIMARY KEY";
  }
  if (!column.nullable) {
    sql += " NOT NULL";
  }
  if (column.default_value) {
    sql += " DEFAULT " + *column.default_value;
  }
  return sql;
}

std::string create_table_sql(const std::string &table, const std::vector<ColumnDescriptor> &columns) {
  std::string sql = "CREATE TABLE " + quote_identifier(table) + " (";
  for (size_t i = 0; i < columns.size(); i++) {
    if (i > 0) sql += ", ";
    sql += column_definition_sql(columns[i]);
  }
  sql += ")";
  return sql;
}

std::string default_literal_sql(ColumnType type, const std::string &raw) {
  switch (type) {
  case ColumnType::Integer: {
    auto value = parse_int64(raw);
    if (!value) {
      throw EvoTableException(ErrorCode::TypeCoercionError,
                              "Default '" + raw + "' is not an integer");
    }
    return std::to_string(*value);
  }
  case ColumnType::Real: {
    auto value = parse_real(raw);
    if (!value) {
      throw EvoTableException(ErrorCode::TypeCoercionError,
                              "Default '" + raw + "' is not a number");
    }
    return format_real(*value);
  }
  case ColumnType::Text:
  case ColumnType::Blob:
    break;
  }

  char *quoted = sqlite3_mprintf("%Q", raw.c_str());
  if (!quoted) {
    throw EvoTableException(ErrorCode::StorageFailure, "Out of memory quoting default value");
  }
  std::string literal(quoted);
  sqlite3_free(quoted);
  return literal;
}

} // namespace evotable
