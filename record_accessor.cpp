// record_accessor.cpp
#include "record_accessor.hpp"
#include "evotable_errors.hpp"
#include "identifier.hpp"
#include "money.hpp"
#include "version_ledger.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <set>

namespace evotable {

namespace {

[[noreturn]] void coercion_failed(const ColumnDescriptor &column, const FieldValue &value) {
  throw EvoTableException(ErrorCode::TypeCoercionError,
                          "Value " + value.to_string() + " cannot be stored in " +
                              column_type_sql(column.type) + " column " + column.name);
}

bool is_cents(const ColumnDescriptor &column) {
  return column.type == ColumnType::Integer && is_cents_column(column.name);
}

bool is_blank(const FieldValue &value) {
  if (value.type != FieldValue::TEXT) return false;
  for (char c : value.text_val) {
    if (!std::isspace(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

/// Converts value to the representation stored in column
FieldValue coerce(const ColumnDescriptor &column, const FieldValue &value, bool apply_cents) {
  if (value.is_null()) {
    if (!column.nullable) {
      throw EvoTableException(ErrorCode::TypeCoercionError, "Column " + column.name + " cannot be NULL");
    }
    return value;
  }

  if (apply_cents && is_cents(column)) {
    return FieldValue::integer(cents_from_value(value));
  }

  switch (column.type) {
  case ColumnType::Integer:
    switch (value.type) {
    case FieldValue::INTEGER:
      return value;
    case FieldValue::REAL:
      // 2^63 is exactly representable; anything at or above it does not fit
      if (std::trunc(value.real_val) == value.real_val && value.real_val >= -9223372036854775808.0 &&
          value.real_val < 9223372036854775808.0) {
        return FieldValue::integer(static_cast<int64_t>(value.real_val));
      }
      break;
    case FieldValue::TEXT:
      if (auto parsed = parse_int64(value.text_val)) {
        return FieldValue::integer(*parsed);
      }
      break;
    default:
      break;
    }
    coercion_failed(column, value);

  case ColumnType::Real:
    switch (value.type) {
    case FieldValue::INTEGER:
      return FieldValue::real(static_cast<double>(value.int_val));
    case FieldValue::REAL:
      return value;
    case FieldValue::TEXT:
      if (auto parsed = parse_real(value.text_val)) {
        return FieldValue::real(*parsed);
      }
      break;
    default:
      break;
    }
    coercion_failed(column, value);

  case ColumnType::Text:
    if (value.type == FieldValue::TEXT) {
      return value;
    }
    return FieldValue::text(*value.canonical());

  case ColumnType::Blob:
    if (value.type == FieldValue::TEXT) {
      if (auto bytes = decode_blob(value.text_val)) {
        return FieldValue::blob(std::move(*bytes));
      }
    }
    return value;
  }
  coercion_failed(column, value);
}

/// Value a NOT NULL column without default gets when omitted on create
FieldValue zero_value(const ColumnDescriptor &column) {
  switch (column.type) {
  case ColumnType::Integer:
    return FieldValue::integer(0);
  case ColumnType::Text:
    return FieldValue::text("");
  default:
    return FieldValue::null();
  }
}

/// Resolves a caller-supplied field name against the schema
const ColumnDescriptor &require_column(const TableSchema &schema, const std::string &raw_name) {
  std::string name = sanitize_identifier(raw_name);
  const ColumnDescriptor *column = schema.find(name);
  if (!column) {
    throw EvoTableException(ErrorCode::ColumnNotFound, "Column " + name + " not found in " + schema.table);
  }
  return *column;
}

/// Two caller names may sanitize or fold to the same column
void require_unique(std::set<std::string> &seen, const ColumnDescriptor &column) {
  if (!seen.insert(column.name).second) {
    throw EvoTableException(ErrorCode::ColumnExists, "Field " + column.name + " given more than once");
  }
}

std::string select_columns_sql(const TableSchema &schema) {
  std::string sql = "SELECT ";
  for (size_t i = 0; i < schema.columns.size(); i++) {
    if (i > 0) sql += ", ";
    sql += quote_identifier(schema.columns[i].name);
  }
  sql += " FROM " + quote_identifier(schema.table);
  return sql;
}

Record read_row(const TableSchema &schema, const Statement &stmt) {
  Record record;
  record.schema = schema;
  for (size_t i = 0; i < schema.columns.size(); i++) {
    const ColumnDescriptor &column = schema.columns[i];
    FieldValue value = stmt.column_value(static_cast<int>(i));
    if (column.is_primary_key && value.type == FieldValue::INTEGER) {
      record.id = value.int_val;
    }
    record.values[column.name] = std::move(value);
  }
  return record;
}

/// Escapes LIKE wildcards with '\'
std::string like_pattern(const std::string &term) {
  std::string pattern = "%";
  for (char c : term) {
    if (c == '%' || c == '_' || c == '\\') pattern += '\\';
    pattern += c;
  }
  pattern += '%';
  return pattern;
}

} // namespace

const FieldValue &Record::at(const std::string &field) const {
  auto it = values.find(field);
  if (it == values.end()) {
    throw EvoTableException(ErrorCode::ColumnNotFound, "Column " + field + " not found in " + schema.table);
  }
  return it->second;
}

std::optional<std::string> Record::canonical(const std::string &field) const {
  return at(field).canonical();
}

std::string Record::render(const std::string &field) const {
  const FieldValue &value = at(field);
  if (value.is_null()) {
    return "";
  }
  const ColumnDescriptor *column = schema.find(field);
  if (column && is_cents(*column) && value.type == FieldValue::INTEGER) {
    return format_cents(value.int_val);
  }
  return *value.canonical();
}

TableSchema RecordAccessor::require_schema(const std::string &table) const {
  TableSchema schema = introspector_.list_columns(table);
  if (schema.empty()) {
    throw EvoTableException(ErrorCode::StorageFailure, "Table does not exist: " + table);
  }
  return schema;
}

std::optional<Record> RecordAccessor::read_record(const TableSchema &schema, int64_t id) const {
  Statement stmt = db_.prepare(select_columns_sql(schema) + " WHERE " +
                               quote_identifier(schema.primary_key().name) + " = ?");
  stmt.bind_int64(1, id);
  if (!stmt.step()) {
    return std::nullopt;
  }
  Record record = read_row(schema, stmt);
  record.id = id;
  return record;
}

int64_t RecordAccessor::create(const std::string &table, const FieldValues &values,
                               const std::string &actor) {
  Transaction txn(db_);
  TableSchema schema = require_schema(table);
  const ColumnDescriptor &pk = schema.primary_key();

  FieldValues supplied;
  std::set<std::string> seen;
  for (const auto &[raw_name, value] : values) {
    const ColumnDescriptor &column = require_column(schema, raw_name);
    require_unique(seen, column);
    if (is_cents(column) && is_blank(value)) {
      supplied[column.name] = FieldValue::integer(0);
    } else {
      supplied[column.name] = coerce(column, value, true);
    }
  }

  std::vector<std::string> names;
  std::vector<FieldValue> row;
  std::vector<FieldDiff> diffs;
  for (const auto &column : schema.columns) {
    auto it = supplied.find(column.name);
    if (it != supplied.end()) {
      names.push_back(column.name);
      row.push_back(it->second);
      if (!column.is_primary_key) {
        diffs.push_back({column.name, std::nullopt, it->second.canonical()});
      }
    } else if (!column.is_primary_key && !column.nullable && !column.default_value) {
      names.push_back(column.name);
      row.push_back(zero_value(column));
    }
  }

  std::string sql = "INSERT INTO " + quote_identifier(table);
  if (names.empty()) {
    sql += " DEFAULT VALUES";
  } else {
    std::string placeholders;
    sql += " (";
    for (size_t i = 0; i < names.size(); i++) {
      if (i > 0) {
        sql += ", ";
        placeholders += ", ";
      }
      sql += quote_identifier(names[i]);
      placeholders += "?";
    }
    sql += ") VALUES (" + placeholders + ")";
  }

  Statement stmt = db_.prepare(sql);
  for (size_t i = 0; i < row.size(); i++) {
    stmt.bind(static_cast<int>(i + 1), row[i]);
  }
  stmt.run();

  int64_t id = db_.last_insert_rowid();
  auto explicit_pk = supplied.find(pk.name);
  if (explicit_pk != supplied.end() && explicit_pk->second.type == FieldValue::INTEGER) {
    id = explicit_pk->second.int_val;
  }

  VersionLedger(db_, table).record(id, diffs, actor);
  txn.commit();
  return id;
}

Record RecordAccessor::get(const std::string &table, int64_t id) const {
  auto record = find(table, id);
  if (!record) {
    throw EvoTableException(ErrorCode::RecordNotFound,
                            "Record " + std::to_string(id) + " not found in " + table);
  }
  return std::move(*record);
}

std::optional<Record> RecordAccessor::find(const std::string &table, int64_t id) const {
  return read_record(require_schema(table), id);
}

std::vector<Record> RecordAccessor::list(const std::string &table, const RecordQuery &query) const {
  std::vector<Record> records;
  if (query.limit == 0) {
    return records;
  }

  TableSchema schema = require_schema(table);
  const std::string pk = quote_identifier(schema.primary_key().name);

  std::vector<std::string> conditions;
  std::vector<FieldValue> params;

  if (query.search && !query.search->empty()) {
    std::vector<std::string> columns;
    if (query.search_columns.empty()) {
      for (const auto &column : schema.columns) {
        if (column.type == ColumnType::Text) columns.push_back(column.name);
      }
    } else {
      for (const auto &raw_name : query.search_columns) {
        columns.push_back(require_column(schema, raw_name).name);
      }
    }
    if (columns.empty()) {
      return records;
    }

    std::string clause = "(";
    for (size_t i = 0; i < columns.size(); i++) {
      if (i > 0) clause += " OR ";
      clause += quote_identifier(columns[i]) + " LIKE ? ESCAPE '\\'";
      params.push_back(FieldValue::text(like_pattern(*query.search)));
    }
    conditions.push_back(clause + ")");
  }

  if (!query.ids.empty()) {
    std::string clause = pk + " IN (";
    for (size_t i = 0; i < query.ids.size(); i++) {
      if (i > 0) clause += ", ";
      clause += "?";
      params.push_back(FieldValue::integer(query.ids[i]));
    }
    conditions.push_back(clause + ")");
  }

  std::string sql = select_columns_sql(schema);
  for (size_t i = 0; i < conditions.size(); i++) {
    sql += (i == 0 ? " WHERE " : " AND ") + conditions[i];
  }
  sql += " ORDER BY " + pk + " DESC LIMIT ?";

  Statement stmt = db_.prepare(sql);
  int index = 1;
  for (const auto &param : params) {
    stmt.bind(index++, param);
  }
  constexpr size_t max_limit = static_cast<size_t>(INT64_MAX);
  stmt.bind_int64(index, static_cast<int64_t>(std::min(query.limit, max_limit)));

  while (stmt.step()) {
    records.push_back(read_row(schema, stmt));
  }
  return records;
}

std::vector<Record> RecordAccessor::compare(const std::string &table,
                                            const std::vector<int64_t> &ids) const {
  TableSchema schema = require_schema(table);
  std::vector<Record> records;
  for (int64_t id : ids) {
    if (auto record = read_record(schema, id)) {
      records.push_back(std::move(*record));
    }
  }
  return records;
}

size_t RecordAccessor::update(const std::string &table, int64_t id, const FieldValues &values,
                              const std::string &actor) {
  Transaction txn(db_);
  TableSchema schema = require_schema(table);
  auto current = read_record(schema, id);
  if (!current) {
    throw EvoTableException(ErrorCode::RecordNotFound,
                            "Record " + std::to_string(id) + " not found in " + table);
  }

  FieldValues changes;
  std::set<std::string> seen;
  for (const auto &[raw_name, value] : values) {
    const ColumnDescriptor &column = require_column(schema, raw_name);
    require_unique(seen, column);
    if (column.is_primary_key) {
      throw EvoTableException(ErrorCode::PrimaryKeyImmutable,
                              "Column " + column.name + " is the primary key of " + table);
    }
    if (is_cents(column) && is_blank(value)) {
      continue;
    }
    changes[column.name] = coerce(column, value, true);
  }

  std::vector<std::string> names;
  std::vector<FieldValue> row;
  std::vector<FieldDiff> diffs;
  for (const auto &column : schema.columns) {
    auto it = changes.find(column.name);
    if (it == changes.end()) continue;
    std::optional<std::string> old_value = current->canonical(column.name);
    std::optional<std::string> new_value = it->second.canonical();
    if (old_value == new_value) continue;
    names.push_back(column.name);
    row.push_back(it->second);
    diffs.push_back({column.name, std::move(old_value), std::move(new_value)});
  }

  if (diffs.empty()) {
    return 0;
  }

  std::string sql = "UPDATE " + quote_identifier(table) + " SET ";
  for (size_t i = 0; i < names.size(); i++) {
    if (i > 0) sql += ", ";
    sql += quote_identifier(names[i]) + " = ?";
  }
  sql += " WHERE " + quote_identifier(schema.primary_key().name) + " = ?";

  Statement stmt = db_.prepare(sql);
  int index = 1;
  for (const auto &value : row) {
    stmt.bind(index++, value);
  }
  stmt.bind_int64(index, id);
  stmt.run();

  VersionLedger(db_, table).record(id, diffs, actor);
  txn.commit();
  return diffs.size();
}

void RecordAccessor::remove(const std::string &table, int64_t id) {
  Transaction txn(db_);
  TableSchema schema = require_schema(table);
  Statement stmt = db_.prepare("DELETE FROM " + quote_identifier(table) + " WHERE " +
                               quote_identifier(schema.primary_key().name) + " = ?");
  stmt.bind_int64(1, id);
  stmt.run();
  if (db_.changes() == 0) {
    throw EvoTableException(ErrorCode::RecordNotFound,
                            "Record " + std::to_string(id) + " not found in " + table);
  }
  txn.commit();
  spdlog::info("evotable: deleted record {} from {}", id, table);
}

std::optional<std::string> RecordAccessor::restore_field(const std::string &table, int64_t id,
                                                         const std::string &field,
                                                         const std::optional<std::string> &stored) {
  Transaction txn(db_);
  TableSchema schema = require_schema(table);
  const ColumnDescriptor &column = require_column(schema, field);
  if (column.is_primary_key) {
    throw EvoTableException(ErrorCode::PrimaryKeyImmutable,
                            "Column " + column.name + " is the primary key of " + table);
  }
  auto current = read_record(schema, id);
  if (!current) {
    throw EvoTableException(ErrorCode::RecordNotFound,
                            "Record " + std::to_string(id) + " not found in " + table);
  }

  FieldValue value = stored ? coerce(column, FieldValue::text(*stored), false) : FieldValue::null();
  if (value.is_null() && !column.nullable) {
    throw EvoTableException(ErrorCode::TypeCoercionError, "Column " + column.name + " cannot be NULL");
  }

  Statement stmt = db_.prepare("UPDATE " + quote_identifier(table) + " SET " +
                               quote_identifier(column.name) + " = ? WHERE " +
                               quote_identifier(schema.primary_key().name) + " = ?");
  stmt.bind(1, value);
  stmt.bind_int64(2, id);
  stmt.run();
  txn.commit();
  return current->canonical(column.name);
}

} // namespace evotable
