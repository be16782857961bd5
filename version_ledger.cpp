// version_ledger.cpp
#include "version_ledger.hpp"
#include "evotable_errors.hpp"
#include "identifier.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>

namespace evotable {

namespace {

const char *sort_column(VersionSortField field) {
  switch (field) {
  case VersionSortField::Id:
    return "id";
  case VersionSortField::RecordId:
    return "record_id";
  case VersionSortField::FieldName:
    return "field_name";
  case VersionSortField::OldValue:
    return "old_value";
  case VersionSortField::NewValue:
    return "new_value";
  case VersionSortField::ChangedAt:
    return "changed_at";
  case VersionSortField::ChangedBy:
    return "changed_by";
  }
  return "id";
}

std::string to_lower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return str;
}

constexpr const char *SELECT_COLUMNS =
    "SELECT id, record_id, field_name, old_value, new_value, changed_at, changed_by FROM ";

VersionEntry read_entry(const Statement &stmt) {
  VersionEntry entry;
  entry.id = static_cast<uint64_t>(stmt.column_int64(0));
  entry.record_id = stmt.column_int64(1);
  entry.field_name = stmt.column_text(2).value_or("");
  entry.old_value = stmt.column_text(3);
  entry.new_value = stmt.column_text(4);
  entry.changed_at = stmt.column_text(5).value_or("");
  entry.changed_by = stmt.column_text(6).value_or("");
  return entry;
}

} // namespace

VersionSortField parse_version_sort_field(const std::string &name) {
  std::string lower = to_lower(name);
  if (lower == "id") return VersionSortField::Id;
  if (lower == "record_id") return VersionSortField::RecordId;
  if (lower == "field_name") return VersionSortField::FieldName;
  if (lower == "old_value") return VersionSortField::OldValue;
  if (lower == "new_value") return VersionSortField::NewValue;
  if (lower == "changed_at" || lower == "timestamp") return VersionSortField::ChangedAt;
  if (lower == "changed_by" || lower == "actor") return VersionSortField::ChangedBy;
  throw EvoTableException(ErrorCode::IdentifierInvalid, "Cannot sort versions by '" + name + "'");
}

SortOrder parse_sort_order(const std::string &name) {
  std::string lower = to_lower(name);
  if (lower == "asc" || lower == "ascending") return SortOrder::Ascending;
  if (lower == "desc" || lower == "descending") return SortOrder::Descending;
  throw EvoTableException(ErrorCode::IdentifierInvalid, "Invalid sort order '" + name + "'");
}

std::string utc_timestamp() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
#if defined(_WIN32)
  const bool converted = gmtime_s(&tm, &seconds) == 0;
#else
  const bool converted = gmtime_r(&seconds, &tm) != nullptr;
#endif
  if (!converted) {
    throw EvoTableException(ErrorCode::StorageFailure, "Cannot convert the current time to UTC");
  }

  const auto fraction = now - std::chrono::system_clock::from_time_t(seconds);
  const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(fraction).count();
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(6) << micros;
  return oss.str();
}

std::string VersionLedger::ledger_table_name(const std::string &table) {
  return table + "_field_versions";
}

VersionLedger::VersionLedger(Database &db, const std::string &table)
    : db_(db), ledger_table_(ledger_table_name(table)) {
  quote_identifier(ledger_table_);
}

void VersionLedger::ensure_table() {
  const std::string quoted = quote_identifier(ledger_table_);
  std::string create_ledger = R"(
    CREATE TABLE IF NOT EXISTS )" + quoted + R"( (
      id INTEGER PRIMARY KEY AUTOINCREMENT,
      record_id INTEGER,
      field_name TEXT,
      old_value TEXT,
      new_value TEXT,
      changed_at TEXT,
      changed_by TEXT
    )
  )";
  db_.execute(create_ledger);

  std::string create_idx = "CREATE INDEX IF NOT EXISTS " + quote_identifier(ledger_table_ + "_record_idx") +
                           " ON " + quoted + "(record_id)";
  db_.execute(create_idx);

  db_.protect_table(ledger_table_);
}

std::vector<uint64_t> VersionLedger::record(int64_t record_id, const std::vector<FieldDiff> &diffs,
                                            const std::string &actor) {
  std::vector<uint64_t> ids;
  if (diffs.empty()) {
    return ids;
  }

  const std::string changed_at = utc_timestamp();
  Transaction txn(db_);
  Statement stmt = db_.prepare("INSERT INTO " + quote_identifier(ledger_table_) +
                               " (record_id, field_name, old_value, new_value, changed_at, changed_by)"
                               " VALUES (?, ?, ?, ?, ?, ?)");
  for (const auto &diff : diffs) {
    stmt.reset();
    stmt.bind_int64(1, record_id);
    stmt.bind_text(2, diff.field);
    stmt.bind_optional_text(3, diff.old_value);
    stmt.bind_optional_text(4, diff.new_value);
    stmt.bind_text(5, changed_at);
    stmt.bind_text(6, actor);
    stmt.run();
    ids.push_back(static_cast<uint64_t>(db_.last_insert_rowid()));
    spdlog::debug("evotable: ledger #{} record {} field {}: {} -> {}", ids.back(), record_id,
                  diff.field, diff.old_value.value_or("NULL"), diff.new_value.value_or("NULL"));
  }
  txn.commit();
  return ids;
}

std::vector<VersionEntry> VersionLedger::list(std::optional<int64_t> record_id, size_t limit,
                                              VersionSortField sort_field, SortOrder order) const {
  std::vector<VersionEntry> entries;
  if (limit == 0) {
    return entries;
  }

  const char *direction = order == SortOrder::Ascending ? "ASC" : "DESC";
  std::string query = SELECT_COLUMNS + quote_identifier(ledger_table_);
  if (record_id) {
    query += " WHERE record_id = ?";
  }
  query += std::string(" ORDER BY ") + sort_column(sort_field) + " " + direction;
  if (sort_field != VersionSortField::Id) {
    query += std::string(", id ") + direction;
  }
  query += " LIMIT ?";

  Statement stmt = db_.prepare(query);
  int param = 1;
  if (record_id) {
    stmt.bind_int64(param++, *record_id);
  }
  constexpr size_t max_limit = static_cast<size_t>(std::numeric_limits<int64_t>::max());
  stmt.bind_int64(param, static_cast<int64_t>(std::min(limit, max_limit)));

  while (stmt.step()) {
    entries.push_back(read_entry(stmt));
  }
  return entries;
}

std::optional<VersionEntry> VersionLedger::get_by_id(uint64_t id) const {
  Statement stmt = db_.prepare(SELECT_COLUMNS + quote_identifier(ledger_table_) + " WHERE id = ?");
  stmt.bind_int64(1, static_cast<int64_t>(id));
  if (stmt.step()) {
    return read_entry(stmt);
  }
  return std::nullopt;
}

size_t VersionLedger::count() const {
  Statement stmt = db_.prepare("SELECT COUNT(*) FROM " + quote_identifier(ledger_table_));
  if (stmt.step()) {
    return static_cast<size_t>(stmt.column_int64(0));
  }
  return 0;
}

} // namespace evotable
