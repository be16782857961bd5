// version_ledger.hpp
#ifndef EVOTABLE_VERSION_LEDGER_HPP
#define EVOTABLE_VERSION_LEDGER_HPP

#include "sqlite_db.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace evotable {

/// One field-level change, in canonical string form
struct FieldDiff {
  std::string field;
  std::optional<std::string> old_value;
  std::optional<std::string> new_value;
};

/// A committed change of one field of one record
struct VersionEntry {
  uint64_t id = 0;
  int64_t record_id = 0;
  std::string field_name;
  std::optional<std::string> old_value;
  std::optional<std::string> new_value;
  std::string changed_at;  // ISO-8601 UTC, microsecond precision
  std::string changed_by;
};

/// Attributes a ledger listing can be sorted by
enum class VersionSortField { Id, RecordId, FieldName, OldValue, NewValue, ChangedAt, ChangedBy };

enum class SortOrder { Ascending, Descending };

/// Parses a ledger column name ("id", "record_id", "changed_at", ...)
/// @throws EvoTableException(IdentifierInvalid) for anything else
VersionSortField parse_version_sort_field(const std::string &name);

/// Parses "asc"/"ascending" or "desc"/"descending" (case-insensitive)
/// @throws EvoTableException(IdentifierInvalid) for anything else
SortOrder parse_sort_order(const std::string &name);

/// Current UTC time as used for changed_at, e.g. 2024-05-01T12:30:00.123456
std::string utc_timestamp();

/// Append-only store of per-field change events
///
/// Physical layout (a compatibility contract for external reporting):
///   <table>_field_versions (id, record_id, field_name, old_value,
///                           new_value, changed_at, changed_by)
/// id is an AUTOINCREMENT key, so ids strictly increase and are never
/// reused. The table is registered as protected on the Database, so
/// UPDATE, DELETE, ALTER and DROP against it are refused.
///
/// A ledger entry names its field but does not reference a column: after
/// a column is dropped its history remains listed.
class VersionLedger {
public:
  VersionLedger(Database &db, const std::string &table);

  const std::string &ledger_table() const { return ledger_table_; }

  /// Creates the ledger table and its index if missing, and protects it
  void ensure_table();

  /// Appends one entry per diff, all with the same timestamp
  /// @return ids of the appended entries, in diff order (empty for no diffs)
  std::vector<uint64_t> record(int64_t record_id, const std::vector<FieldDiff> &diffs,
                               const std::string &actor);

  /// Lists entries, optionally for one record, sorted then truncated to limit
  ///
  /// Ties on the sort field are broken by id in the same direction.
  std::vector<VersionEntry> list(std::optional<int64_t> record_id, size_t limit,
                                 VersionSortField sort_field = VersionSortField::Id,
                                 SortOrder order = SortOrder::Descending) const;

  std::optional<VersionEntry> get_by_id(uint64_t id) const;

  /// Number of entries in the ledger
  size_t count() const;

  /// Ledger table name used for table
  static std::string ledger_table_name(const std::string &table);

private:
  Database &db_;
  std::string ledger_table_;
};

} // namespace evotable

#endif // EVOTABLE_VERSION_LEDGER_HPP
