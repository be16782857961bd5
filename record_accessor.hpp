// record_accessor.hpp
#ifndef EVOTABLE_RECORD_ACCESSOR_HPP
#define EVOTABLE_RECORD_ACCESSOR_HPP

#include "field_value.hpp"
#include "schema_introspector.hpp"
#include "sqlite_db.hpp"
#include "table_schema.hpp"
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace evotable {

/// Column name -> value
using FieldValues = std::map<std::string, FieldValue>;

/// One row, keyed by the schema it was read with
struct Record {
  int64_t id = 0;
  TableSchema schema;
  FieldValues values;

  /// @throws EvoTableException(ColumnNotFound)
  const FieldValue &at(const std::string &field) const;

  /// Canonical string form of a field (std::nullopt for NULL)
  std::optional<std::string> canonical(const std::string &field) const;

  /// Display form: cents columns as two-decimal amounts, NULL as ""
  std::string render(const std::string &field) const;
};

/// Filter for RecordAccessor::list
struct RecordQuery {
  // Case-insensitive substring, matched with LIKE
  std::optional<std::string> search;
  // Columns to search; empty means every Text column
  std::vector<std::string> search_columns;
  // Restrict to these primary keys; empty means no restriction
  std::vector<int64_t> ids;
  size_t limit = 100;
};

/// Generic CRUD over rows whose columns are discovered at call time
///
/// Every call reads the live schema first, so a record is never
/// interpreted with a stale column set. Field names from callers are
/// sanitized before lookup; values are always bound, never interpolated.
///
/// Writes run inside one Transaction together with their ledger entries:
/// either the row change and its history both commit or neither does.
///
/// Value coercion (user input):
/// - Integer: integers as-is, integral reals, text that parses as an integer
/// - Real:    any number, text that parses as a finite number
/// - Text:    anything, stored in canonical form
/// - Blob:    blobs, "BLOB:<hex>" text decoded, anything else as given
/// - cents columns (see money.hpp): decimal amounts converted to integer cents
/// Anything else fails with TypeCoercionError.
class RecordAccessor {
public:
  RecordAccessor(Database &db, SchemaIntrospector &introspector)
      : db_(db), introspector_(introspector) {}

  /// Inserts a row and versions every supplied field (old value NULL)
  ///
  /// Omitted columns take their database default; a NOT NULL column with
  /// no default gets 0 (Integer) or "" (Text). An explicit primary key is
  /// accepted and not versioned.
  /// @return id of the new record
  /// @throws EvoTableException ColumnNotFound, TypeCoercionError or StorageFailure
  int64_t create(const std::string &table, const FieldValues &values, const std::string &actor);

  /// @throws EvoTableException(RecordNotFound)
  Record get(const std::string &table, int64_t id) const;

  std::optional<Record> find(const std::string &table, int64_t id) const;

  /// Records matching query, newest (highest primary key) first
  std::vector<Record> list(const std::string &table, const RecordQuery &query) const;

  /// Records for the given ids in the given order; absent ids are skipped
  std::vector<Record> compare(const std::string &table, const std::vector<int64_t> &ids) const;

  /// Applies all changed fields in one statement and versions each one
  ///
  /// A field is changed when its canonical form differs from the stored
  /// one. A blank amount for a cents column leaves that field unchanged.
  /// @return number of ledger entries appended
  /// @throws EvoTableException RecordNotFound, ColumnNotFound,
  ///         PrimaryKeyImmutable or TypeCoercionError
  size_t update(const std::string &table, int64_t id, const FieldValues &values,
                const std::string &actor);

  /// Deletes a record. Not versioned.
  /// @throws EvoTableException(RecordNotFound)
  void remove(const std::string &table, int64_t id);

  /// Writes a stored-form value (as found in the ledger) into one field
  ///
  /// No cents transform is applied and nothing is versioned; the caller
  /// logs the change.
  /// @return canonical value of the field before the write
  /// @throws EvoTableException ColumnNotFound, PrimaryKeyImmutable,
  ///         RecordNotFound or TypeCoercionError
  std::optional<std::string> restore_field(const std::string &table, int64_t id,
                                           const std::string &field,
                                           const std::optional<std::string> &stored);

private:
  TableSchema require_schema(const std::string &table) const;
  std::optional<Record> read_record(const TableSchema &schema, int64_t id) const;

  Database &db_;
  SchemaIntrospector &introspector_;
};

} // namespace evotable

#endif // EVOTABLE_RECORD_ACCESSOR_HPP
