// field_value.hpp
#ifndef EVOTABLE_FIELD_VALUE_HPP
#define EVOTABLE_FIELD_VALUE_HPP

#include <sqlite3.h>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace evotable {

/// Represents a SQLite value with type information
///
/// The canonical string form is what the ledger stores and what update
/// diffs compare. NULL has no canonical form (std::nullopt), which keeps
/// "no value" distinct from the empty string.
struct FieldValue {
  enum Type { NULL_TYPE, INTEGER, REAL, TEXT, BLOB };

  Type type;
  int64_t int_val;
  double real_val;
  std::string text_val;
  std::vector<uint8_t> blob_val;

  FieldValue() : type(NULL_TYPE), int_val(0), real_val(0.0) {}

  static FieldValue null() { return FieldValue(); }
  static FieldValue integer(int64_t v);
  static FieldValue real(double v);
  static FieldValue text(std::string v);
  static FieldValue blob(std::vector<uint8_t> v);

  static FieldValue from_sqlite(sqlite3_value *val);

  bool is_null() const { return type == NULL_TYPE; }

  /// Canonical string form; BLOB is hex encoded with a "BLOB:" prefix
  std::optional<std::string> canonical() const;

  /// Canonical form, or "NULL" for display
  std::string to_string() const;

  /// Binds this value to a statement parameter (1-based index)
  int bind(sqlite3_stmt *stmt, int index) const;

  bool operator==(const FieldValue &other) const { return canonical() == other.canonical() && type == other.type; }
};

/// Parses a whole string (surrounding ASCII whitespace allowed) as a
/// base-10 signed 64-bit integer
std::optional<int64_t> parse_int64(std::string_view str);

/// Parses a whole string (surrounding ASCII whitespace allowed) as a finite double
std::optional<double> parse_real(std::string_view str);

/// Shortest decimal representation that round-trips to the same double
std::string format_real(double v);

/// Decodes the "BLOB:<hex>" canonical form; std::nullopt if malformed
std::optional<std::vector<uint8_t>> decode_blob(std::string_view str);

} // namespace evotable

#endif // EVOTABLE_FIELD_VALUE_HPP
