// sqlite_db.hpp
#ifndef EVOTABLE_SQLITE_DB_HPP
#define EVOTABLE_SQLITE_DB_HPP

#include "field_value.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace evotable {

/// RAII wrapper for sqlite3_stmt*
///
/// Prepares on construction and finalizes on destruction, so statements
/// are cleaned up even when an exception unwinds the caller. Every bind
/// and step result is checked; failures throw EvoTableException with
/// ErrorCode::StorageFailure.
///
/// Usage:
///   Statement stmt(db.get_db(), "SELECT ... WHERE id = ?");
///   stmt.bind_int64(1, id);
///   while (stmt.step()) { ... }
class Statement {
public:
  Statement(sqlite3 *db, const std::string &sql);
  ~Statement();

  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;
  Statement(Statement &&other) noexcept;
  Statement &operator=(Statement &&other) noexcept;

  sqlite3_stmt *get() const { return stmt_; }

  void bind(int index, const FieldValue &value);
  void bind_int64(int index, int64_t value);
  void bind_text(int index, const std::string &value);
  void bind_optional_text(int index, const std::optional<std::string> &value);

  /// Advances the statement
  /// @return true when a row is available, false when the statement is done
  bool step();

  /// Steps a statement that is not expected to return rows
  void run();

  /// Rewinds the statement for another run; bindings are kept
  void reset();

  int column_count() const { return sqlite3_column_count(stmt_); }
  std::string column_name(int index) const;
  FieldValue column_value(int index) const;
  int64_t column_int64(int index) const { return sqlite3_column_int64(stmt_, index); }
  std::optional<std::string> column_text(int index) const;

private:
  void check_bind(int rc, int index);

  sqlite3 *db_;
  sqlite3_stmt *stmt_;
};

/// Owns a SQLite connection
///
/// Thread Safety:
/// Not thread-safe. One Database per writer; the model is a single
/// logical writer per table, with cross-process exclusion provided by the
/// write lock that Transaction takes up front (BEGIN IMMEDIATE).
///
/// Protected tables:
/// Tables registered with protect_table() cannot be updated, deleted
/// from, altered or dropped through this connection. The check is an
/// SQLite authorizer, so it also covers statements issued through
/// execute() by operators.
class Database {
public:
  /// Opens (or creates) the database at path
  /// @throws EvoTableException(StorageFailure) if it cannot be opened
  explicit Database(const std::string &path);
  ~Database();

  Database(const Database &) = delete;
  Database &operator=(const Database &) = delete;

  sqlite3 *get_db() { return db_; }

  /// Executes one or more SQL statements
  /// @throws EvoTableException(StorageFailure) on failure
  void execute(const std::string &sql);

  Statement prepare(const std::string &sql) { return Statement(db_, sql); }

  int64_t last_insert_rowid() const { return sqlite3_last_insert_rowid(db_); }
  int changes() const { return sqlite3_changes(db_); }
  bool in_transaction() const { return sqlite3_get_autocommit(db_) == 0; }

  void protect_table(const std::string &table_name);
  bool is_protected(const char *table_name) const;

  /// Unique savepoint name for a nested Transaction
  std::string next_savepoint_name() { return "evotable_sp_" + std::to_string(++savepoint_seq_); }

  std::string get_error() const;

private:
  static int authorizer_callback(void *ctx, int action_code,
                                 const char *arg1, const char *arg2,
                                 const char *arg3, const char *arg4);

  sqlite3 *db_;
  std::vector<std::string> protected_tables_;
  uint64_t savepoint_seq_;
};

/// One atomic unit of work
///
/// The outermost Transaction issues BEGIN IMMEDIATE so the write lock is
/// held for the whole unit; nested ones use savepoints. Destroying a
/// Transaction that was not committed rolls it back.
class Transaction {
public:
  explicit Transaction(Database &db);
  ~Transaction();

  Transaction(const Transaction &) = delete;
  Transaction &operator=(const Transaction &) = delete;

  void commit();

private:
  void rollback() noexcept;

  Database &db_;
  std::string savepoint_;  // empty for the outermost transaction
  bool finished_;
};

} // namespace evotable

#endif // EVOTABLE_SQLITE_DB_HPP
