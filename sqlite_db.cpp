// sqlite_db.cpp
#include "sqlite_db.hpp"
#include "evotable_errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace evotable {

// Statement implementation

Statement::Statement(sqlite3 *db, const std::string &sql) : db_(db), stmt_(nullptr) {
  int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr);
  if (rc != SQLITE_OK) {
    std::string error = "Failed to prepare statement: " + std::string(sqlite3_errmsg(db_));
    if (stmt_) {
      sqlite3_finalize(stmt_);
      stmt_ = nullptr;
    }
    throw EvoTableException(ErrorCode::StorageFailure, error);
  }
}

Statement::~Statement() {
  if (stmt_) sqlite3_finalize(stmt_);
}

Statement::Statement(Statement &&other) noexcept : db_(other.db_), stmt_(other.stmt_) {
  other.stmt_ = nullptr;
}

Statement &Statement::operator=(Statement &&other) noexcept {
  if (this != &other) {
    if (stmt_) sqlite3_finalize(stmt_);
    db_ = other.db_;
    stmt_ = other.stmt_;
    other.stmt_ = nullptr;
  }
  return *this;
}

void Statement::check_bind(int rc, int index) {
  if (rc != SQLITE_OK) {
    throw EvoTableException(ErrorCode::StorageFailure,
                            "Failed to bind parameter " + std::to_string(index) + ": " +
                                sqlite3_errmsg(db_));
  }
}

void Statement::bind(int index, const FieldValue &value) {
  check_bind(value.bind(stmt_, index), index);
}

void Statement::bind_int64(int index, int64_t value) {
  check_bind(sqlite3_bind_int64(stmt_, index, value), index);
}

void Statement::bind_text(int index, const std::string &value) {
  check_bind(sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                               SQLITE_TRANSIENT),
             index);
}

void Statement::bind_optional_text(int index, const std::optional<std::string> &value) {
  if (value) {
    bind_text(index, *value);
  } else {
    check_bind(sqlite3_bind_null(stmt_, index), index);
  }
}

bool Statement::step() {
  int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW) {
    return true;
  }
  if (rc == SQLITE_DONE) {
    return false;
  }
  throw EvoTableException(ErrorCode::StorageFailure,
                          "SQL execution failed: " + std::string(sqlite3_errmsg(db_)));
}

void Statement::run() {
  while (step()) {
  }
}

void Statement::reset() {
  int rc = sqlite3_reset(stmt_);
  if (rc != SQLITE_OK) {
    throw EvoTableException(ErrorCode::StorageFailure,
                            "Failed to reset statement: " + std::string(sqlite3_errmsg(db_)));
  }
}

std::string Statement::column_name(int index) const {
  const char *name = sqlite3_column_name(stmt_, index);
  return name ? name : "";
}

FieldValue Statement::column_value(int index) const {
  return FieldValue::from_sqlite(sqlite3_column_value(stmt_, index));
}

std::optional<std::string> Statement::column_text(int index) const {
  if (sqlite3_column_type(stmt_, index) == SQLITE_NULL) {
    return std::nullopt;
  }
  const char *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt_, index));
  int bytes = sqlite3_column_bytes(stmt_, index);
  return std::string(text, static_cast<size_t>(bytes));
}

// Database implementation

Database::Database(const std::string &path) : db_(nullptr), savepoint_seq_(0) {
  int rc = sqlite3_open_v2(path.c_str(), &db_,
                           SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                           nullptr);
  if (rc != SQLITE_OK) {
    std::string error = "Failed to open database: " + std::string(sqlite3_errmsg(db_));
    sqlite3_close(db_);
    throw EvoTableException(ErrorCode::StorageFailure, error);
  }

  try {
    execute("PRAGMA foreign_keys = ON");
    execute("PRAGMA journal_mode=WAL");
  } catch (const EvoTableException &) {
    sqlite3_close(db_);
    throw;
  }

  sqlite3_set_authorizer(db_, authorizer_callback, this);
}

Database::~Database() {
  if (db_) {
    sqlite3_close(db_);
  }
}

void Database::execute(const std::string &sql) {
  char *err_msg = nullptr;
  int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string error = "SQL execution failed: ";
    if (err_msg) {
      error += err_msg;
      sqlite3_free(err_msg);
    } else {
      error += sqlite3_errmsg(db_);
    }
    throw EvoTableException(ErrorCode::StorageFailure, error);
  }
}

void Database::protect_table(const std::string &table_name) {
  if (!is_protected(table_name.c_str())) {
    protected_tables_.push_back(table_name);
  }
}

bool Database::is_protected(const char *table_name) const {
  if (!table_name) {
    return false;
  }
  // SQLite identifiers are case-insensitive
  return std::any_of(protected_tables_.begin(), protected_tables_.end(),
                     [table_name](const std::string &name) {
                       return sqlite3_stricmp(name.c_str(), table_name) == 0;
                     });
}

std::string Database::get_error() const {
  return sqlite3_errmsg(db_);
}

int Database::authorizer_callback(void *ctx, int action_code,
                                  const char *arg1, const char *arg2,
                                  const char * /*arg3*/, const char * /*arg4*/) {
  auto *self = static_cast<Database *>(ctx);

  if (self->protected_tables_.empty()) {
    return SQLITE_OK;
  }

  switch (action_code) {
  // arg1 = table name
  case SQLITE_UPDATE:
  case SQLITE_DELETE:
  case SQLITE_DROP_TABLE:
    if (self->is_protected(arg1)) {
      return SQLITE_DENY;
    }
    break;
  // arg1 = database name, arg2 = table name
  case SQLITE_ALTER_TABLE:
    if (self->is_protected(arg2)) {
      return SQLITE_DENY;
    }
    break;
  default:
    break;
  }

  return SQLITE_OK;
}

// Transaction implementation

Transaction::Transaction(Database &db) : db_(db), finished_(false) {
  if (db_.in_transaction()) {
    savepoint_ = db_.next_savepoint_name();
    db_.execute("SAVEPOINT " + savepoint_);
  } else {
    db_.execute("BEGIN IMMEDIATE");
  }
}

Transaction::~Transaction() {
  if (!finished_) {
    rollback();
  }
}

void Transaction::commit() {
  if (finished_) {
    throw EvoTableException(ErrorCode::StorageFailure, "Transaction already finished");
  }
  if (savepoint_.empty()) {
    db_.execute("COMMIT");
  } else {
    db_.execute("RELEASE " + savepoint_);
  }
  finished_ = true;
}

void Transaction::rollback() noexcept {
  finished_ = true;
  std::string sql;
  if (savepoint_.empty()) {
    // SQLite may already have rolled back on its own (e.g. SQLITE_FULL)
    if (!db_.in_transaction()) {
      return;
    }
    sql = "ROLLBACK";
  } else {
    sql = "ROLLBACK TO " + savepoint_ + "; RELEASE " + savepoint_;
  }

  char *err_msg = nullptr;
  int rc = sqlite3_exec(db_.get_db(), sql.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    spdlog::error("evotable: rollback failed: {}", err_msg ? err_msg : db_.get_error());
    if (err_msg) {
      sqlite3_free(err_msg);
    }
  }
}

} // namespace evotable
