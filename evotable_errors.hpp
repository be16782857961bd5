// evotable_errors.hpp
#ifndef EVOTABLE_ERRORS_HPP
#define EVOTABLE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace evotable {

/// Failure categories reported by every evotable component
enum class ErrorCode {
  IdentifierInvalid,   // a name reached SQL construction without going through the sanitizer
  ColumnNotFound,
  ColumnExists,
  PrimaryKeyImmutable,
  TypeInvalid,         // not one of INTEGER, REAL, TEXT, BLOB
  TypeCoercionError,   // value cannot be stored in the target column
  MigrationFailure,    // schema mutation aborted, live table untouched
  RecordNotFound,
  VersionNotFound,
  FieldNoLongerExists, // rollback target column was dropped or renamed
  StorageFailure       // any other SQLite error
};

/// Stable name of an error code, used in logs and CLI output
const char *error_code_name(ErrorCode code);

/// Exception thrown for all evotable error conditions
///
/// Operations that can fail either return their value or throw this
/// exception; callers switch on code() rather than parsing the message.
class EvoTableException : public std::runtime_error {
public:
  EvoTableException(ErrorCode code, const std::string &msg)
      : std::runtime_error(msg), code_(code) {}

  ErrorCode code() const { return code_; }

private:
  ErrorCode code_;
};

} // namespace evotable

#endif // EVOTABLE_ERRORS_HPP
