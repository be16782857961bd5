// evotable_errors.cpp
#include "evotable_errors.hpp"

namespace evotable {

const char *error_code_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::IdentifierInvalid:
    return "IdentifierInvalid";
  case ErrorCode::ColumnNotFound:
    return "ColumnNotFound";
  case ErrorCode::ColumnExists:
    return "ColumnExists";
  case ErrorCode::PrimaryKeyImmutable:
    return "PrimaryKeyImmutable";
  case ErrorCode::TypeInvalid:
    return "TypeInvalid";
  case ErrorCode::TypeCoercionError:
    return "TypeCoercionError";
  case ErrorCode::MigrationFailure:
    return "MigrationFailure";
  case ErrorCode::RecordNotFound:
    return "RecordNotFound";
  case ErrorCode::VersionNotFound:
    return "VersionNotFound";
  case ErrorCode::FieldNoLongerExists:
    return "FieldNoLongerExists";
  case ErrorCode::StorageFailure:
    return "StorageFailure";
  }
  return "Unknown";
}

} // namespace evotable
