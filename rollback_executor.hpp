// rollback_executor.hpp
#ifndef EVOTABLE_ROLLBACK_EXECUTOR_HPP
#define EVOTABLE_ROLLBACK_EXECUTOR_HPP

#include "record_accessor.hpp"
#include "schema_introspector.hpp"
#include "sqlite_db.hpp"
#include "version_ledger.hpp"
#include <cstdint>
#include <string>

namespace evotable {

enum class RollbackState { Requested, Validated, Applied, Logged, Rejected };

const char *rollback_state_name(RollbackState state);

/// Restores a field to the old value of a ledger entry
///
/// Requested -> Validated -> Applied -> Logged, or Requested -> Rejected.
///
/// Validation requires the entry to exist (VersionNotFound) and its field
/// to still be a column of the table (FieldNoLongerExists). The field is
/// then set to the entry's old value and a new forward entry is appended;
/// the original entry is never touched, so a rollback can itself be
/// rolled back.
///
/// Everything runs in one Transaction: a rejected or failed rollback
/// leaves both the record and the ledger unchanged.
class RollbackExecutor {
public:
  RollbackExecutor(Database &db, SchemaIntrospector &introspector, RecordAccessor &records,
                   VersionLedger &ledger, std::string table)
      : db_(db), introspector_(introspector), records_(records), ledger_(ledger),
        table_(std::move(table)) {}

  /// @return the appended ledger entry
  /// @throws EvoTableException VersionNotFound, FieldNoLongerExists,
  ///         RecordNotFound, PrimaryKeyImmutable or TypeCoercionError
  VersionEntry rollback(uint64_t version_id, const std::string &actor);

private:
  void transition(uint64_t version_id, RollbackState state);

  Database &db_;
  SchemaIntrospector &introspector_;
  RecordAccessor &records_;
  VersionLedger &ledger_;
  std::string table_;
};

} // namespace evotable

#endif // EVOTABLE_ROLLBACK_EXECUTOR_HPP
