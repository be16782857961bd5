// column_planner.hpp
#ifndef EVOTABLE_COLUMN_PLANNER_HPP
#define EVOTABLE_COLUMN_PLANNER_HPP

#include "schema_introspector.hpp"
#include "sqlite_db.hpp"
#include "table_rebuilder.hpp"
#include <optional>
#include <string>

namespace evotable {

/// Decides how a requested column change is applied
///
/// Schema migration support:
/// - ADD COLUMN    - additive fast path (ALTER TABLE ADD COLUMN), no existing data touched
/// - DROP COLUMN   - full rebuild through TableRebuilder
/// - MODIFY COLUMN - rename/retype/new default, full rebuild through TableRebuilder
/// - primary key   - never dropped or modified (PrimaryKeyImmutable)
///
/// Column names are sanitized here; callers pass raw user input.
class ColumnPlanner {
public:
  ColumnPlanner(Database &db, SchemaIntrospector &introspector, TableRebuilder &rebuilder)
      : db_(db), introspector_(introspector), rebuilder_(rebuilder) {}

  /// Appends a nullable column with an optional default
  ///
  /// @throws EvoTableException TypeInvalid, ColumnExists, IdentifierInvalid
  ///         (name sanitizes to nothing), TypeCoercionError (default does
  ///         not fit the type) or MigrationFailure
  void add_column(const std::string &table, const std::string &name, const std::string &type,
                  const std::optional<std::string> &default_value);

  /// Removes a column by rebuilding the table without it
  ///
  /// The dropped column's values are gone for good; ledger history for it
  /// stays but can no longer be rolled back.
  /// @throws EvoTableException ColumnNotFound, PrimaryKeyImmutable or MigrationFailure
  void drop_column(const std::string &table, const std::string &name);

  /// Renames and/or retypes a column, replacing its default
  ///
  /// Values are carried over only when the name is unchanged.
  /// @throws EvoTableException ColumnNotFound, PrimaryKeyImmutable, TypeInvalid,
  ///         ColumnExists, TypeCoercionError or MigrationFailure
  void modify_column(const std::string &table, const std::string &old_name,
                     const std::string &new_name, const std::string &new_type,
                     const std::optional<std::string> &new_default);

  /// Executes operator-issued SQL as-is
  ///
  /// Privileged escape hatch: bypasses planning and sanitation, so it is
  /// the one operation able to break schema/ledger consistency. Every call
  /// is logged at warn level. The ledger table stays protected.
  /// @throws EvoTableException(MigrationFailure) if the statement fails
  void run_raw_statement(const std::string &table, const std::string &sql);

private:
  Database &db_;
  SchemaIntrospector &introspector_;
  TableRebuilder &rebuilder_;
};

} // namespace evotable

#endif // EVOTABLE_COLUMN_PLANNER_HPP
