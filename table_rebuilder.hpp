// table_rebuilder.hpp
#ifndef EVOTABLE_TABLE_REBUILDER_HPP
#define EVOTABLE_TABLE_REBUILDER_HPP

#include "schema_introspector.hpp"
#include "sqlite_db.hpp"
#include "table_schema.hpp"
#include <functional>
#include <string>
#include <vector>

namespace evotable {

/// Steps of a rebuild, in execution order
enum class RebuildStage { CreateShadow, CopyRows, DropOriginal, RenameShadow };

const char *rebuild_stage_name(RebuildStage stage);

/// Replaces a table's physical layout (create shadow, copy, drop, rename)
///
/// SQLite cannot drop, rename or retype a column in place with full
/// fidelity, so schema changes other than additions go through here.
///
/// All four stages run inside a single BEGIN IMMEDIATE transaction: other
/// connections see either the old table or the new one, never a
/// half-built state, and a failure at any stage rolls everything back.
/// The old table is only dropped after the shadow has been created and
/// filled.
///
/// Data of a column that is not in the target schema (dropped, or renamed
/// away) is not carried over. Columns are matched by name, not position.
class TableRebuilder {
public:
  /// Called before each stage; an exception thrown from it aborts the rebuild
  using StageHook = std::function<void(RebuildStage)>;

  TableRebuilder(Database &db, SchemaIntrospector &introspector)
      : db_(db), introspector_(introspector) {}

  void set_stage_hook(StageHook hook) { stage_hook_ = std::move(hook); }

  /// Rebuilds table with the target columns
  ///
  /// @param table Table to rebuild (must exist)
  /// @param target Full target column list, primary key included
  /// @throws EvoTableException(MigrationFailure) if any stage fails; the
  ///         table and its rows are then exactly as before the call
  void rebuild(const std::string &table, const std::vector<ColumnDescriptor> &target);

  /// Name of the temporary table a rebuild of table uses
  static std::string shadow_table_name(const std::string &table);

private:
  void enter_stage(RebuildStage stage);

  Database &db_;
  SchemaIntrospector &introspector_;
  StageHook stage_hook_;
};

} // namespace evotable

#endif // EVOTABLE_TABLE_REBUILDER_HPP
