// table_rebuilder.cpp
#include "table_rebuilder.hpp"
#include "evotable_errors.hpp"
#include "identifier.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace evotable {

namespace {

void validate_target(const std::string &table, const std::vector<ColumnDescriptor> &target) {
  int primary_keys = 0;
  for (auto it = target.begin(); it != target.end(); ++it) {
    const ColumnDescriptor &column = *it;
    bool duplicate = std::any_of(target.begin(), it, [&column](const ColumnDescriptor &other) {
      return same_identifier(other.name, column.name);
    });
    if (duplicate) {
      throw EvoTableException(ErrorCode::ColumnExists,
                              "Duplicate column " + column.name + " in target schema of " + table);
    }
    if (column.is_primary_key) {
      primary_keys++;
    }
  }
  if (primary_keys != 1) {
    throw EvoTableException(ErrorCode::PrimaryKeyImmutable,
                            "Target schema of " + table + " must keep exactly one primary key");
  }
}

} // namespace

const char *rebuild_stage_name(RebuildStage stage) {
  switch (stage) {
  case RebuildStage::CreateShadow:
    return "create-shadow";
  case RebuildStage::CopyRows:
    return "copy-rows";
  case RebuildStage::DropOriginal:
    return "drop-original";
  case RebuildStage::RenameShadow:
    return "rename-shadow";
  }
  return "unknown";
}

std::string TableRebuilder::shadow_table_name(const std::string &table) {
  return table + "__rebuild";
}

void TableRebuilder::enter_stage(RebuildStage stage) {
  spdlog::debug("evotable: rebuild stage {}", rebuild_stage_name(stage));
  if (stage_hook_) {
    stage_hook_(stage);
  }
}

void TableRebuilder::rebuild(const std::string &table, const std::vector<ColumnDescriptor> &target) {
  const std::string shadow = shadow_table_name(table);
  RebuildStage stage = RebuildStage::CreateShadow;
  size_t copied_columns = 0;

  try {
    // Declared inside the try so an unwinding failure rolls back before we report it
    Transaction txn(db_);

    TableSchema current = introspector_.list_columns(table);
    if (current.empty()) {
      throw EvoTableException(ErrorCode::StorageFailure, "Table does not exist: " + table);
    }
    validate_target(table, target);

    const std::string quoted_table = quote_identifier(table);
    const std::string quoted_shadow = quote_identifier(shadow);

    // The shadow name may belong to a table we did not create
    if (introspector_.table_exists(shadow)) {
      throw EvoTableException(ErrorCode::MigrationFailure,
                              "Shadow table " + shadow + " already exists");
    }

    enter_stage(stage);
    db_.execute(create_table_sql(shadow, target));

    // Intersection by name, in target order; a column whose name changed only in case is retained
    std::string common_cols;
    for (const auto &column : target) {
      if (current.find(column.name)) {
        if (!common_cols.empty()) common_cols += ", ";
        common_cols += quote_identifier(column.name);
        copied_columns++;
      }
    }

    stage = RebuildStage::CopyRows;
    enter_stage(stage);
    if (!common_cols.empty()) {
      db_.execute("INSERT INTO " + quoted_shadow + " (" + common_cols + ") SELECT " +
                  common_cols + " FROM " + quoted_table);
    }

    stage = RebuildStage::DropOriginal;
    enter_stage(stage);
    db_.execute("DROP TABLE " + quoted_table);

    stage = RebuildStage::RenameShadow;
    enter_stage(stage);
    db_.execute("ALTER TABLE " + quoted_shadow + " RENAME TO " + quoted_table);

    txn.commit();
  } catch (const std::exception &e) {
    throw EvoTableException(ErrorCode::MigrationFailure,
                            "Rebuild of " + table + " failed at stage " +
                                rebuild_stage_name(stage) + ": " + e.what());
  }

  spdlog::info("evotable: rebuilt {} with {} columns ({} carried over)", table, target.size(),
               copied_columns);
}

} // namespace evotable
