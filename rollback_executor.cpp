// rollback_executor.cpp
#include "rollback_executor.hpp"
#include "evotable_errors.hpp"
#include <spdlog/spdlog.h>

namespace evotable {

const char *rollback_state_name(RollbackState state) {
  switch (state) {
  case RollbackState::Requested:
    return "requested";
  case RollbackState::Validated:
    return "validated";
  case RollbackState::Applied:
    return "applied";
  case RollbackState::Logged:
    return "logged";
  case RollbackState::Rejected:
    return "rejected";
  }
  return "unknown";
}

void RollbackExecutor::transition(uint64_t version_id, RollbackState state) {
  spdlog::debug("evotable: rollback of version {} {}", version_id, rollback_state_name(state));
}

VersionEntry RollbackExecutor::rollback(uint64_t version_id, const std::string &actor) {
  transition(version_id, RollbackState::Requested);
  try {
    Transaction txn(db_);

    auto entry = ledger_.get_by_id(version_id);
    if (!entry) {
      throw EvoTableException(ErrorCode::VersionNotFound,
                              "Version " + std::to_string(version_id) + " not found");
    }
    TableSchema schema = introspector_.list_columns(table_);
    if (!schema.find(entry->field_name)) {
      throw EvoTableException(ErrorCode::FieldNoLongerExists,
                              "Field " + entry->field_name + " of version " +
                                  std::to_string(version_id) + " no longer exists in " + table_);
    }
    transition(version_id, RollbackState::Validated);

    std::optional<std::string> previous =
        records_.restore_field(table_, entry->record_id, entry->field_name, entry->old_value);
    transition(version_id, RollbackState::Applied);
    if (previous != entry->new_value) {
      spdlog::debug("evotable: version {} is not the latest change of {}, field held {}", version_id,
                    entry->field_name, previous.value_or("NULL"));
    }

    // The inversion of the entry itself, even when later changes followed it
    std::vector<uint64_t> ids =
        ledger_.record(entry->record_id, {{entry->field_name, entry->new_value, entry->old_value}},
                       actor);
    auto logged = ledger_.get_by_id(ids.front());
    if (!logged) {
      throw EvoTableException(ErrorCode::StorageFailure, "Rollback entry was not recorded");
    }
    txn.commit();
    transition(version_id, RollbackState::Logged);
    return std::move(*logged);
  } catch (const EvoTableException &e) {
    spdlog::debug("evotable: rollback of version {} {}: {}", version_id,
                  rollback_state_name(RollbackState::Rejected), e.what());
    throw;
  }
}

} // namespace evotable
