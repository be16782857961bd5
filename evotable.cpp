// evotable.cpp
#include "evotable.hpp"
#include "identifier.hpp"

namespace evotable {

namespace {

std::string checked_table_name(const std::string &raw) {
  std::string name = sanitize_identifier(raw);
  quote_identifier(name);
  return name;
}

} // namespace

EvoTable::EvoTable(const std::string &db_path, const std::string &table)
    : table_(checked_table_name(table)), db_(db_path), introspector_(db_),
      rebuilder_(db_, introspector_), planner_(db_, introspector_, rebuilder_),
      records_(db_, introspector_), ledger_(db_, table_),
      rollback_(db_, introspector_, records_, ledger_, table_) {
  Transaction txn(db_);
  introspector_.ensure_table(table_);
  ledger_.ensure_table();
  txn.commit();
}

TableSchema EvoTable::list_columns() const {
  return introspector_.list_columns(table_);
}

std::optional<std::string> EvoTable::get_definition_statement() const {
  return introspector_.get_definition_statement(table_);
}

void EvoTable::add_column(const std::string &name, const std::string &type,
                          const std::optional<std::string> &default_value) {
  planner_.add_column(table_, name, type, default_value);
}

void EvoTable::drop_column(const std::string &name) {
  planner_.drop_column(table_, name);
}

void EvoTable::modify_column(const std::string &old_name, const std::string &new_name,
                             const std::string &new_type,
                             const std::optional<std::string> &new_default) {
  planner_.modify_column(table_, old_name, new_name, new_type, new_default);
}

void EvoTable::run_raw_statement(const std::string &sql) {
  planner_.run_raw_statement(table_, sql);
}

void EvoTable::set_rebuild_stage_hook(TableRebuilder::StageHook hook) {
  rebuilder_.set_stage_hook(std::move(hook));
}

int64_t EvoTable::create_record(const FieldValues &values, const std::string &actor) {
  return records_.create(table_, values, actor);
}

Record EvoTable::get_record(int64_t id) const {
  return records_.get(table_, id);
}

std::vector<Record> EvoTable::list_records(const RecordQuery &query) const {
  return records_.list(table_, query);
}

std::vector<Record> EvoTable::compare_records(const std::vector<int64_t> &ids) const {
  return records_.compare(table_, ids);
}

size_t EvoTable::update_record(int64_t id, const FieldValues &values, const std::string &actor) {
  return records_.update(table_, id, values, actor);
}

void EvoTable::delete_record(int64_t id) {
  records_.remove(table_, id);
}

std::vector<VersionEntry> EvoTable::list_versions(std::optional<int64_t> record_id, size_t limit,
                                                  VersionSortField sort_field,
                                                  SortOrder order) const {
  return ledger_.list(record_id, limit, sort_field, order);
}

std::optional<VersionEntry> EvoTable::get_version(uint64_t id) const {
  return ledger_.get_by_id(id);
}

VersionEntry EvoTable::rollback(uint64_t version_id, const std::string &actor) {
  return rollback_.rollback(version_id, actor);
}

} // namespace evotable
