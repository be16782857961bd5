// evotable_cli.cpp
#include "evotable.hpp"
#include "evotable_config.hpp"
#include "evotable_errors.hpp"
#include "evotable_log.hpp"
#include <boost/program_options/errors.hpp>
#include <spdlog/spdlog.h>
#include <cstdint>
#include <iostream>
#include <stdexcept>

using namespace evotable;

namespace {

/// Bad arguments to a command; reported with exit status 2
class UsageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

void require_args(const Invocation &inv, size_t min, size_t max) {
  if (inv.args.size() < min || inv.args.size() > max) {
    throw UsageError("wrong number of arguments for " + inv.command);
  }
}

int64_t parse_id(const std::string &arg) {
  auto id = parse_int64(arg);
  if (!id) {
    throw UsageError("not an id: " + arg);
  }
  return *id;
}

/// FIELD=VALUE arguments starting at first
FieldValues parse_assignments(const std::vector<std::string> &args, size_t first) {
  FieldValues values;
  for (size_t i = first; i < args.size(); i++) {
    size_t eq = args[i].find('=');
    if (eq == std::string::npos || eq == 0) {
      throw UsageError("expected FIELD=VALUE, got " + args[i]);
    }
    values[args[i].substr(0, eq)] = FieldValue::text(args[i].substr(eq + 1));
  }
  return values;
}

std::optional<std::string> optional_arg(const Invocation &inv, size_t index) {
  if (index < inv.args.size()) return inv.args[index];
  return std::nullopt;
}

void print_record(const Record &record) {
  for (const auto &column : record.schema.columns) {
    std::cout << column.name << ": " << record.render(column.name) << "\n";
  }
}

void print_entry(const VersionEntry &entry) {
  std::cout << "#" << entry.id << " record " << entry.record_id << " " << entry.field_name << ": "
            << entry.old_value.value_or("NULL") << " -> " << entry.new_value.value_or("NULL") << " at "
            << entry.changed_at << " by " << entry.changed_by << "\n";
}

void print_columns(const TableSchema &schema) {
  for (const auto &column : schema.columns) {
    std::cout << column.ordinal << "\t" << column.name << "\t" << column_type_sql(column.type);
    if (column.is_primary_key) std::cout << " PRIMARY KEY";
    if (!column.nullable) std::cout << " NOT NULL";
    if (column.default_value) std::cout << " DEFAULT " << *column.default_value;
    std::cout << "\n";
  }
}

void print_table(const std::vector<Record> &records, const TableSchema &schema) {
  for (size_t i = 0; i < schema.columns.size(); i++) {
    std::cout << (i ? "\t" : "") << schema.columns[i].name;
  }
  std::cout << "\n";
  for (const auto &record : records) {
    for (size_t i = 0; i < schema.columns.size(); i++) {
      std::cout << (i ? "\t" : "") << record.render(schema.columns[i].name);
    }
    std::cout << "\n";
  }
}

int run(const Invocation &inv) {
  const Config &config = inv.config;
  const std::string &cmd = inv.command;
  EvoTable table(config.database_path, config.table);

  if (cmd == "columns") {
    require_args(inv, 0, 0);
    print_columns(table.list_columns());
  } else if (cmd == "schema-sql") {
    require_args(inv, 0, 0);
    std::cout << table.get_definition_statement().value_or("") << "\n";
  } else if (cmd == "add-column") {
    require_args(inv, 2, 3);
    table.add_column(inv.args[0], inv.args[1], optional_arg(inv, 2));
  } else if (cmd == "drop-column") {
    require_args(inv, 1, 1);
    table.drop_column(inv.args[0]);
  } else if (cmd == "modify-column") {
    require_args(inv, 3, 4);
    table.modify_column(inv.args[0], inv.args[1], inv.args[2], optional_arg(inv, 3));
  } else if (cmd == "create") {
    std::cout << table.create_record(parse_assignments(inv.args, 0), config.actor) << "\n";
  } else if (cmd == "get") {
    require_args(inv, 1, 1);
    print_record(table.get_record(parse_id(inv.args[0])));
  } else if (cmd == "list") {
    require_args(inv, 0, 1);
    RecordQuery query;
    query.search = optional_arg(inv, 0);
    query.limit = config.version_limit;
    print_table(table.list_records(query), table.list_columns());
  } else if (cmd == "compare") {
    require_args(inv, 1, SIZE_MAX);
    std::vector<int64_t> ids;
    for (const auto &arg : inv.args) ids.push_back(parse_id(arg));
    print_table(table.compare_records(ids), table.list_columns());
  } else if (cmd == "update") {
    require_args(inv, 2, SIZE_MAX);
    size_t changed = table.update_record(parse_id(inv.args[0]), parse_assignments(inv.args, 1), config.actor);
    std::cout << changed << " field(s) changed\n";
  } else if (cmd == "delete") {
    require_args(inv, 1, 1);
    table.delete_record(parse_id(inv.args[0]));
  } else if (cmd == "versions") {
    require_args(inv, 0, 0);
    auto entries = table.list_versions(config.record_id, config.version_limit,
                                       parse_version_sort_field(config.sort_field),
                                       parse_sort_order(config.sort_order));
    for (const auto &entry : entries) print_entry(entry);
  } else if (cmd == "version") {
    require_args(inv, 1, 1);
    auto entry = table.get_version(static_cast<uint64_t>(parse_id(inv.args[0])));
    if (!entry) {
      throw EvoTableException(ErrorCode::VersionNotFound, "Version " + inv.args[0] + " not found");
    }
    print_entry(*entry);
  } else if (cmd == "rollback") {
    require_args(inv, 1, 1);
    print_entry(table.rollback(static_cast<uint64_t>(parse_id(inv.args[0])), config.actor));
  } else if (cmd == "raw") {
    require_args(inv, 1, 1);
    if (!config.allow_raw) {
      throw UsageError("raw statements need --allow-raw");
    }
    table.run_raw_statement(inv.args[0]);
  } else {
    throw UsageError("unknown command " + cmd);
  }
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  Invocation inv;
  try {
    inv = parse_command_line(argc, argv);
  } catch (const boost::program_options::error &e) {
    std::cerr << "error: " << e.what() << "\n";
    return 2;
  }
  if (inv.help) {
    std::cout << inv.usage;
    return 0;
  }

  try {
    setup_logging(inv.config.log_level, inv.config.log_file);
  } catch (const std::invalid_argument &e) {
    std::cerr << "error: " << e.what() << "\n";
    return 2;
  }

  int status = 0;
  try {
    status = run(inv);
  } catch (const EvoTableException &e) {
    spdlog::debug("evotable: {} failed: {}", inv.command, e.what());
    std::cerr << "error: " << error_code_name(e.code()) << ": " << e.what() << "\n";
    status = 1;
  } catch (const UsageError &e) {
    std::cerr << "error: " << e.what() << "\n" << inv.usage;
    status = 2;
  }

  shutdown_logging();
  return status;
}
