// evotable_config.cpp
#include "evotable_config.hpp"
#include <boost/program_options.hpp>
#include <sstream>

namespace po = boost::program_options;

namespace evotable {

namespace {

constexpr const char *COMMANDS = R"(Commands:
  columns                            list the table's columns
  schema-sql                         print the table definition
  add-column NAME TYPE [DEFAULT]     add a nullable column
  drop-column NAME                   drop a column (its data is lost)
  modify-column OLD NEW TYPE [DEFAULT]
                                     rename/retype a column
  create FIELD=VALUE...              create a record
  get ID                             show a record
  list [SEARCH]                      list records, newest first
  compare ID ID...                   show records side by side
  update ID FIELD=VALUE...           update fields of a record
  delete ID                          delete a record
  versions                           list ledger entries
  version ID                         show one ledger entry
  rollback VERSION_ID                restore a field to an entry's old value
  raw SQL                            run a statement as-is (needs --allow-raw)
)";

} // namespace

Invocation parse_command_line(int argc, const char *const argv[]) {
  Invocation invocation;
  Config &config = invocation.config;
  std::string config_file;
  std::string log_file;
  int64_t record_id = 0;

  po::options_description generic("Generic");
  generic.add_options()
      ("help,h", "Show the help message")
      ("config,c", po::value<std::string>(&config_file), "INI file with default settings");

  po::options_description settings("Settings");
  settings.add_options()
      ("database,d", po::value<std::string>(&config.database_path)->default_value(config.database_path),
       "SQLite database file")
      ("table,t", po::value<std::string>(&config.table)->default_value(config.table), "Table to operate on")
      ("actor,a", po::value<std::string>(&config.actor)->default_value(config.actor),
       "Name recorded as changed_by")
      ("log-level", po::value<std::string>(&config.log_level)->default_value(config.log_level),
       "trace, debug, info, warn, error, critical or off")
      ("log-file", po::value<std::string>(&log_file), "Also append log output to this file")
      ("version-limit", po::value<size_t>(&config.version_limit)->default_value(config.version_limit),
       "Maximum number of ledger entries listed")
      ("allow-raw", po::value<bool>(&config.allow_raw)->default_value(false)->implicit_value(true),
       "Permit the raw command");

  po::options_description listing("Listing");
  listing.add_options()
      ("record,r", po::value<int64_t>(&record_id), "versions: only entries of this record")
      ("sort,s", po::value<std::string>(&config.sort_field)->default_value(config.sort_field),
       "versions: sort field")
      ("order,o", po::value<std::string>(&config.sort_order)->default_value(config.sort_order),
       "versions: asc or desc");

  po::options_description hidden;
  hidden.add_options()
      ("command", po::value<std::string>(&invocation.command))
      ("args", po::value<std::vector<std::string>>(&invocation.args));

  po::positional_options_description positional;
  positional.add("command", 1).add("args", -1);

  po::options_description all;
  all.add(generic).add(settings).add(listing).add(hidden);

  po::options_description visible("evotable_cli [options] COMMAND [ARGS...]");
  visible.add(generic).add(settings).add(listing);

  po::variables_map vm;
  po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);

  // Earlier stores win, so the file only fills in what the command line left out
  if (vm.count("config")) {
    po::store(po::parse_config_file<char>(vm["config"].as<std::string>().c_str(), settings), vm);
  }
  po::notify(vm);

  if (vm.count("log-file")) {
    config.log_file = log_file;
  }
  if (vm.count("record")) {
    config.record_id = record_id;
  }

  std::ostringstream usage;
  usage << visible << "\n" << COMMANDS;
  invocation.usage = usage.str();
  invocation.help = vm.count("help") > 0 || invocation.command.empty();
  return invocation;
}

} // namespace evotable
