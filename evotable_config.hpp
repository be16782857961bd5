// evotable_config.hpp
#ifndef EVOTABLE_CONFIG_HPP
#define EVOTABLE_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace evotable {

/// Settings of one evotable_cli invocation
struct Config {
  std::string database_path = "catalog.db";
  std::string table = "product";
  std::string actor = "cli";
  std::string log_level = "info";
  std::optional<std::string> log_file;
  size_t version_limit = 200;
  bool allow_raw = false;

  // Options only meaningful to some commands
  std::optional<int64_t> record_id;
  std::string sort_field = "id";
  std::string sort_order = "desc";
};

/// Result of parsing a command line
struct Invocation {
  Config config;
  std::string command;
  std::vector<std::string> args;
  bool help = false;
  std::string usage;
};

/// Parses argv, then the INI file named by --config if any
///
/// Values given on the command line win over the file.
/// @throws boost::program_options::error on malformed options or an unreadable config file
Invocation parse_command_line(int argc, const char *const argv[]);

} // namespace evotable

#endif // EVOTABLE_CONFIG_HPP
