// test_config.cpp
#include "evotable_config.hpp"
#include "test_common.hpp"
#include <boost/program_options/errors.hpp>
#include <fstream>
#include <vector>

using namespace evotable;

Invocation parse(std::vector<const char *> args) {
  args.insert(args.begin(), "evotable_cli");
  return parse_command_line(static_cast<int>(args.size()), args.data());
}

TEST(defaults) {
  Invocation inv = parse({"columns"});
  ASSERT_EQ(inv.command, "columns");
  ASSERT_TRUE(inv.args.empty());
  ASSERT_FALSE(inv.help);
  ASSERT_EQ(inv.config.database_path, "catalog.db");
  ASSERT_EQ(inv.config.table, "product");
  ASSERT_EQ(inv.config.actor, "cli");
  ASSERT_EQ(inv.config.log_level, "info");
  ASSERT_FALSE(inv.config.log_file.has_value());
  ASSERT_EQ(inv.config.version_limit, 200u);
  ASSERT_FALSE(inv.config.allow_raw);
  ASSERT_FALSE(inv.config.record_id.has_value());
}

TEST(options_and_arguments) {
  Invocation inv = parse({"--database", "shop.db", "-t", "gadget", "--allow-raw", "--actor", "alice",
                          "update", "3", "name=Widget", "price_cents=12.50"});
  ASSERT_EQ(inv.config.database_path, "shop.db");
  ASSERT_EQ(inv.config.table, "gadget");
  ASSERT_EQ(inv.config.actor, "alice");
  ASSERT_TRUE(inv.config.allow_raw);
  ASSERT_EQ(inv.command, "update");
  ASSERT_EQ(inv.args.size(), 3u);
  ASSERT_EQ(inv.args[2], "price_cents=12.50");

  inv = parse({"versions", "--record", "7", "--sort", "changed_at", "--order", "asc", "--log-file", "x.log"});
  ASSERT_EQ(inv.config.record_id.value_or(0), 7);
  ASSERT_EQ(inv.config.sort_field, "changed_at");
  ASSERT_EQ(inv.config.sort_order, "asc");
  ASSERT_EQ(inv.config.log_file, std::optional<std::string>("x.log"));
}

TEST(help) {
  ASSERT_TRUE(parse({"--help"}).help);
  ASSERT_TRUE(parse({}).help);
  ASSERT_TRUE(parse({}).usage.find("rollback VERSION_ID") != std::string::npos);
}

TEST(config_file) {
  const std::string path = "test_config.ini";
  {
    std::ofstream out(path);
    out << "database = from_file.db\n"
        << "table = inventory\n"
        << "log-level = debug\n"
        << "version-limit = 25\n";
  }

  // The command line wins over the file
  Invocation inv = parse({"--config", path.c_str(), "--table", "product", "list"});
  ASSERT_EQ(inv.config.database_path, "from_file.db");
  ASSERT_EQ(inv.config.table, "product");
  ASSERT_EQ(inv.config.log_level, "debug");
  ASSERT_EQ(inv.config.version_limit, 25u);
  fs::remove(path);

  bool failed = false;
  try {
    parse({"--config", "does_not_exist.ini", "list"});
  } catch (const boost::program_options::error &) {
    failed = true;
  }
  ASSERT_TRUE(failed);
}

TEST(malformed_options) {
  bool failed = false;
  try {
    parse({"--version-limit", "lots", "versions"});
  } catch (const boost::program_options::error &) {
    failed = true;
  }
  ASSERT_TRUE(failed);
}

int main() {
  std::cout << "Running config tests..." << std::endl << std::endl;

  RUN_TEST(defaults);
  RUN_TEST(options_and_arguments);
  RUN_TEST(help);
  RUN_TEST(config_file);
  RUN_TEST(malformed_options);

  std::cout << std::endl << "All tests passed!" << std::endl;
  return 0;
}
