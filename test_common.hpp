// test_common.hpp
#ifndef EVOTABLE_TEST_COMMON_HPP
#define EVOTABLE_TEST_COMMON_HPP

#include "evotable_errors.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

namespace fs = std::filesystem;

// Test helper macros
#define TEST(name) void test_##name()
#define RUN_TEST(name) \
  do { \
    std::cout << "Running test: " << #name << "..."; \
    test_##name(); \
    std::cout << " PASSED" << std::endl; \
  } while (0)

#define ASSERT_EQ(a, b) \
  do { \
    if ((a) != (b)) { \
      std::cerr << "Assertion failed: " << #a << " == " << #b \
                << " (got " << (a) << " and " << (b) << ")" << std::endl; \
      std::exit(1); \
    } \
  } while (0)

#define ASSERT_TRUE(cond) \
  do { \
    if (!(cond)) { \
      std::cerr << "Assertion failed: " << #cond << std::endl; \
      std::exit(1); \
    } \
  } while (0)

#define ASSERT_FALSE(cond) ASSERT_TRUE(!(cond))

// Expects expr to throw EvoTableException with the given ErrorCode
#define ASSERT_THROWS_CODE(expr, expected) \
  do { \
    bool thrown_ = false; \
    try { \
      expr; \
    } catch (const evotable::EvoTableException &e_) { \
      thrown_ = true; \
      if (e_.code() != (expected)) { \
        std::cerr << "Assertion failed: " << #expr << " threw " \
                  << evotable::error_code_name(e_.code()) << " (" << e_.what() \
                  << "), expected " << evotable::error_code_name(expected) << std::endl; \
        std::exit(1); \
      } \
    } \
    if (!thrown_) { \
      std::cerr << "Assertion failed: " << #expr << " did not throw " \
                << evotable::error_code_name(expected) << std::endl; \
      std::exit(1); \
    } \
  } while (0)

inline std::ostream &operator<<(std::ostream &os, const std::optional<std::string> &value) {
  return value ? os << '"' << *value << '"' : os << "nullopt";
}

// Test database helper
class TestDB {
public:
  TestDB(const std::string &name) : path_("test_" + name + ".db") { remove_files(); }

  ~TestDB() { remove_files(); }

  const std::string &path() const { return path_; }

private:
  void remove_files() {
    // WAL mode leaves -wal and -shm files beside the database
    for (const char *suffix : {"", "-wal", "-shm"}) {
      std::error_code ec;
      fs::remove(path_ + suffix, ec);
    }
  }

  std::string path_;
};

#endif // EVOTABLE_TEST_COMMON_HPP
