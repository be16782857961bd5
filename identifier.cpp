// identifier.cpp
#include "identifier.hpp"
#include "evotable_errors.hpp"
#include <sqlite3.h>

namespace evotable {

namespace {

bool is_identifier_char(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
         (c >= '0' && c <= '9') || c == '_';
}

} // namespace

std::string sanitize_identifier(std::string_view raw) {
  std::string result;
  result.reserve(raw.size());
  for (char c : raw) {
    // One '_' per UTF-8 code point: continuation bytes are dropped
    if ((static_cast<unsigned char>(c) & 0xC0) == 0x80) {
      continue;
    }
    result += is_identifier_char(c) ? c : '_';
  }
  return result;
}

bool is_valid_identifier(std::string_view name) {
  if (name.empty()) {
    return false;
  }
  for (char c : name) {
    if (!is_identifier_char(c)) {
      return false;
    }
  }
  return true;
}

std::string quote_identifier(std::string_view name) {
  if (!is_valid_identifier(name)) {
    throw EvoTableException(ErrorCode::IdentifierInvalid,
                            "Invalid identifier '" + std::string(name) +
                                "': must be non-empty and contain only alphanumeric characters and underscores");
  }
  std::string quoted;
  quoted.reserve(name.size() + 2);
  quoted += '"';
  quoted += name;
  quoted += '"';
  return quoted;
}

bool same_identifier(const std::string &a, const std::string &b) {
  return sqlite3_stricmp(a.c_str(), b.c_str()) == 0;
}

} // namespace evotable
