// field_value.cpp
#include "field_value.hpp"
#include <charconv>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace evotable {

namespace {

std::string_view trim(std::string_view str) {
  const char *ws = " \t\r\n";
  size_t begin = str.find_first_not_of(ws);
  if (begin == std::string_view::npos) {
    return {};
  }
  size_t end = str.find_last_not_of(ws);
  return str.substr(begin, end - begin + 1);
}

int hex_digit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

FieldValue FieldValue::integer(int64_t v) {
  FieldValue result;
  result.type = INTEGER;
  result.int_val = v;
  return result;
}

FieldValue FieldValue::real(double v) {
  FieldValue result;
  result.type = REAL;
  result.real_val = v;
  return result;
}

FieldValue FieldValue::text(std::string v) {
  FieldValue result;
  result.type = TEXT;
  result.text_val = std::move(v);
  return result;
}

FieldValue FieldValue::blob(std::vector<uint8_t> v) {
  FieldValue result;
  result.type = BLOB;
  result.blob_val = std::move(v);
  return result;
}

FieldValue FieldValue::from_sqlite(sqlite3_value *val) {
  FieldValue result;
  int type = sqlite3_value_type(val);

  switch (type) {
  case SQLITE_NULL:
    result.type = NULL_TYPE;
    break;
  case SQLITE_INTEGER:
    result.type = INTEGER;
    result.int_val = sqlite3_value_int64(val);
    break;
  case SQLITE_FLOAT:
    result.type = REAL;
    result.real_val = sqlite3_value_double(val);
    break;
  case SQLITE_TEXT: {
    result.type = TEXT;
    const char *text = reinterpret_cast<const char *>(sqlite3_value_text(val));
    int bytes = sqlite3_value_bytes(val);
    result.text_val.assign(text, static_cast<size_t>(bytes));
    break;
  }
  case SQLITE_BLOB: {
    result.type = BLOB;
    const uint8_t *blob = reinterpret_cast<const uint8_t *>(sqlite3_value_blob(val));
    int bytes = sqlite3_value_bytes(val);
    if (blob != nullptr) {
      result.blob_val.assign(blob, blob + bytes);
    }
    break;
  }
  }

  return result;
}

std::optional<std::string> FieldValue::canonical() const {
  switch (type) {
  case NULL_TYPE:
    return std::nullopt;
  case INTEGER:
    return std::to_string(int_val);
  case REAL:
    return format_real(real_val);
  case TEXT:
    return text_val;
  case BLOB: {
    std::ostringstream oss;
    oss << "BLOB:";
    for (uint8_t byte : blob_val) {
      oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
  }
  }
  return std::nullopt;
}

std::string FieldValue::to_string() const {
  auto value = canonical();
  return value ? *value : "NULL";
}

int FieldValue::bind(sqlite3_stmt *stmt, int index) const {
  switch (type) {
  case NULL_TYPE:
    return sqlite3_bind_null(stmt, index);
  case INTEGER:
    return sqlite3_bind_int64(stmt, index, int_val);
  case REAL:
    return sqlite3_bind_double(stmt, index, real_val);
  case TEXT:
    return sqlite3_bind_text(stmt, index, text_val.c_str(), static_cast<int>(text_val.size()),
                             SQLITE_TRANSIENT);
  case BLOB:
    return sqlite3_bind_blob(stmt, index, blob_val.data(), static_cast<int>(blob_val.size()),
                             SQLITE_TRANSIENT);
  }
  return SQLITE_MISUSE;
}

std::optional<int64_t> parse_int64(std::string_view str) {
  str = trim(str);
  if (str.empty()) {
    return std::nullopt;
  }
  // from_chars rejects a leading '+'
  if (str.front() == '+') {
    str.remove_prefix(1);
    if (str.empty() || str.front() == '-') {
      return std::nullopt;
    }
  }
  int64_t value = 0;
  auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
  if (ec != std::errc() || ptr != str.data() + str.size()) {
    return std::nullopt;
  }
  return value;
}

std::optional<double> parse_real(std::string_view str) {
  str = trim(str);
  if (str.empty()) {
    return std::nullopt;
  }
  if (str.front() == '+') {
    str.remove_prefix(1);
    if (str.empty() || str.front() == '-') {
      return std::nullopt;
    }
  }
  double value = 0.0;
  auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
  if (ec != std::errc() || ptr != str.data() + str.size() || !std::isfinite(value)) {
    return std::nullopt;
  }
  return value;
}

std::string format_real(double v) {
  char buf[64];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  if (ec != std::errc()) {
    std::ostringstream oss;
    oss << std::setprecision(17) << v;
    return oss.str();
  }
  return std::string(buf, ptr);
}

std::optional<std::vector<uint8_t>> decode_blob(std::string_view str) {
  if (str.substr(0, 5) != "BLOB:") {
    return std::nullopt;
  }
  std::string_view hex = str.substr(5);
  if (hex.size() % 2 != 0) {
    return std::nullopt;
  }
  std::vector<uint8_t> bytes;
  bytes.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    int high = hex_digit(hex[i]);
    int low = hex_digit(hex[i + 1]);
    if (high < 0 || low < 0) {
      return std::nullopt;
    }
    bytes.push_back(static_cast<uint8_t>((high << 4) | low));
  }
  return bytes;
}

} // namespace evotable
