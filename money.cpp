// money.cpp
#include "money.hpp"
#include "evotable_errors.hpp"
#include <cctype>
#include <limits>

namespace evotable {

namespace {

// 16 integer digits * 100 + 99 still fits in int64_t
constexpr size_t MAX_WHOLE_DIGITS = 16;

[[noreturn]] void malformed(std::string_view amount) {
  throw EvoTableException(ErrorCode::TypeCoercionError,
                          "Invalid amount '" + std::string(amount) + "': expected a decimal number");
}

bool is_digit(char c) { return c >= '0' && c <= '9'; }

} // namespace

bool is_cents_column(std::string_view name) {
  constexpr std::string_view suffix = "_cents";
  auto equals_ci = [](std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); i++) {
      if (std::tolower(static_cast<unsigned char>(a[i])) != b[i]) return false;
    }
    return true;
  };
  if (equals_ci(name, "cents")) {
    return true;
  }
  return name.size() > suffix.size() && equals_ci(name.substr(name.size() - suffix.size()), suffix);
}

int64_t parse_cents(std::string_view amount) {
  std::string_view str = amount;
  while (!str.empty() && std::isspace(static_cast<unsigned char>(str.front()))) str.remove_prefix(1);
  while (!str.empty() && std::isspace(static_cast<unsigned char>(str.back()))) str.remove_suffix(1);

  bool negative = false;
  if (!str.empty() && (str.front() == '-' || str.front() == '+')) {
    negative = str.front() == '-';
    str.remove_prefix(1);
  }

  size_t dot = str.find('.');
  std::string_view whole = str.substr(0, dot);
  std::string_view fraction = dot == std::string_view::npos ? std::string_view() : str.substr(dot + 1);

  if (whole.empty() && fraction.empty()) malformed(amount);
  for (char c : whole) {
    if (!is_digit(c)) malformed(amount);
  }
  for (char c : fraction) {
    if (!is_digit(c)) malformed(amount);
  }

  // Strip leading zeros before the overflow check
  while (whole.size() > 1 && whole.front() == '0') whole.remove_prefix(1);
  if (whole.size() > MAX_WHOLE_DIGITS) {
    throw EvoTableException(ErrorCode::TypeCoercionError,
                            "Amount '" + std::string(amount) + "' is out of range");
  }

  int64_t cents = 0;
  for (char c : whole) {
    cents = cents * 10 + (c - '0');
  }
  cents *= 100;
  if (fraction.size() > 0) cents += (fraction[0] - '0') * 10;
  if (fraction.size() > 1) cents += fraction[1] - '0';

  // Round half to even on the digits past the cent
  if (fraction.size() > 2) {
    std::string_view rest = fraction.substr(2);
    bool round_up = false;
    if (rest[0] > '5') {
      round_up = true;
    } else if (rest[0] == '5') {
      bool exact_half = rest.find_first_not_of('0', 1) == std::string_view::npos;
      round_up = !exact_half || (cents % 2 != 0);
    }
    if (round_up) cents++;
  }

  return negative ? -cents : cents;
}

int64_t cents_from_value(const FieldValue &value) {
  switch (value.type) {
  case FieldValue::TEXT:
    return parse_cents(value.text_val);
  case FieldValue::INTEGER:
    if (value.int_val > std::numeric_limits<int64_t>::max() / 100 ||
        value.int_val < std::numeric_limits<int64_t>::min() / 100) {
      throw EvoTableException(ErrorCode::TypeCoercionError,
                              "Amount " + std::to_string(value.int_val) + " is out of range");
    }
    return value.int_val * 100;
  case FieldValue::REAL:
    return parse_cents(format_real(value.real_val));
  case FieldValue::NULL_TYPE:
  case FieldValue::BLOB:
    break;
  }
  throw EvoTableException(ErrorCode::TypeCoercionError,
                          "Amount must be a decimal number, got " + value.to_string());
}

std::string format_cents(int64_t cents) {
  // Unsigned magnitude so INT64_MIN does not overflow
  uint64_t magnitude = cents < 0 ? 0 - static_cast<uint64_t>(cents) : static_cast<uint64_t>(cents);
  uint64_t fraction = magnitude % 100;
  std::string result = cents < 0 ? "-" : "";
  result += std::to_string(magnitude / 100);
  result += '.';
  if (fraction < 10) result += '0';
  result += std::to_string(fraction);
  return result;
}

} // namespace evotable
