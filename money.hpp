// money.hpp
#ifndef EVOTABLE_MONEY_HPP
#define EVOTABLE_MONEY_HPP

#include "field_value.hpp"
#include <cstdint>
#include <string>
#include <string_view>

namespace evotable {

/// Cents naming convention
///
/// An INTEGER column named "cents" or ending in "_cents" holds an amount in
/// hundredths. Writes coming from users carry decimal amounts ("12.50") and
/// are converted to integer cents; reads render them back with two
/// decimals. This is a value transform above the generic INTEGER handling,
/// not a column type: the stored value is a plain integer and the ledger
/// records that integer.

/// True if name follows the cents convention (case-insensitive)
bool is_cents_column(std::string_view name);

/// Converts a decimal amount to cents, rounding half to even at the cent
///
/// "12.50" -> 1250, "12.504" -> 1250, "12.505" -> 1250, "12.515" -> 1252, "-0.5" -> -50
/// @throws EvoTableException(TypeCoercionError) if the text is not a plain
///         decimal number or does not fit in 64 bits
int64_t parse_cents(std::string_view amount);

/// Converts a user-supplied amount of any numeric or text type to cents
/// @throws EvoTableException(TypeCoercionError) for BLOB or malformed input
int64_t cents_from_value(const FieldValue &value);

/// Renders cents as a two-decimal amount: 1250 -> "12.50", -5 -> "-0.05"
std::string format_cents(int64_t cents);

} // namespace evotable

#endif // EVOTABLE_MONEY_HPP
