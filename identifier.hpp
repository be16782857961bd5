// identifier.hpp
#ifndef EVOTABLE_IDENTIFIER_HPP
#define EVOTABLE_IDENTIFIER_HPP

#include <string>
#include <string_view>

namespace evotable {

/// Maps every character outside [A-Za-z0-9_] to '_'
///
/// Total function: never fails. This is the only way user-supplied names
/// become identifiers; the result may still be empty.
std::string sanitize_identifier(std::string_view raw);

/// True for a non-empty name made only of [A-Za-z0-9_]
bool is_valid_identifier(std::string_view name);

/// Returns the identifier double-quoted for use in SQL text
///
/// @throws EvoTableException(IdentifierInvalid) if name is not a valid
///         identifier, i.e. it did not come through sanitize_identifier()
std::string quote_identifier(std::string_view name);

/// True if SQLite treats both identifiers as the same name (ASCII case-insensitive)
bool same_identifier(const std::string &a, const std::string &b);

} // namespace evotable

#endif // EVOTABLE_IDENTIFIER_HPP
