// evotable_log.hpp
#ifndef EVOTABLE_LOG_HPP
#define EVOTABLE_LOG_HPP

#include <optional>
#include <string>

namespace evotable {

/// Installs the "evotable" async logger as spdlog's default logger
///
/// Console output goes to stderr; log_file, when given, gets the same
/// records appended. Call shutdown_logging() before exit to flush.
/// @throws std::invalid_argument for an unknown level name
void setup_logging(const std::string &level, const std::optional<std::string> &log_file);

void shutdown_logging();

} // namespace evotable

#endif // EVOTABLE_LOG_HPP
