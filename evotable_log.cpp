// evotable_log.cpp
#include "evotable_log.hpp"
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <memory>
#include <stdexcept>
#include <vector>

namespace evotable {

void setup_logging(const std::string &level, const std::optional<std::string> &log_file) {
  auto parsed = spdlog::level::from_str(level);
  // from_str maps unknown names to off
  if (parsed == spdlog::level::off && level != "off") {
    throw std::invalid_argument("Unknown log level: " + level);
  }

  spdlog::init_thread_pool(8192, 1);

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (log_file) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(*log_file, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "evotable", sinks.begin(), sinks.end(), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(parsed);
}

void shutdown_logging() {
  spdlog::shutdown();
}

} // namespace evotable
