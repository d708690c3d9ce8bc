#include "logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace verdict::driver {

void ConfigureLogging(int verbosity) {
  auto logger = spdlog::stderr_color_mt("verdict");
  logger->set_pattern("%n: [%^%l%$] %v");

  if (verbosity >= 2) {
    logger->set_level(spdlog::level::trace);
  } else if (verbosity == 1) {
    logger->set_level(spdlog::level::debug);
  } else {
    logger->set_level(spdlog::level::warn);
  }
  spdlog::set_default_logger(logger);
}

}  // namespace verdict::driver
