#include "logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace gradebox::driver {

void ConfigureLogging(Verbosity verbosity) {
  auto logger = spdlog::stderr_color_mt("gradebox");
  logger->set_pattern("[gradebox][%H:%M:%S][%^%l%$] %v");
  switch (verbosity) {
    case Verbosity::kQuiet:
      logger->set_level(spdlog::level::warn);
      break;
    case Verbosity::kNormal:
      logger->set_level(spdlog::level::info);
      break;
    case Verbosity::kVerbose:
      logger->set_level(spdlog::level::debug);
      break;
  }
  spdlog::set_default_logger(logger);
}

}  // namespace gradebox::driver
