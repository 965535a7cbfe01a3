#include "logging.hpp"

#include <memory>
#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace weft::driver {

void SetupLogging(int verbosity) {
  // stdout carries command results; logs go to stderr.
  auto logger = spdlog::stderr_color_mt("weft");
  logger->set_pattern("[weft][%H:%M:%S][%l] %v");

  if (verbosity >= 2) {
    logger->set_level(spdlog::level::trace);
  } else if (verbosity == 1) {
    logger->set_level(spdlog::level::debug);
  } else {
    logger->set_level(spdlog::level::warn);
  }
  spdlog::set_default_logger(std::move(logger));
}

}  // namespace weft::driver
