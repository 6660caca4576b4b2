/**
 * @file logging.cpp
 * @brief Console and file logger setup
 */

#include "logging.hpp"
#include "config.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

void initConsoleLogging() {
  spdlog::drop(LOGGER_NAME);
  auto logger = spdlog::stderr_color_mt(LOGGER_NAME);
  logger->set_pattern("pf: %^%l%$: %v");
  logger->set_level(spdlog::level::warn);
  spdlog::set_default_logger(logger);
}

bool configureLogging(const PickerConfig &config) {
  auto level = spdlog::level::from_str(config.getLogLevel());
  if (level == spdlog::level::off && config.getLogLevel() != "off") {
    spdlog::warn("unknown log_level '{}', using info", config.getLogLevel());
    level = spdlog::level::info;
  }

  if (config.getLogFile().empty()) {
    spdlog::set_level(spdlog::level::off);
    return true;
  }

  try {
    spdlog::drop(LOGGER_NAME);
    auto logger = spdlog::basic_logger_mt(LOGGER_NAME, config.getLogFile());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
    return true;
  } catch (const spdlog::spdlog_ex &e) {
    initConsoleLogging();
    spdlog::warn("cannot open log file {}: {}", config.getLogFile(), e.what());
    spdlog::set_level(spdlog::level::off);
    return false;
  }
}
