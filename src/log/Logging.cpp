// src/log/Logging.cpp

#include "Logging.hpp"
#include "Errors.hpp"
#include "configs.hpp"

#include <vector>

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

std::shared_ptr<spdlog::logger> setupLogging(const Config &config) {
  spdlog::level::level_enum level = spdlog::level::from_str(config.log_level);
  // from_str() maps anything it doesn't know to off
  if (level == spdlog::level::off && config.log_level != "off") {
    throw ConfigError("unknown log level '" + config.log_level + "'");
  }

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (!config.log_file.empty()) {
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
          config.log_file));
    } catch (const spdlog::spdlog_ex &error) {
      throw ConfigError("cannot open log file " + config.log_file + ": " +
                        error.what());
    }
  }

  // a second call (tests) replaces the previous logger of the same name
  spdlog::drop(LOGGER_NAME);
  auto logger =
      std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
  logger->set_level(level);
  logger->flush_on(spdlog::level::warn);
  spdlog::register_logger(logger);
  spdlog::set_default_logger(logger);

  spdlog::cfg::load_env_levels();

  return logger;
}
