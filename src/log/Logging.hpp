// src/log/Logging.hpp

// ---- Logging Usage ---- //

// setupLogging() replaces the stock spdlog default logger with the daemon's
// own: coloured console output, plus a file when config.log_file is set.
// Everything else just calls spdlog::info(...) and friends.

// Example:
// ConfigManager mgr(CONFIG_FILE_PATH); // logs through the stock logger
// setupLogging(mgr.getConfig());

// The level comes from config.log_level ("trace" .. "critical", "off") and
// can be overridden at start with the SPDLOG_LEVEL environment variable,
// e.g. SPDLOG_LEVEL=debug. An unknown level name throws ConfigError.

#pragma once

#include <memory>

#include <spdlog/logger.h>

#include "ConfigManager.hpp"

std::shared_ptr<spdlog::logger> setupLogging(const Config &config);
