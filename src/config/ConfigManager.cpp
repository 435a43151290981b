// src/config/ConfigManager.cpp

#include "ConfigManager.hpp"
#include "Errors.hpp"
#include "configs.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <limits>
#include <type_traits>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

// Anonymous namespace (to avoid cluttering global namespace)
namespace {
namespace nm = nlohmann;

// Helper functions
template <typename T>
T getWithLog(const nm::json &j, const std::string &key, const T &defaultValue);
template <typename T> T getRequired(const nm::json &j, const std::string &key);
void validate(const Config &config);
} // namespace

bool Config::isKnownNetwork(const std::string &ssid) const {
  return std::find(known_networks.begin(), known_networks.end(), ssid) !=
         known_networks.end();
}

ConfigManager::ConfigManager(const std::string &config_file)
    : config_file_(config_file) {
  loadConfig();
}

const Config &ConfigManager::getConfig() const { return config_; }

void ConfigManager::loadConfig() {
  std::ifstream infile(config_file_);
  if (!infile) {
    spdlog::critical("Error opening config file: {}", config_file_);
    throw ConfigError("Error opening config file: " + config_file_);
  }

  try {
    nm::json j;
    infile >> j;

    config_.wifi_interface = getRequired<std::string>(j, "wifi_interface");
    config_.known_networks =
        getRequired<std::vector<std::string>>(j, "known_networks");
    config_.vpn_interface =
        getWithLog(j, "vpn_interface", DEFAULT_VPN_INTERFACE);
    config_.fwmark = getWithLog(j, "fwmark", DEFAULT_FWMARK);
    config_.table = getWithLog(j, "table", DEFAULT_TABLE);
    config_.ipv6 = getWithLog(j, "ipv6", DEFAULT_IPV6);

    // quiet optionals, the defaults are what most hosts want
    config_.manage_dns = j.value("manage_dns", DEFAULT_MANAGE_DNS);
    config_.log_level = j.value("log_level", DEFAULT_LOG_LEVEL);
    config_.log_file = j.value("log_file", std::string());

    validate(config_);
  } catch (const ConfigError &error) {
    spdlog::critical("Invalid config file {}: {}", config_file_, error.what());
    throw;
  } catch (const nm::json::exception &error) {
    spdlog::critical("Error parsing config file {}: {}", config_file_,
                     error.what());
    throw ConfigError("Error parsing config file " + config_file_ + ": " +
                      error.what());
  }

  spdlog::info("Loaded config from {}: monitoring {}, {} known network(s), "
               "vpn {} (fwmark {}, table {}, ipv6 {})",
               config_file_, config_.wifi_interface,
               config_.known_networks.size(), config_.vpn_interface,
               config_.fwmark, config_.table, config_.ipv6);
}

// ---- Helper function implementations ---- //

namespace {

// Helper function: if key is missing, log and return default.
template <typename T>
T getWithLog(const nm::json &j, const std::string &key, const T &defaultValue) {
  if (!j.contains(key)) {
    spdlog::warn("Key '{}' not found, using default {}.", key, defaultValue);
    return defaultValue;
  }
  const nm::json &value = j.at(key);
  if constexpr (std::is_same_v<T, uint32_t>) {
    // get<uint32_t>() is a plain cast, -1 would become 4294967295
    if (!value.is_number_unsigned() ||
        value.get<uint64_t>() > std::numeric_limits<uint32_t>::max()) {
      throw ConfigError("'" + key + "' must be an unsigned 32-bit integer");
    }
  }
  return value.get<T>();
}

// Helper function: key must be present, the daemon has no sane default.
template <typename T> T getRequired(const nm::json &j, const std::string &key) {
  if (!j.contains(key)) {
    throw ConfigError("Key '" + key + "' missing in config file.");
  }
  return j.at(key).get<T>();
}

void validate(const Config &config) {
  if (config.wifi_interface.empty()) {
    throw ConfigError("wifi_interface must not be empty");
  }
  if (config.vpn_interface.empty()) {
    throw ConfigError("vpn_interface must not be empty");
  }
  // a zero mark would make the rule match unmarked traffic
  if (config.fwmark == 0) {
    throw ConfigError("fwmark must not be 0");
  }
  // unspec, default, main and local tables belong to the kernel
  if (config.table == 0 || (config.table >= 253 && config.table <= 255)) {
    throw ConfigError("table " + std::to_string(config.table) +
                      " is reserved");
  }
}
} // namespace
