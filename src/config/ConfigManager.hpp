// src/config/ConfigManager.hpp

// ---- ConfigManager Usage ---- //

// The constructor loads values from a JSON file. Unlike a tunable setting,
// the daemon cannot guess which WiFi interface or which networks to trust, so
// a missing or unreadable file throws ConfigError instead of falling back to
// defaults.
// Example:
// ConfigManager mgr = ConfigManager("/etc/wifi-tunnel-daemon/config.json");

// getConfig() returns a reference to the loaded Config. The Config never
// changes after load, so the reference can be handed to every component
// without locking.
// Example:
// const Config &config = mgr.getConfig();

// Optional keys that are missing are logged and replaced with the defaults
// in configs.hpp.

#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct Config {
  // WireGuard interface the policy rules route into
  std::string vpn_interface;

  // the single WiFi interface being monitored
  std::string wifi_interface;

  // trusted network names (SSIDs), in file order
  std::vector<std::string> known_networks;

  // packets carrying this mark are looked up in table
  uint32_t fwmark;
  uint32_t table;

  bool ipv6;

  // systemd-networkd DNS routing domain toggle
  bool manage_dns;

  std::string log_level;
  std::string log_file;

  bool isKnownNetwork(const std::string &ssid) const;
};

class ConfigManager {
public:
  explicit ConfigManager(const std::string &config_file);

  const Config &getConfig() const;

private:
  std::string config_file_;
  Config config_;

  void loadConfig();
};
