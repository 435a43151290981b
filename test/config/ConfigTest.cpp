#include "ConfigManager.hpp"
#include "Errors.hpp"
#include "configs.hpp"

#include <fstream>
#include <gtest/gtest.h>
#include <string>

namespace {

// writes contents to a fresh file under the gtest temp dir
std::string writeConfig(const std::string &name, const std::string &contents) {
  std::string path = ::testing::TempDir() + name;
  std::ofstream out(path, std::ios::trunc);
  out << contents;
  return path;
}

} // namespace

TEST(ConfigTests, LoadFullConfig) {
  std::string path = writeConfig("full.json", R"({
    "vpn_interface": "wg1",
    "wifi_interface": "wlp2s0",
    "known_networks": ["Home", "Office"],
    "fwmark": 100,
    "table": 200,
    "ipv6": true,
    "manage_dns": false,
    "log_level": "debug",
    "log_file": "/tmp/wifi-tunnel.log"
  })");

  ConfigManager test_config_manager(path);
  const Config &config = test_config_manager.getConfig();
  EXPECT_EQ(config.vpn_interface, "wg1");
  EXPECT_EQ(config.wifi_interface, "wlp2s0");
  EXPECT_EQ(config.known_networks,
            (std::vector<std::string>{"Home", "Office"}));
  EXPECT_EQ(config.fwmark, 100u);
  EXPECT_EQ(config.table, 200u);
  EXPECT_TRUE(config.ipv6);
  EXPECT_FALSE(config.manage_dns);
  EXPECT_EQ(config.log_level, "debug");
  EXPECT_EQ(config.log_file, "/tmp/wifi-tunnel.log");
}

TEST(ConfigTests, LoadDefaultValues) {
  std::string path = writeConfig("minimal.json", R"({
    "wifi_interface": "wlan0",
    "known_networks": []
  })");

  ConfigManager test_config_manager(path);
  const Config &config = test_config_manager.getConfig();
  // Check if optional values are the same as the defaults
  EXPECT_EQ(config.vpn_interface, DEFAULT_VPN_INTERFACE);
  EXPECT_EQ(config.fwmark, DEFAULT_FWMARK);
  EXPECT_EQ(config.table, DEFAULT_TABLE);
  EXPECT_EQ(config.ipv6, DEFAULT_IPV6);
  EXPECT_EQ(config.manage_dns, DEFAULT_MANAGE_DNS);
  EXPECT_EQ(config.log_level, DEFAULT_LOG_LEVEL);
  EXPECT_TRUE(config.log_file.empty());
  EXPECT_TRUE(config.known_networks.empty());
}

TEST(ConfigTests, MissingFileIsFatal) {
  // Don't supply config file
  EXPECT_THROW(ConfigManager(""), ConfigError);
  EXPECT_THROW(ConfigManager(::testing::TempDir() + "does-not-exist.json"),
               ConfigError);
}

TEST(ConfigTests, UnparseableFileIsFatal) {
  std::string path = writeConfig("broken.json", R"({"wifi_interface": )");
  EXPECT_THROW(ConfigManager{path}, ConfigError);
}

TEST(ConfigTests, MissingRequiredKeys) {
  std::string no_wifi =
      writeConfig("no-wifi.json", R"({"known_networks": ["Home"]})");
  EXPECT_THROW(ConfigManager{no_wifi}, ConfigError);

  std::string no_networks =
      writeConfig("no-networks.json", R"({"wifi_interface": "wlan0"})");
  EXPECT_THROW(ConfigManager{no_networks}, ConfigError);
}

TEST(ConfigTests, WrongTypesAreRejected) {
  std::string path = writeConfig(
      "wrong-type.json",
      R"({"wifi_interface": "wlan0", "known_networks": "Home"})");
  EXPECT_THROW(ConfigManager{path}, ConfigError);

  std::string negative = writeConfig(
      "negative.json",
      R"({"wifi_interface": "wlan0", "known_networks": [], "fwmark": "x"})");
  EXPECT_THROW(ConfigManager{negative}, ConfigError);

  // integers must fit an unsigned 32-bit field without wrapping
  for (const char *field :
       {R"("fwmark": -1)", R"("table": 4294968296)", R"("fwmark": 51000.5)"}) {
    std::string path = writeConfig(
        "out-of-range.json",
        std::string(R"({"wifi_interface": "wlan0", "known_networks": [], )") +
            field + "}");
    EXPECT_THROW(ConfigManager{path}, ConfigError) << field;
  }
}

TEST(ConfigTests, ReservedValuesAreRejected) {
  for (const char *table : {"0", "253", "254", "255"}) {
    std::string path = writeConfig(
        "reserved-table.json",
        std::string(R"({"wifi_interface": "wlan0", "known_networks": [],)") +
            R"("table": )" + table + "}");
    EXPECT_THROW(ConfigManager{path}, ConfigError) << "table " << table;
  }

  std::string zero_mark = writeConfig(
      "zero-mark.json",
      R"({"wifi_interface": "wlan0", "known_networks": [], "fwmark": 0})");
  EXPECT_THROW(ConfigManager{zero_mark}, ConfigError);
}

TEST(ConfigTests, KnownNetworkIsExactMatch) {
  std::string path = writeConfig(
      "known.json",
      R"({"wifi_interface": "wlan0", "known_networks": ["Home", "Café"]})");

  ConfigManager test_config_manager(path);
  const Config &config = test_config_manager.getConfig();
  EXPECT_TRUE(config.isKnownNetwork("Home"));
  EXPECT_TRUE(config.isKnownNetwork("Café"));
  EXPECT_FALSE(config.isKnownNetwork("home"));
  EXPECT_FALSE(config.isKnownNetwork("Home "));
  EXPECT_FALSE(config.isKnownNetwork(""));
}
