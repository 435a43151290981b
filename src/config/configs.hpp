// src/config/configs.hpp

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

// Config file location
const std::string CONFIG_FILE_PATH = "/etc/wifi-tunnel-daemon/config.json";

// Defaults for optional config keys
const std::string DEFAULT_VPN_INTERFACE = "wg0";
constexpr uint32_t DEFAULT_FWMARK = 51000;
constexpr uint32_t DEFAULT_TABLE = 1000;
constexpr bool DEFAULT_IPV6 = false;
constexpr bool DEFAULT_MANAGE_DNS = true;
const std::string DEFAULT_LOG_LEVEL = "info";

// Logger name
const std::string LOGGER_NAME = "wifi-tunnel-daemon";

// Control bus: messages kept for subscribers that fall behind
constexpr std::size_t BUS_CAPACITY = 32;

// Runtime thread counts
constexpr std::size_t WORKER_THREADS = 2;
constexpr std::size_t BLOCKING_THREADS = 2;

// Netlink socket configuration
constexpr int SOCKET_BUFFER_SIZE = 1024 * 1024; // 1MB socket buffer
constexpr std::size_t NETLINK_RECEIVE_BUFFER_SIZE = 32768;
constexpr std::chrono::milliseconds NETLINK_REPLY_TIMEOUT{2000};

// systemd-networkd calls
constexpr std::chrono::milliseconds SYSTEM_BUS_CALL_TIMEOUT{2000};
