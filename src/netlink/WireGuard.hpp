// src/netlink/WireGuard.hpp

// WireGuard generic netlink vocabulary (linux/wireguard.h).

#pragma once

#include <cstdint>

#include <linux/wireguard.h>

enum class WireGuardCommand : uint8_t {
  GET_DEVICE = WG_CMD_GET_DEVICE,
  SET_DEVICE = WG_CMD_SET_DEVICE,
};

enum class WireGuardDeviceAttribute : uint16_t {
  IFINDEX = WGDEVICE_A_IFINDEX,
  IFNAME = WGDEVICE_A_IFNAME,
  PRIVATE_KEY = WGDEVICE_A_PRIVATE_KEY,
  PUBLIC_KEY = WGDEVICE_A_PUBLIC_KEY,
  FLAGS = WGDEVICE_A_FLAGS,
  LISTEN_PORT = WGDEVICE_A_LISTEN_PORT,
  FWMARK = WGDEVICE_A_FWMARK,
  PEERS = WGDEVICE_A_PEERS,
};

constexpr uint16_t attributeType(WireGuardDeviceAttribute attribute) {
  return static_cast<uint16_t>(attribute);
}
