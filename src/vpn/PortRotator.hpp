// src/vpn/PortRotator.hpp

// ---- PortRotator Usage ---- //

// Asks the WireGuard module for a fresh listen port every time the tunnel is
// enabled. Some networks block a port that worked elsewhere; a new one
// improves the odds of getting through.

// Example:
// NetlinkSocket genl(NETLINK_GENERIC);
// PortRotator rotator(config, genl);
// rotator.handle(ControlMessage::ENABLE);

// rotate() sends SET_DEVICE { IFNAME = vpn_interface, LISTEN_PORT = 0 } and
// throws on failure. handle() is the bus entry point: it only reacts to
// ENABLE and logs failures, the tunnel then keeps its previous port.

// Calls block on the netlink socket; run them on the blocking pool.

#pragma once

#include <cstdint>
#include <string>

#include "ConfigManager.hpp"
#include "ControlMessage.hpp"
#include "NetlinkChannel.hpp"

class PortRotator {
public:
  PortRotator(const Config &config, NetlinkChannel &channel);

  void rotate();
  void handle(ControlMessage message);

  static NetlinkMessage makeRotateRequest(uint16_t family,
                                          const std::string &interface);

private:
  const Config &config_;
  NetlinkChannel &channel_;
};
