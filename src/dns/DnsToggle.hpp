// src/dns/DnsToggle.hpp

// ---- DnsToggle Usage ---- //

// Makes the VPN link the catch-all DNS route while the tunnel is enabled, so
// name lookups follow the traffic into the tunnel.

// Example:
// SdBusNetworkd networkd;
// DnsToggle dns(config, networkd);
// dns.handle(ControlMessage::ENABLE);  // vpn_interface gets ("", routing only)
// dns.handle(ControlMessage::DISABLE); // vpn_interface domains cleared

// The link index is looked up by name on every call, networkd may have
// recreated the link in between. enable() / disable() throw SystemBusError;
// handle() logs instead.

#pragma once

#include "ConfigManager.hpp"
#include "ControlMessage.hpp"
#include "NetworkdBus.hpp"

class DnsToggle {
public:
  DnsToggle(const Config &config, NetworkdBus &networkd);

  void enable();
  void disable();
  void handle(ControlMessage message);

private:
  const Config &config_;
  NetworkdBus &networkd_;
};
