// src/dns/DnsToggle.cpp

#include "DnsToggle.hpp"

#include <exception>

#include <spdlog/spdlog.h>

DnsToggle::DnsToggle(const Config &config, NetworkdBus &networkd)
    : config_(config), networkd_(networkd) {}

void DnsToggle::enable() {
  int32_t ifindex = networkd_.getLinkByName(config_.vpn_interface);
  networkd_.setLinkDomains(ifindex, {{"", true}});
  spdlog::info("DNS routed through {}", config_.vpn_interface);
}

void DnsToggle::disable() {
  int32_t ifindex = networkd_.getLinkByName(config_.vpn_interface);
  networkd_.setLinkDomains(ifindex, {});
  spdlog::info("DNS routing domains cleared on {}", config_.vpn_interface);
}

void DnsToggle::handle(ControlMessage message) {
  try {
    switch (message) {
    case ControlMessage::ENABLE:
      enable();
      break;
    case ControlMessage::DISABLE:
      disable();
      break;
    case ControlMessage::QUIT:
      break;
    }
  } catch (const std::exception &error) {
    spdlog::error("DNS update on {} failed: {}", toString(message),
                  error.what());
  }
}
