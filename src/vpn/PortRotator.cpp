// src/vpn/PortRotator.cpp

#include "PortRotator.hpp"
#include "GenericNetlink.hpp"
#include "WireGuard.hpp"

#include <exception>

#include <linux/netlink.h>
#include <spdlog/spdlog.h>

PortRotator::PortRotator(const Config &config, NetlinkChannel &channel)
    : config_(config), channel_(channel) {}

void PortRotator::rotate() {
  // looked up every time, the module may have been reloaded since startup
  uint16_t family = resolveFamily(channel_, WG_GENL_NAME);

  channel_.exchange(makeRotateRequest(family, config_.vpn_interface));
  spdlog::info("Requested a new listen port for {}", config_.vpn_interface);
}

void PortRotator::handle(ControlMessage message) {
  if (message != ControlMessage::ENABLE) {
    return;
  }

  try {
    rotate();
  } catch (const std::exception &error) {
    spdlog::error("Port rotation on {} failed, keeping the current port: {}",
                  config_.vpn_interface, error.what());
  }
}

NetlinkMessage PortRotator::makeRotateRequest(uint16_t family,
                                              const std::string &interface) {
  GenericMessage request{
      static_cast<uint8_t>(WireGuardCommand::SET_DEVICE),
      WG_GENL_VERSION,
      {makeStringAttribute(attributeType(WireGuardDeviceAttribute::IFNAME),
                           interface),
       // 0 => the kernel picks a free port
       makeU16Attribute(attributeType(WireGuardDeviceAttribute::LISTEN_PORT),
                        0)}};
  return makeGenericRequest(family, request, NLM_F_REQUEST | NLM_F_ACK);
}
