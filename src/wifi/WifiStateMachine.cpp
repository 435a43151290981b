// src/wifi/WifiStateMachine.cpp

#include "WifiStateMachine.hpp"
#include "Errors.hpp"
#include "GenericNetlink.hpp"
#include "Nl80211.hpp"

#include <cstring> // strerror

#include <linux/netlink.h>
#include <spdlog/spdlog.h>

namespace {

std::optional<uint32_t> readIfindex(const GenericMessage &message) {
  const auto *attribute = findAttribute(
      message.attributes, attributeType(Nl80211Attribute::IFINDEX));
  if (!attribute) {
    return std::nullopt;
  }
  return attribute->asU32();
}

std::optional<std::string> readString(const GenericMessage &message,
                                      Nl80211Attribute type) {
  const auto *attribute =
      findAttribute(message.attributes, attributeType(type));
  if (!attribute) {
    return std::nullopt;
  }
  return attribute->asString();
}

// an SSID is up to 32 raw bytes with no terminator, a null is part of it
std::optional<std::string> readSsid(const GenericMessage &message) {
  const auto *attribute = findAttribute(
      message.attributes, attributeType(Nl80211Attribute::SSID));
  if (!attribute) {
    return std::nullopt;
  }
  return attribute->asBytes();
}

} // namespace

WifiStateMachine::WifiStateMachine(const Config &config)
    : config_(config), state_(State::UNASSOCIATED) {}

WifiStateMachine::Action
WifiStateMachine::onInterfaceDump(const std::vector<GenericMessage> &interfaces) {
  for (const auto &interface : interfaces) {
    if (static_cast<Nl80211Command>(interface.command) !=
        Nl80211Command::NEW_INTERFACE) {
      continue;
    }
    if (readString(interface, Nl80211Attribute::IFNAME) !=
        config_.wifi_interface) {
      continue;
    }

    std::optional<uint32_t> ifindex = readIfindex(interface);
    if (!ifindex) {
      spdlog::warn("Interface {} listed without an interface index",
                   config_.wifi_interface);
      continue;
    }
    ifindex_ = ifindex;
    spdlog::info("Monitoring {} (ifindex {})", config_.wifi_interface,
                 *ifindex_);

    // already associated: reconcile now instead of waiting for a connect
    std::optional<std::string> ssid = readSsid(interface);
    if (!ssid) {
      spdlog::info("{} is not associated", config_.wifi_interface);
      state_ = State::UNASSOCIATED;
      return {};
    }

    ControlMessage decision = classify(*ssid);
    spdlog::info("{} is associated with '{}' => {}", config_.wifi_interface,
                 *ssid, toString(decision));
    state_ = State::ASSOCIATED;
    return {decision, std::nullopt};
  }

  spdlog::warn("Interface {} not found, waiting for the first connect event",
               config_.wifi_interface);
  return {};
}

WifiStateMachine::Action WifiStateMachine::onEvent(const GenericMessage &event) {
  switch (static_cast<Nl80211Command>(event.command)) {
  case Nl80211Command::CONNECT:
    return onConnect(event);
  case Nl80211Command::DISCONNECT:
    return onDisconnect();
  case Nl80211Command::NEW_INTERFACE:
    return onNewInterface(event);
  default:
    // the mlme group also carries authenticate, associate, roam, ...
    spdlog::trace("Ignoring nl80211 command {}", event.command);
    return {};
  }
}

WifiStateMachine::Action
WifiStateMachine::onMessage(const NetlinkMessage &message, uint16_t family) {
  switch (message.type) {
  case NLMSG_ERROR: {
    // answer to one of our SSID queries
    try {
      int32_t code = decodeErrorCode(message.payload);
      if (code < 0) {
        spdlog::warn("nl80211 query rejected: {}", std::strerror(-code));
      }
    } catch (const ProtocolError &error) {
      spdlog::error("Bad nl80211 message: {}", error.what());
    }
    return {};
  }
  case NLMSG_NOOP:
  case NLMSG_DONE:
    return {};
  default:
    break;
  }

  if (message.type != family) {
    spdlog::trace("Ignoring netlink message type {}", message.type);
    return {};
  }

  try {
    GenericMessage event = decodeGeneric(message.payload);
    spdlog::debug("nl80211 {} (seq {})",
                  commandName(static_cast<Nl80211Command>(event.command)),
                  message.sequence);
    return onEvent(event);
  } catch (const ProtocolError &error) {
    spdlog::error("Bad nl80211 message: {}", error.what());
    return {};
  }
}

WifiStateMachine::Action WifiStateMachine::onEventsLost() {
  if (!ifindex_) {
    return {};
  }
  spdlog::debug("Re-reading the SSID of ifindex {}", *ifindex_);
  return {std::nullopt, ifindex_};
}

ControlMessage WifiStateMachine::classify(const std::string &ssid) const {
  // TODO: an SSID is chosen by whoever runs the access point, matching on the
  // name alone lets anyone impersonate a known network; pin the BSSID too
  return config_.isKnownNetwork(ssid) ? ControlMessage::DISABLE
                                      : ControlMessage::ENABLE;
}

WifiStateMachine::State WifiStateMachine::getState() const { return state_; }

std::optional<uint32_t> WifiStateMachine::getIfindex() const { return ifindex_; }

NetlinkMessage WifiStateMachine::makeInterfaceQuery(uint16_t family,
                                                    uint32_t ifindex) {
  GenericMessage query{
      static_cast<uint8_t>(Nl80211Command::GET_INTERFACE),
      NL80211_REQUEST_VERSION,
      {makeU32Attribute(attributeType(Nl80211Attribute::IFINDEX), ifindex)}};
  return makeGenericRequest(family, query, NLM_F_REQUEST);
}

NetlinkMessage WifiStateMachine::makeInterfaceDump(uint16_t family) {
  GenericMessage query{static_cast<uint8_t>(Nl80211Command::GET_INTERFACE),
                       NL80211_REQUEST_VERSION,
                       {}};
  return makeGenericRequest(family, query, NLM_F_REQUEST | NLM_F_DUMP);
}

WifiStateMachine::Action
WifiStateMachine::onConnect(const GenericMessage &event) {
  std::optional<uint32_t> ifindex = readIfindex(event);
  if (!ifindex) {
    spdlog::warn("connect event without interface index, ignored");
    return {};
  }

  if (!ifindex_) {
    ifindex_ = ifindex;
    spdlog::info("Monitoring ifindex {}", *ifindex_);
  } else if (*ifindex_ != *ifindex) {
    spdlog::debug("connect on ifindex {}, monitoring {}, ignored", *ifindex,
                  *ifindex_);
    return {};
  }

  spdlog::debug("connect on ifindex {}, querying SSID", *ifindex_);
  state_ = State::RESOLVING_SSID;
  return {std::nullopt, ifindex_};
}

WifiStateMachine::Action WifiStateMachine::onDisconnect() {
  // no network is never a trusted network
  spdlog::info("Disconnected => {}", toString(ControlMessage::DISABLE));
  state_ = State::UNASSOCIATED;
  return {ControlMessage::DISABLE, std::nullopt};
}

WifiStateMachine::Action
WifiStateMachine::onNewInterface(const GenericMessage &event) {
  std::optional<uint32_t> ifindex = readIfindex(event);
  if (ifindex && ifindex_ && *ifindex != *ifindex_) {
    spdlog::debug("interface info for ifindex {}, monitoring {}, ignored",
                  *ifindex, *ifindex_);
    return {};
  }

  std::optional<std::string> ssid = readSsid(event);
  if (!ssid) {
    spdlog::debug("interface info without SSID, ignored");
    return {};
  }

  if (ifindex && !ifindex_ &&
      readString(event, Nl80211Attribute::IFNAME) == config_.wifi_interface) {
    ifindex_ = ifindex;
    spdlog::info("Monitoring {} (ifindex {})", config_.wifi_interface,
                 *ifindex_);
  }

  ControlMessage decision = classify(*ssid);
  spdlog::info("Associated with '{}' => {}", *ssid, toString(decision));
  state_ = State::ASSOCIATED;
  return {decision, std::nullopt};
}
