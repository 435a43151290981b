// src/wifi/WifiStateMachine.hpp

// ---- WifiStateMachine Usage ---- //

// Turns decoded nl80211 messages into VPN decisions. It performs no I/O:
// every call returns an Action telling the caller what to publish and
// whether to ask the kernel for the interface's SSID.

// Example:
// WifiStateMachine machine(config);
// WifiStateMachine::Action action = machine.onMessage(message, family);
// if (action.query_ifindex) socket.send(makeInterfaceQuery(family, *action.query_ifindex));
// if (action.publish) bus.publish(*action.publish);

// States:
// UNASSOCIATED   => no network, or we don't know yet
// RESOLVING_SSID => connected, waiting for the SSID of ifindex()
// ASSOCIATED     => SSID classified and a decision published

// Transitions:
// connect       => cache the interface index if none is cached yet; an event
//                  for another index is ignored; otherwise query the SSID
// disconnect    => always DISABLE
// new_interface => with an SSID: DISABLE when the SSID is a known network,
//                  ENABLE otherwise; without an SSID: ignored
// anything else => ignored

// onMessage() takes whatever arrives on the event socket: replies to our
// SSID queries (a rejection is logged), messages of other families and
// malformed payloads are dropped without touching the state.
// onEventsLost() is for a receive overrun: the SSID is queried again so a
// missed connect or disconnect cannot leave a stale decision in place.

// The interface index is resolved once and kept for the process lifetime,
// only the configured interface is tracked.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "ConfigManager.hpp"
#include "ControlMessage.hpp"
#include "NetlinkMessage.hpp"

class WifiStateMachine {
public:
  enum class State { UNASSOCIATED, RESOLVING_SSID, ASSOCIATED };

  struct Action {
    std::optional<ControlMessage> publish;
    std::optional<uint32_t> query_ifindex;
  };

  explicit WifiStateMachine(const Config &config);

  // replies to the startup dump of all wireless interfaces
  Action onInterfaceDump(const std::vector<GenericMessage> &interfaces);

  Action onEvent(const GenericMessage &event);

  // family is the resolved nl80211 id
  Action onMessage(const NetlinkMessage &message, uint16_t family);

  Action onEventsLost();

  // DISABLE for a known (trusted) network, ENABLE for anything else
  ControlMessage classify(const std::string &ssid) const;

  State getState() const;
  std::optional<uint32_t> getIfindex() const;

  // NL80211_CMD_GET_INTERFACE for one interface, or a dump of all of them
  static NetlinkMessage makeInterfaceQuery(uint16_t family, uint32_t ifindex);
  static NetlinkMessage makeInterfaceDump(uint16_t family);

private:
  Action onConnect(const GenericMessage &event);
  Action onDisconnect();
  Action onNewInterface(const GenericMessage &event);

  const Config &config_;
  State state_;
  std::optional<uint32_t> ifindex_;
};
