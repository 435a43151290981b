// src/netlink/Nl80211.hpp

// nl80211 commands and attributes this daemon reads or writes. Values are the
// kernel's (linux/nl80211.h); anything not listed here is passed over by the
// default arm of a switch.

#pragma once

#include <cstdint>
#include <string_view>

#include <linux/nl80211.h>

enum class Nl80211Command : uint8_t {
  GET_INTERFACE = NL80211_CMD_GET_INTERFACE,
  SET_INTERFACE = NL80211_CMD_SET_INTERFACE,
  NEW_INTERFACE = NL80211_CMD_NEW_INTERFACE,
  DEL_INTERFACE = NL80211_CMD_DEL_INTERFACE,
  AUTHENTICATE = NL80211_CMD_AUTHENTICATE,
  ASSOCIATE = NL80211_CMD_ASSOCIATE,
  DEAUTHENTICATE = NL80211_CMD_DEAUTHENTICATE,
  DISASSOCIATE = NL80211_CMD_DISASSOCIATE,
  CONNECT = NL80211_CMD_CONNECT,
  ROAM = NL80211_CMD_ROAM,
  DISCONNECT = NL80211_CMD_DISCONNECT,
};

enum class Nl80211Attribute : uint16_t {
  WIPHY = NL80211_ATTR_WIPHY,
  IFINDEX = NL80211_ATTR_IFINDEX,
  IFNAME = NL80211_ATTR_IFNAME,
  IFTYPE = NL80211_ATTR_IFTYPE,
  MAC = NL80211_ATTR_MAC,
  SSID = NL80211_ATTR_SSID,
  STATUS_CODE = NL80211_ATTR_STATUS_CODE,
  REASON_CODE = NL80211_ATTR_REASON_CODE,
};

// version field of the genl header for nl80211 requests
constexpr uint8_t NL80211_REQUEST_VERSION = 0;

constexpr uint16_t attributeType(Nl80211Attribute attribute) {
  return static_cast<uint16_t>(attribute);
}

inline std::string_view commandName(Nl80211Command command) {
  switch (command) {
  case Nl80211Command::GET_INTERFACE:
    return "get_interface";
  case Nl80211Command::SET_INTERFACE:
    return "set_interface";
  case Nl80211Command::NEW_INTERFACE:
    return "new_interface";
  case Nl80211Command::DEL_INTERFACE:
    return "del_interface";
  case Nl80211Command::AUTHENTICATE:
    return "authenticate";
  case Nl80211Command::ASSOCIATE:
    return "associate";
  case Nl80211Command::DEAUTHENTICATE:
    return "deauthenticate";
  case Nl80211Command::DISASSOCIATE:
    return "disassociate";
  case Nl80211Command::CONNECT:
    return "connect";
  case Nl80211Command::ROAM:
    return "roam";
  case Nl80211Command::DISCONNECT:
    return "disconnect";
  }
  return "unknown";
}
