// src/bus/ControlMessage.hpp

#pragma once

#include <string_view>

// ENABLE  => untrusted network, route through the VPN
// DISABLE => trusted network or no network, revert
// QUIT    => subscribers stop after this one
enum class ControlMessage { ENABLE, DISABLE, QUIT };

inline std::string_view toString(ControlMessage message) {
  switch (message) {
  case ControlMessage::ENABLE:
    return "enable";
  case ControlMessage::DISABLE:
    return "disable";
  case ControlMessage::QUIT:
    return "quit";
  }
  return "unknown";
}
