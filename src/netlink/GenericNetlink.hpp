// src/netlink/GenericNetlink.hpp

// ---- Generic netlink helpers ---- //

// Generic netlink families (nl80211, wireguard, ...) get their numeric id
// when the kernel module registers them, so every id has to be looked up by
// name through the nlctrl controller family before use.

// Example:
// NetlinkSocket socket(NETLINK_GENERIC);
// uint16_t nl80211 = resolveFamily(socket, NL80211_GENL_NAME);
// uint32_t mlme = resolveMulticastGroup(socket, NL80211_GENL_NAME,
//                                       NL80211_MULTICAST_GROUP_MLME);
// socket.joinMulticast(mlme);

// An unregistered family (module not loaded) makes the kernel answer ENOENT,
// which surfaces as KernelRejection. A family without the requested group
// throws ProtocolError.

#pragma once

#include <cstdint>
#include <map>
#include <string>

#include "NetlinkChannel.hpp"
#include "NetlinkMessage.hpp"

struct GenericFamily {
  uint16_t id;
  std::string name;
  std::map<std::string, uint32_t> multicast_groups;
};

GenericFamily queryFamily(NetlinkChannel &channel, const std::string &name);

uint16_t resolveFamily(NetlinkChannel &channel, const std::string &name);

uint32_t resolveMulticastGroup(NetlinkChannel &channel,
                               const std::string &family_name,
                               const std::string &group_name);

// wraps a generic message for the given family into a netlink request
NetlinkMessage makeGenericRequest(uint16_t family, const GenericMessage &message,
                                  uint16_t flags);

// parses the attributes of a CTRL_CMD_NEWFAMILY reply
GenericFamily parseFamily(const GenericMessage &reply);
