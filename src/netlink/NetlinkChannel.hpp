// src/netlink/NetlinkChannel.hpp

// ---- NetlinkChannel Usage ---- //

// A request/response conversation with one kernel netlink protocol.
// NetlinkSocket is the real implementation, tests provide a simulated kernel.

// Example:
// NetlinkMessage request{RTM_GETRULE, NLM_F_REQUEST | NLM_F_DUMP, 0, 0,
//                        encodeRule(rule)};
// for (const auto &reply : channel.exchange(request)) { ... }

// exchange() fills in the sequence number and returns only the replies that
// belong to this request:
// - NLM_F_DUMP => every part up to the NLMSG_DONE terminator (not included)
// - NLM_F_ACK  => the replies received before the acknowledgement
// - otherwise  => the first reply
// Error replies throw KernelRejection, framing problems and timeouts throw
// ProtocolError.

#pragma once

#include <vector>

#include "NetlinkMessage.hpp"

class NetlinkChannel {
public:
  virtual ~NetlinkChannel() = default;

  virtual std::vector<NetlinkMessage> exchange(NetlinkMessage request) = 0;
};
