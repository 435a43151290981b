// src/netlink/ReplyCollector.hpp

// ---- ReplyCollector Usage ---- //

// Sorts the datagrams received after one request into the replies that
// belong to it. NetlinkSocket::exchange feeds it whatever recvmsg returns.

// Example:
// ReplyCollector collector(request.flags, sequence, "RTM_GETRULE");
// while (!collector.add(receiveOneDatagram())) {}
// std::vector<NetlinkMessage> rules = collector.takeReplies();

// add() returns true once the exchange is over:
// - NLMSG_DONE ends a dump, a negative code inside it throws KernelRejection
// - NLMSG_ERROR is an acknowledgement (code 0) or throws KernelRejection
// - without DUMP or ACK the first non-multipart reply ends it
// Messages with another sequence number (stale replies, events) and NOOPs are
// skipped. NLMSG_OVERRUN throws ProtocolError. Terminators are never part of
// the collected replies.

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "Errors.hpp"
#include "NetlinkMessage.hpp"

class ReplyCollector {
public:
  ReplyCollector(uint16_t request_flags, uint32_t sequence,
                 std::string context);

  bool add(std::vector<NetlinkMessage> batch);

  std::vector<NetlinkMessage> takeReplies();

  // what to throw when the replies stop before add() returned true
  ProtocolError incomplete() const;

  const std::string &context() const { return context_; }

private:
  bool dump_;
  bool ack_;
  uint32_t sequence_;
  std::string context_;
  std::vector<NetlinkMessage> replies_;
};
