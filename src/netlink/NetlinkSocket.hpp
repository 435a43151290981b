// src/netlink/NetlinkSocket.hpp

// ---- NetlinkSocket Usage ---- //

// RAII wrapper around a raw AF_NETLINK socket for one protocol
// (NETLINK_ROUTE or NETLINK_GENERIC). The socket is closed on destruction.

// Blocking use (request/response, see NetlinkChannel):
// NetlinkSocket socket(NETLINK_ROUTE);
// auto replies = socket.exchange(request);

// Event stream use:
// socket.joinMulticast(group_id);
// socket.setNonBlocking(true);
// while (auto batch = socket.receive()) { ... } // nullopt => drained

// A socket is owned by exactly one component and is not safe to use from two
// threads at once.

// if modifying this class:
// - blocking sockets get NETLINK_REPLY_TIMEOUT as receive timeout so a
//   missing reply can never stall a worker forever
// - the receive buffer size is configurable in configs.hpp

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

#include "NetlinkChannel.hpp"

class NetlinkSocket : public NetlinkChannel {
public:
  explicit NetlinkSocket(int protocol);
  NetlinkSocket(int protocol, std::chrono::milliseconds reply_timeout);
  ~NetlinkSocket() override;

  NetlinkSocket(const NetlinkSocket &) = delete;
  NetlinkSocket &operator=(const NetlinkSocket &) = delete;

  std::vector<NetlinkMessage> exchange(NetlinkMessage request) override;

  void joinMulticast(uint32_t group);
  void setNonBlocking(bool non_blocking);

  // stamps the next sequence number into message and writes it out
  uint32_t send(NetlinkMessage &message);

  // one datagram worth of messages; nullopt when nothing is available
  // (non-blocking) or the receive timed out (blocking)
  std::optional<std::vector<NetlinkMessage>> receive();

  int fd() const { return fd_; }
  uint32_t portId() const { return port_id_; }

private:
  int fd_;
  int protocol_;
  uint32_t port_id_;
  uint32_t next_sequence_;
  std::vector<uint8_t> buffer_;
};
