// src/netlink/NetlinkSocket.cpp

#include "NetlinkSocket.hpp"
#include "Errors.hpp"
#include "ReplyCollector.hpp"
#include "configs.hpp"

#include <cerrno>
#include <cstring> // strerror
#include <ctime>
#include <string>
#include <system_error>
#include <utility>

#include <fcntl.h> // F_GETFL, F_SETFL, O_NONBLOCK
#include <linux/netlink.h>
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace {

std::system_error socketError(const std::string &what) {
  return std::system_error(errno, std::system_category(), what);
}

} // namespace

NetlinkSocket::NetlinkSocket(int protocol)
    : NetlinkSocket(protocol, NETLINK_REPLY_TIMEOUT) {}

NetlinkSocket::NetlinkSocket(int protocol,
                             std::chrono::milliseconds reply_timeout)
    : fd_(-1), protocol_(protocol), port_id_(0),
      next_sequence_(static_cast<uint32_t>(std::time(nullptr))),
      buffer_(NETLINK_RECEIVE_BUFFER_SIZE) {
  fd_ = ::socket(AF_NETLINK, SOCK_RAW | SOCK_CLOEXEC, protocol);
  if (fd_ < 0) {
    throw socketError("socket(AF_NETLINK, " + std::to_string(protocol) + ")");
  }

  try {
    // Increase socket buffer size, a large dump or an event burst should not
    // end in ENOBUFS
    int opt = SOCKET_BUFFER_SIZE;
    if (setsockopt(fd_, SOL_SOCKET, SO_RCVBUF, &opt, sizeof(opt)) < 0) {
      spdlog::warn("Could not increase netlink socket buffer size: {}",
                   std::strerror(errno));
    }

    // Bounded wait for replies
    struct timeval timeout{};
    timeout.tv_sec = static_cast<time_t>(reply_timeout.count() / 1000);
    timeout.tv_usec = static_cast<suseconds_t>((reply_timeout.count() % 1000) *
                                               1000);
    if (setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout)) <
        0) {
      throw socketError("setsockopt(SO_RCVTIMEO)");
    }

    // let the kernel pick the port id
    struct sockaddr_nl address{};
    address.nl_family = AF_NETLINK;
    if (bind(fd_, reinterpret_cast<struct sockaddr *>(&address),
             sizeof(address)) < 0) {
      throw socketError("bind(AF_NETLINK)");
    }

    socklen_t address_length = sizeof(address);
    if (getsockname(fd_, reinterpret_cast<struct sockaddr *>(&address),
                    &address_length) < 0) {
      throw socketError("getsockname(AF_NETLINK)");
    }
    port_id_ = address.nl_pid;
  } catch (const std::exception &) {
    ::close(fd_);
    throw;
  }

  spdlog::debug("Opened netlink socket protocol {} port id {}", protocol_,
                port_id_);
}

NetlinkSocket::~NetlinkSocket() {
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

void NetlinkSocket::joinMulticast(uint32_t group) {
  if (setsockopt(fd_, SOL_NETLINK, NETLINK_ADD_MEMBERSHIP, &group,
                 sizeof(group)) < 0) {
    throw socketError("setsockopt(NETLINK_ADD_MEMBERSHIP, " +
                      std::to_string(group) + ")");
  }
  spdlog::debug("Joined netlink multicast group {}", group);
}

void NetlinkSocket::setNonBlocking(bool non_blocking) {
  // First get the current flags
  int flags = fcntl(fd_, F_GETFL, 0);
  if (flags == -1) {
    throw socketError("fcntl(F_GETFL)");
  }

  flags = non_blocking ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
  if (fcntl(fd_, F_SETFL, flags) == -1) {
    throw socketError("fcntl(F_SETFL)");
  }
}

uint32_t NetlinkSocket::send(NetlinkMessage &message) {
  // 0 is what unsolicited kernel events carry, never use it for a request
  if (++next_sequence_ == 0) {
    ++next_sequence_;
  }
  message.sequence = next_sequence_;
  message.port_id = port_id_;

  std::vector<uint8_t> bytes = encodeMessage(message);

  struct sockaddr_nl kernel{};
  kernel.nl_family = AF_NETLINK;

  for (;;) {
    ssize_t sent =
        sendto(fd_, bytes.data(), bytes.size(), 0,
               reinterpret_cast<struct sockaddr *>(&kernel), sizeof(kernel));
    if (sent >= 0) {
      break;
    }
    if (errno == EINTR) {
      continue;
    }
    throw socketError("sendto(AF_NETLINK)");
  }

  spdlog::debug("netlink send: protocol {} type {} flags {:#x} seq {}",
                protocol_, message.type, message.flags, message.sequence);
  return message.sequence;
}

std::optional<std::vector<NetlinkMessage>> NetlinkSocket::receive() {
  for (;;) {
    struct sockaddr_nl sender{};
    struct iovec iov{buffer_.data(), buffer_.size()};
    struct msghdr header{};
    header.msg_name = &sender;
    header.msg_namelen = sizeof(sender);
    header.msg_iov = &iov;
    header.msg_iovlen = 1;

    ssize_t received = recvmsg(fd_, &header, 0);

    if (received < 0) {
      if (errno == EINTR) {
        continue;
      }
      // nothing pending (non-blocking) or the receive timeout expired
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        return std::nullopt;
      }
      throw socketError("recvmsg(AF_NETLINK)");
    }

    if (received == 0) {
      throw std::system_error(ECONNRESET, std::system_category(),
                              "netlink socket closed");
    }

    if (header.msg_flags & MSG_TRUNC) {
      throw ProtocolError("netlink datagram larger than " +
                          std::to_string(buffer_.size()) + " bytes");
    }

    // only the kernel (port 0) talks to us
    if (sender.nl_pid != 0) {
      spdlog::warn("Dropping netlink datagram from port {}", sender.nl_pid);
      continue;
    }

    return decodeMessages(buffer_.data(), static_cast<size_t>(received));
  }
}

std::vector<NetlinkMessage> NetlinkSocket::exchange(NetlinkMessage request) {
  const std::string context = "netlink request type " +
                              std::to_string(request.type) + " (protocol " +
                              std::to_string(protocol_) + ")";

  const uint32_t sequence = send(request);
  ReplyCollector collector(request.flags, sequence, context);

  for (;;) {
    std::optional<std::vector<NetlinkMessage>> batch;
    try {
      batch = receive();
    } catch (const std::system_error &error) {
      if (error.code().value() == ENOBUFS) {
        throw ProtocolError(context + ": replies lost to a receive overrun");
      }
      throw;
    }

    if (!batch) {
      throw collector.incomplete();
    }
    if (collector.add(std::move(*batch))) {
      return collector.takeReplies();
    }
  }
}
