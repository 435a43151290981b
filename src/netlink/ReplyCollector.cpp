// src/netlink/ReplyCollector.cpp

#include "ReplyCollector.hpp"

#include <utility>

#include <linux/netlink.h>
#include <spdlog/spdlog.h>

ReplyCollector::ReplyCollector(uint16_t request_flags, uint32_t sequence,
                               std::string context)
    : dump_((request_flags & NLM_F_DUMP) == NLM_F_DUMP),
      ack_((request_flags & NLM_F_ACK) != 0), sequence_(sequence),
      context_(std::move(context)) {}

bool ReplyCollector::add(std::vector<NetlinkMessage> batch) {
  for (auto &message : batch) {
    // stale reply to an earlier request that timed out, or an event
    if (message.sequence != sequence_) {
      spdlog::trace("netlink skip: type {} seq {} while waiting for seq {}",
                    message.type, message.sequence, sequence_);
      continue;
    }

    switch (message.type) {
    case NLMSG_NOOP:
      continue;
    case NLMSG_OVERRUN:
      throw ProtocolError(context_ + ": kernel reported overrun");
    case NLMSG_ERROR: {
      int32_t code = decodeErrorCode(message.payload);
      if (code < 0) {
        throw KernelRejection(-code, context_);
      }
      // acknowledgement
      return true;
    }
    case NLMSG_DONE: {
      // dump errors are reported through the terminator
      if (message.payload.size() >= sizeof(int32_t)) {
        int32_t code = decodeErrorCode(message.payload);
        if (code < 0) {
          throw KernelRejection(-code, context_);
        }
      }
      return true;
    }
    default:
      break;
    }

    const bool multipart = (message.flags & NLM_F_MULTI) != 0;
    replies_.push_back(std::move(message));

    if (!dump_ && !ack_ && !multipart) {
      return true;
    }
  }
  return false;
}

std::vector<NetlinkMessage> ReplyCollector::takeReplies() {
  return std::move(replies_);
}

ProtocolError ReplyCollector::incomplete() const {
  return ProtocolError(context_ +
                       (dump_ ? ": dump not terminated" : ": no reply") +
                       " within timeout");
}
