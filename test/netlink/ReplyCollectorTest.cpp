#include "Errors.hpp"
#include "NetlinkMessage.hpp"
#include "ReplyCollector.hpp"

#include <cerrno>
#include <cstring>
#include <gtest/gtest.h>
#include <linux/netlink.h>
#include <linux/rtnetlink.h>
#include <vector>

namespace {

constexpr uint32_t SEQUENCE = 4711;

std::vector<uint8_t> errorPayload(int32_t code) {
  std::vector<uint8_t> payload(sizeof(code) + NLMSG_HDRLEN, 0);
  std::memcpy(payload.data(), &code, sizeof(code));
  return payload;
}

NetlinkMessage part(uint32_t sequence = SEQUENCE, uint16_t flags = NLM_F_MULTI) {
  return {RTM_NEWRULE, flags, sequence, 0, {1, 2, 3, 4}};
}

NetlinkMessage done(int32_t code = 0, uint32_t sequence = SEQUENCE) {
  std::vector<uint8_t> payload(sizeof(code));
  std::memcpy(payload.data(), &code, sizeof(code));
  return {NLMSG_DONE, NLM_F_MULTI, sequence, 0, payload};
}

NetlinkMessage error(int32_t code, uint32_t sequence = SEQUENCE) {
  return {NLMSG_ERROR, 0, sequence, 0, errorPayload(code)};
}

// what recvmsg hands over: the messages as one encoded datagram
std::vector<NetlinkMessage> datagram(const std::vector<NetlinkMessage> &messages) {
  std::vector<uint8_t> bytes;
  for (const auto &message : messages) {
    std::vector<uint8_t> encoded = encodeMessage(message);
    bytes.insert(bytes.end(), encoded.begin(), encoded.end());
  }
  return decodeMessages(bytes.data(), bytes.size());
}

} // namespace

TEST(ReplyCollectorTests, DumpEndsAtDone) {
  ReplyCollector collector(NLM_F_REQUEST | NLM_F_DUMP, SEQUENCE, "dump");

  // a dump usually spans several datagrams
  EXPECT_FALSE(collector.add(datagram({part(), part()})));
  EXPECT_TRUE(collector.add(datagram({part(), done()})));
  EXPECT_EQ(collector.takeReplies().size(), 3u);
}

TEST(ReplyCollectorTests, DumpErrorInsideDoneIsRejection) {
  ReplyCollector collector(NLM_F_REQUEST | NLM_F_DUMP, SEQUENCE, "dump");
  collector.add(datagram({part()}));

  try {
    collector.add(datagram({done(-EPERM)}));
    FAIL() << "expected KernelRejection";
  } catch (const KernelRejection &rejection) {
    EXPECT_EQ(rejection.error(), EPERM);
  }
}

TEST(ReplyCollectorTests, UnterminatedDumpIsProtocolError) {
  ReplyCollector collector(NLM_F_REQUEST | NLM_F_DUMP, SEQUENCE, "dump");
  EXPECT_FALSE(collector.add(datagram({part(), part()})));

  // the socket timed out here
  ProtocolError timeout = collector.incomplete();
  EXPECT_NE(std::string(timeout.what()).find("dump not terminated"),
            std::string::npos);
}

TEST(ReplyCollectorTests, StaleSequenceNumbersAreSkipped) {
  ReplyCollector collector(NLM_F_REQUEST | NLM_F_DUMP, SEQUENCE, "dump");

  // leftovers of an earlier request and an unsolicited event (seq 0)
  EXPECT_FALSE(collector.add(
      datagram({part(SEQUENCE - 1), done(0, SEQUENCE - 1), part(0, 0)})));
  EXPECT_TRUE(collector.add(datagram({part(), done()})));
  EXPECT_EQ(collector.takeReplies().size(), 1u);
}

TEST(ReplyCollectorTests, StaleErrorDoesNotFailRequest) {
  ReplyCollector collector(NLM_F_REQUEST | NLM_F_ACK, SEQUENCE, "create");
  EXPECT_FALSE(collector.add(datagram({error(-EEXIST, SEQUENCE - 1)})));
  EXPECT_TRUE(collector.add(datagram({error(0)})));
  EXPECT_TRUE(collector.takeReplies().empty());
}

TEST(ReplyCollectorTests, AckAndRejection) {
  ReplyCollector acked(NLM_F_REQUEST | NLM_F_ACK, SEQUENCE, "create");
  EXPECT_TRUE(acked.add(datagram({error(0)})));

  ReplyCollector rejected(NLM_F_REQUEST | NLM_F_ACK, SEQUENCE, "create");
  try {
    rejected.add(datagram({error(-EEXIST)}));
    FAIL() << "expected KernelRejection";
  } catch (const KernelRejection &rejection) {
    EXPECT_EQ(rejection.error(), EEXIST);
  }
}

TEST(ReplyCollectorTests, PlainRequestTakesFirstReply) {
  ReplyCollector collector(NLM_F_REQUEST, SEQUENCE, "query");
  EXPECT_TRUE(collector.add(datagram({part(SEQUENCE, 0)})));
  EXPECT_EQ(collector.takeReplies().size(), 1u);

  ProtocolError timeout = collector.incomplete();
  EXPECT_NE(std::string(timeout.what()).find("no reply"), std::string::npos);
}

TEST(ReplyCollectorTests, NoopIsIgnoredAndOverrunThrows) {
  ReplyCollector collector(NLM_F_REQUEST | NLM_F_DUMP, SEQUENCE, "dump");
  EXPECT_FALSE(collector.add(datagram({{NLMSG_NOOP, 0, SEQUENCE, 0, {}}})));

  EXPECT_THROW(collector.add(datagram({{NLMSG_OVERRUN, 0, SEQUENCE, 0, {}}})),
               ProtocolError);
}

TEST(ReplyCollectorTests, TruncatedErrorMessageIsProtocolError) {
  ReplyCollector collector(NLM_F_REQUEST | NLM_F_ACK, SEQUENCE, "create");
  EXPECT_THROW(collector.add(datagram({{NLMSG_ERROR, 0, SEQUENCE, 0, {1}}})),
               ProtocolError);
}
