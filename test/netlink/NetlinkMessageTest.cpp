#include "Errors.hpp"
#include "NetlinkMessage.hpp"

#include <cerrno>
#include <cstring>
#include <gtest/gtest.h>
#include <linux/fib_rules.h>
#include <linux/genetlink.h>
#include <linux/netlink.h>
#include <linux/rtnetlink.h>
#include <sys/socket.h>
#include <vector>

namespace {

std::vector<uint8_t> encode(const AttributeList &attributes) {
  std::vector<uint8_t> bytes;
  encodeAttributes(attributes, bytes);
  return bytes;
}

uint16_t readU16At(const std::vector<uint8_t> &bytes, size_t offset) {
  uint16_t value;
  std::memcpy(&value, bytes.data() + offset, sizeof(value));
  return value;
}

} // namespace

TEST(NetlinkMessageTests, StringAttributeIsNullTerminatedAndPadded) {
  // "wlan0" + null = 6 bytes, header 4 => length 10, padded to 12
  auto bytes = encode({makeStringAttribute(3, "wlan0")});
  ASSERT_EQ(bytes.size(), 12u);
  EXPECT_EQ(readU16At(bytes, 0), 10);
  EXPECT_EQ(readU16At(bytes, 2), 3);
  EXPECT_EQ(bytes[NLA_HDRLEN + 5], 0);
  // padding is zeroed
  EXPECT_EQ(bytes[10], 0);
  EXPECT_EQ(bytes[11], 0);
}

TEST(NetlinkMessageTests, U16AttributeLengthExcludesPadding) {
  auto bytes = encode({makeU16Attribute(6, 51820), makeU32Attribute(7, 1)});
  ASSERT_EQ(bytes.size(), 16u);
  EXPECT_EQ(readU16At(bytes, 0), 6);
  // second attribute starts on the next 4 byte boundary
  EXPECT_EQ(readU16At(bytes, 8), 8);
  EXPECT_EQ(readU16At(bytes, 10), 7);
}

TEST(NetlinkMessageTests, IntegersUseHostByteOrder) {
  const uint32_t value = 0x01020304;
  auto bytes = encode({makeU32Attribute(1, value)});

  uint8_t expected[sizeof(value)];
  std::memcpy(expected, &value, sizeof(value));
  EXPECT_EQ(std::memcmp(bytes.data() + NLA_HDRLEN, expected, sizeof(value)), 0);
}

TEST(NetlinkMessageTests, EmptyAttributeHasHeaderOnly) {
  auto bytes = encode({makeEmptyAttribute(FRA_SRC)});
  ASSERT_EQ(bytes.size(), static_cast<size_t>(NLA_HDRLEN));

  AttributeList decoded = decodeAttributes(bytes.data(), bytes.size());
  ASSERT_EQ(decoded.size(), 1u);
  EXPECT_EQ(decoded[0].type, FRA_SRC);
  EXPECT_TRUE(decoded[0].payload.empty());
}

TEST(NetlinkMessageTests, DecodeMasksNestedFlag) {
  auto bytes = encode({makeNestedAttribute(
      CTRL_ATTR_MCAST_GROUPS, {makeU32Attribute(CTRL_ATTR_MCAST_GRP_ID, 9)})});
  EXPECT_TRUE(readU16At(bytes, 2) & NLA_F_NESTED);

  AttributeList decoded = decodeAttributes(bytes.data(), bytes.size());
  ASSERT_EQ(decoded.size(), 1u);
  EXPECT_EQ(decoded[0].type, CTRL_ATTR_MCAST_GROUPS);
  AttributeList inner = decoded[0].asNested();
  ASSERT_EQ(inner.size(), 1u);
  EXPECT_EQ(inner[0].asU32(), 9u);
}

TEST(NetlinkMessageTests, AttributeOverrunThrows) {
  auto bytes = encode({makeU32Attribute(1, 42)});
  // claim more bytes than there are
  uint16_t bogus = 64;
  std::memcpy(bytes.data(), &bogus, sizeof(bogus));
  EXPECT_THROW(decodeAttributes(bytes.data(), bytes.size()), ProtocolError);
}

TEST(NetlinkMessageTests, TruncatedAttributeHeaderThrows) {
  std::vector<uint8_t> bytes = {8, 0};
  EXPECT_THROW(decodeAttributes(bytes.data(), bytes.size()), ProtocolError);
}

TEST(NetlinkMessageTests, IntegerAccessorsCheckSize) {
  NetlinkAttribute attribute = makeU16Attribute(1, 5);
  EXPECT_EQ(attribute.asU16(), 5);
  EXPECT_THROW(attribute.asU32(), ProtocolError);
}

TEST(NetlinkMessageTests, StringAccessorKeepsRawBytes) {
  // not valid UTF-8, must come back untouched
  NetlinkAttribute ssid{1, {'C', 'a', 'f', 0xe9, 0xff}};
  EXPECT_EQ(ssid.asString(), std::string("Caf\xe9\xff"));

  NetlinkAttribute terminated = makeStringAttribute(1, "Home");
  EXPECT_EQ(terminated.asString(), "Home");
}

TEST(NetlinkMessageTests, BytesAccessorKeepsEmbeddedNulls) {
  NetlinkAttribute ssid{1, {'H', 'o', 'm', 'e', 0, 'x'}};
  EXPECT_EQ(ssid.asBytes(), std::string("Home\0x", 6));
  EXPECT_EQ(ssid.asString(), "Home");
}

TEST(NetlinkMessageTests, FindAttributeReturnsFirstMatch) {
  AttributeList attributes = {makeU32Attribute(1, 10), makeU32Attribute(2, 20),
                              makeU32Attribute(2, 30)};
  ASSERT_NE(findAttribute(attributes, 2), nullptr);
  EXPECT_EQ(findAttribute(attributes, 2)->asU32(), 20u);
  EXPECT_EQ(findAttribute(attributes, 3), nullptr);
}

TEST(NetlinkMessageTests, DatagramWithSeveralMessages) {
  std::vector<uint8_t> datagram =
      encodeMessage({RTM_NEWRULE, NLM_F_MULTI, 7, 0, {1, 2, 3}});
  std::vector<uint8_t> done = encodeMessage({NLMSG_DONE, NLM_F_MULTI, 7, 0,
                                             std::vector<uint8_t>(4, 0)});
  datagram.insert(datagram.end(), done.begin(), done.end());

  std::vector<NetlinkMessage> messages =
      decodeMessages(datagram.data(), datagram.size());
  ASSERT_EQ(messages.size(), 2u);
  EXPECT_EQ(messages[0].type, RTM_NEWRULE);
  EXPECT_EQ(messages[0].sequence, 7u);
  EXPECT_EQ(messages[0].payload, (std::vector<uint8_t>{1, 2, 3}));
  EXPECT_EQ(messages[1].type, NLMSG_DONE);
  EXPECT_EQ(decodeErrorCode(messages[1].payload), 0);
}

TEST(NetlinkMessageTests, TruncatedMessageThrows) {
  std::vector<uint8_t> bytes =
      encodeMessage({RTM_NEWRULE, 0, 1, 0, std::vector<uint8_t>(12, 0)});
  EXPECT_THROW(decodeMessages(bytes.data(), bytes.size() - 4), ProtocolError);
  EXPECT_THROW(decodeMessages(bytes.data(), NLMSG_HDRLEN - 1), ProtocolError);
}

TEST(NetlinkMessageTests, GenericHeaderFields) {
  GenericMessage message{CTRL_CMD_GETFAMILY, 1,
                         {makeStringAttribute(CTRL_ATTR_FAMILY_NAME, "nl80211")}};
  std::vector<uint8_t> payload = encodeGeneric(message);
  EXPECT_EQ(payload[0], CTRL_CMD_GETFAMILY);
  EXPECT_EQ(payload[1], 1);

  GenericMessage decoded = decodeGeneric(payload);
  ASSERT_EQ(decoded.attributes.size(), 1u);
  EXPECT_EQ(decoded.attributes[0].asString(), "nl80211");

  EXPECT_THROW(decodeGeneric({1, 2}), ProtocolError);
}

TEST(NetlinkMessageTests, RuleHeaderLayout) {
  RuleMessage rule{};
  rule.family = AF_INET6;
  rule.table = RT_TABLE_UNSPEC;
  rule.action = FR_ACT_TO_TBL;
  rule.attributes = {makeU32Attribute(FRA_TABLE, 1000)};

  std::vector<uint8_t> payload = encodeRule(rule);
  struct fib_rule_hdr header;
  std::memcpy(&header, payload.data(), sizeof(header));
  EXPECT_EQ(header.family, AF_INET6);
  EXPECT_EQ(header.action, FR_ACT_TO_TBL);

  EXPECT_THROW(decodeRule({0, 0, 0}), ProtocolError);
}

TEST(NetlinkMessageTests, ErrorCodeIsSigned) {
  int32_t code = -ENOENT;
  std::vector<uint8_t> payload(sizeof(code) + NLMSG_HDRLEN, 0);
  std::memcpy(payload.data(), &code, sizeof(code));
  EXPECT_EQ(decodeErrorCode(payload), -ENOENT);
  EXPECT_THROW(decodeErrorCode({0, 0}), ProtocolError);
}
