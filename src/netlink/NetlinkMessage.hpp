// src/netlink/NetlinkMessage.hpp

// ---- Netlink message codec ---- //

// Plain value types for the three message shapes this daemon exchanges with
// the kernel, plus the functions that turn them into wire bytes and back.

// NetlinkMessage  => nlmsghdr + opaque payload
// GenericMessage  => genlmsghdr + attributes (nl80211, wireguard, nlctrl)
// RuleMessage     => fib_rule_hdr + attributes (rtnetlink rules)

// Example:
// GenericMessage query{CTRL_CMD_GETFAMILY, 1,
//                      {makeStringAttribute(CTRL_ATTR_FAMILY_NAME, "nl80211")}};
// NetlinkMessage request{GENL_ID_CTRL, NLM_F_REQUEST, 0, 0,
//                        encodeGeneric(query)};
// std::vector<uint8_t> bytes = encodeMessage(request);

// Wire rules (see netlink(7)):
// - every header and attribute starts on a 4 byte boundary, the padding is
//   not counted in the attribute length but is counted in the message length
// - fixed width integers are in host byte order, NOT network order
// - strings are null terminated

// Decoding never trusts a length field: anything that would read past the
// end of the buffer throws ProtocolError.

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct NetlinkAttribute {
  uint16_t type;
  std::vector<uint8_t> payload;

  uint16_t asU16() const;
  uint32_t asU32() const;
  // drops the terminating null (and anything after it), keeps other bytes
  // as-is
  std::string asString() const;
  // every byte of the payload, embedded nulls included (SSIDs)
  std::string asBytes() const;
  std::vector<NetlinkAttribute> asNested() const;
};

using AttributeList = std::vector<NetlinkAttribute>;

NetlinkAttribute makeU16Attribute(uint16_t type, uint16_t value);
NetlinkAttribute makeU32Attribute(uint16_t type, uint32_t value);
NetlinkAttribute makeStringAttribute(uint16_t type, const std::string &value);
NetlinkAttribute makeEmptyAttribute(uint16_t type);
NetlinkAttribute makeNestedAttribute(uint16_t type,
                                     const AttributeList &attributes);

// first attribute of the given type, or nullptr
const NetlinkAttribute *findAttribute(const AttributeList &attributes,
                                      uint16_t type);

void encodeAttributes(const AttributeList &attributes,
                      std::vector<uint8_t> &out);
AttributeList decodeAttributes(const uint8_t *data, size_t length);

struct NetlinkMessage {
  uint16_t type;
  uint16_t flags;
  uint32_t sequence;
  uint32_t port_id;
  std::vector<uint8_t> payload;
};

std::vector<uint8_t> encodeMessage(const NetlinkMessage &message);

// a single datagram may hold several messages back to back
std::vector<NetlinkMessage> decodeMessages(const uint8_t *data, size_t length);

struct GenericMessage {
  uint8_t command;
  uint8_t version;
  AttributeList attributes;
};

std::vector<uint8_t> encodeGeneric(const GenericMessage &message);
GenericMessage decodeGeneric(const std::vector<uint8_t> &payload);

// fib_rule_hdr; the field names follow the kernel struct, which overlays
// rtmsg (res1 = protocol, res2 = scope, action = type)
struct RuleMessage {
  uint8_t family;
  uint8_t dst_len;
  uint8_t src_len;
  uint8_t tos;
  uint8_t table;
  uint8_t protocol;
  uint8_t scope;
  uint8_t action;
  uint32_t flags;
  AttributeList attributes;
};

std::vector<uint8_t> encodeRule(const RuleMessage &message);
RuleMessage decodeRule(const std::vector<uint8_t> &payload);

// payload of NLMSG_ERROR (an ack when the error is 0) and of NLMSG_DONE;
// returns the kernel's value as-is, i.e. 0 or a negative errno
int32_t decodeErrorCode(const std::vector<uint8_t> &payload);
