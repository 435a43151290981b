// src/netlink/NetlinkMessage.cpp

#include "NetlinkMessage.hpp"
#include "Errors.hpp"

#include <algorithm>
#include <cstring> // memcpy

#include <linux/fib_rules.h>
#include <linux/genetlink.h>
#include <linux/netlink.h>

namespace {

// copy a fixed width value in host byte order, the way the kernel lays it out
template <typename T> T readNative(const std::vector<uint8_t> &payload) {
  if (payload.size() != sizeof(T)) {
    throw ProtocolError("attribute holds " + std::to_string(payload.size()) +
                        " bytes, expected " + std::to_string(sizeof(T)));
  }
  T value;
  std::memcpy(&value, payload.data(), sizeof(T));
  return value;
}

template <typename T> std::vector<uint8_t> writeNative(T value) {
  std::vector<uint8_t> bytes(sizeof(T));
  std::memcpy(bytes.data(), &value, sizeof(T));
  return bytes;
}

// pad with zeros up to the next 4 byte boundary
void pad(std::vector<uint8_t> &out) { out.resize(NLA_ALIGN(out.size()), 0); }

} // namespace

uint16_t NetlinkAttribute::asU16() const { return readNative<uint16_t>(payload); }

uint32_t NetlinkAttribute::asU32() const { return readNative<uint32_t>(payload); }

std::string NetlinkAttribute::asString() const {
  auto end = std::find(payload.begin(), payload.end(), uint8_t{0});
  return std::string(payload.begin(), end);
}

std::string NetlinkAttribute::asBytes() const {
  return std::string(payload.begin(), payload.end());
}

AttributeList NetlinkAttribute::asNested() const {
  return decodeAttributes(payload.data(), payload.size());
}

NetlinkAttribute makeU16Attribute(uint16_t type, uint16_t value) {
  return {type, writeNative(value)};
}

NetlinkAttribute makeU32Attribute(uint16_t type, uint32_t value) {
  return {type, writeNative(value)};
}

NetlinkAttribute makeStringAttribute(uint16_t type, const std::string &value) {
  NetlinkAttribute attribute{type, {value.begin(), value.end()}};
  attribute.payload.push_back(0);
  return attribute;
}

NetlinkAttribute makeEmptyAttribute(uint16_t type) { return {type, {}}; }

NetlinkAttribute makeNestedAttribute(uint16_t type,
                                     const AttributeList &attributes) {
  NetlinkAttribute attribute{static_cast<uint16_t>(type | NLA_F_NESTED), {}};
  encodeAttributes(attributes, attribute.payload);
  return attribute;
}

const NetlinkAttribute *findAttribute(const AttributeList &attributes,
                                      uint16_t type) {
  for (const auto &attribute : attributes) {
    if (attribute.type == type) {
      return &attribute;
    }
  }
  return nullptr;
}

void encodeAttributes(const AttributeList &attributes,
                      std::vector<uint8_t> &out) {
  for (const auto &attribute : attributes) {
    size_t length = NLA_HDRLEN + attribute.payload.size();
    if (length > UINT16_MAX) {
      throw ProtocolError("attribute " + std::to_string(attribute.type) +
                          " does not fit in 16 bit length");
    }

    struct nlattr header{};
    header.nla_len = static_cast<uint16_t>(length);
    header.nla_type = attribute.type;

    size_t offset = out.size();
    out.resize(offset + NLA_HDRLEN, 0);
    std::memcpy(out.data() + offset, &header, sizeof(header));
    out.insert(out.end(), attribute.payload.begin(), attribute.payload.end());
    pad(out);
  }
}

AttributeList decodeAttributes(const uint8_t *data, size_t length) {
  AttributeList attributes;
  size_t offset = 0;

  while (offset < length) {
    if (length - offset < NLA_HDRLEN) {
      throw ProtocolError("truncated attribute header");
    }

    struct nlattr header;
    std::memcpy(&header, data + offset, sizeof(header));

    if (header.nla_len < NLA_HDRLEN || header.nla_len > length - offset) {
      throw ProtocolError("attribute length " +
                          std::to_string(header.nla_len) +
                          " overruns the message");
    }

    const uint8_t *payload = data + offset + NLA_HDRLEN;
    // nested and byte order flags are not part of the type
    attributes.push_back(
        {static_cast<uint16_t>(header.nla_type & NLA_TYPE_MASK),
         std::vector<uint8_t>(payload,
                              payload + header.nla_len - NLA_HDRLEN)});

    // the last attribute may legally omit its padding
    offset += NLA_ALIGN(header.nla_len);
  }

  return attributes;
}

std::vector<uint8_t> encodeMessage(const NetlinkMessage &message) {
  struct nlmsghdr header{};
  header.nlmsg_len =
      static_cast<uint32_t>(NLMSG_HDRLEN + message.payload.size());
  header.nlmsg_type = message.type;
  header.nlmsg_flags = message.flags;
  header.nlmsg_seq = message.sequence;
  header.nlmsg_pid = message.port_id;

  std::vector<uint8_t> bytes(NLMSG_HDRLEN, 0);
  std::memcpy(bytes.data(), &header, sizeof(header));
  bytes.insert(bytes.end(), message.payload.begin(), message.payload.end());
  bytes.resize(NLMSG_ALIGN(bytes.size()), 0);
  return bytes;
}

std::vector<NetlinkMessage> decodeMessages(const uint8_t *data, size_t length) {
  std::vector<NetlinkMessage> messages;
  size_t offset = 0;

  while (offset < length) {
    if (length - offset < NLMSG_HDRLEN) {
      throw ProtocolError("truncated netlink header");
    }

    struct nlmsghdr header;
    std::memcpy(&header, data + offset, sizeof(header));

    if (header.nlmsg_len < NLMSG_HDRLEN || header.nlmsg_len > length - offset) {
      throw ProtocolError("netlink message length " +
                          std::to_string(header.nlmsg_len) +
                          " overruns the datagram");
    }

    const uint8_t *payload = data + offset + NLMSG_HDRLEN;
    messages.push_back(
        {header.nlmsg_type, header.nlmsg_flags, header.nlmsg_seq,
         header.nlmsg_pid,
         std::vector<uint8_t>(payload,
                              payload + header.nlmsg_len - NLMSG_HDRLEN)});

    offset += NLMSG_ALIGN(header.nlmsg_len);
  }

  return messages;
}

std::vector<uint8_t> encodeGeneric(const GenericMessage &message) {
  struct genlmsghdr header{};
  header.cmd = message.command;
  header.version = message.version;

  std::vector<uint8_t> bytes(GENL_HDRLEN, 0);
  std::memcpy(bytes.data(), &header, sizeof(header));
  encodeAttributes(message.attributes, bytes);
  return bytes;
}

GenericMessage decodeGeneric(const std::vector<uint8_t> &payload) {
  if (payload.size() < GENL_HDRLEN) {
    throw ProtocolError("truncated generic netlink header");
  }

  struct genlmsghdr header;
  std::memcpy(&header, payload.data(), sizeof(header));

  return {header.cmd, header.version,
          decodeAttributes(payload.data() + GENL_HDRLEN,
                           payload.size() - GENL_HDRLEN)};
}

std::vector<uint8_t> encodeRule(const RuleMessage &message) {
  struct fib_rule_hdr header{};
  header.family = message.family;
  header.dst_len = message.dst_len;
  header.src_len = message.src_len;
  header.tos = message.tos;
  header.table = message.table;
  header.res1 = message.protocol;
  header.res2 = message.scope;
  header.action = message.action;
  header.flags = message.flags;

  std::vector<uint8_t> bytes(NLMSG_ALIGN(sizeof(header)), 0);
  std::memcpy(bytes.data(), &header, sizeof(header));
  encodeAttributes(message.attributes, bytes);
  return bytes;
}

RuleMessage decodeRule(const std::vector<uint8_t> &payload) {
  const size_t header_length = NLMSG_ALIGN(sizeof(struct fib_rule_hdr));
  if (payload.size() < header_length) {
    throw ProtocolError("truncated rule header");
  }

  struct fib_rule_hdr header;
  std::memcpy(&header, payload.data(), sizeof(header));

  return {header.family,
          header.dst_len,
          header.src_len,
          header.tos,
          header.table,
          header.res1,
          header.res2,
          header.action,
          header.flags,
          decodeAttributes(payload.data() + header_length,
                           payload.size() - header_length)};
}

int32_t decodeErrorCode(const std::vector<uint8_t> &payload) {
  if (payload.size() < sizeof(int32_t)) {
    throw ProtocolError("truncated netlink error message");
  }
  int32_t code;
  std::memcpy(&code, payload.data(), sizeof(code));
  return code;
}
