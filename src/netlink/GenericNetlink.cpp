// src/netlink/GenericNetlink.cpp

#include "GenericNetlink.hpp"
#include "Errors.hpp"

#include <linux/genetlink.h>
#include <linux/netlink.h>
#include <spdlog/spdlog.h>

GenericFamily queryFamily(NetlinkChannel &channel, const std::string &name) {
  GenericMessage query{CTRL_CMD_GETFAMILY,
                       1,
                       {makeStringAttribute(CTRL_ATTR_FAMILY_NAME, name)}};

  std::vector<NetlinkMessage> replies = channel.exchange(
      makeGenericRequest(GENL_ID_CTRL, query, NLM_F_REQUEST));

  for (const auto &reply : replies) {
    if (reply.type != GENL_ID_CTRL) {
      continue;
    }
    GenericFamily family = parseFamily(decodeGeneric(reply.payload));
    spdlog::debug("Resolved generic netlink family {} to id {} ({} multicast "
                  "group(s))",
                  family.name, family.id, family.multicast_groups.size());
    return family;
  }

  throw ProtocolError("no controller reply for generic netlink family " +
                      name);
}

uint16_t resolveFamily(NetlinkChannel &channel, const std::string &name) {
  return queryFamily(channel, name).id;
}

uint32_t resolveMulticastGroup(NetlinkChannel &channel,
                               const std::string &family_name,
                               const std::string &group_name) {
  GenericFamily family = queryFamily(channel, family_name);

  auto group = family.multicast_groups.find(group_name);
  if (group == family.multicast_groups.end()) {
    throw ProtocolError("generic netlink family " + family_name +
                        " has no multicast group " + group_name);
  }
  return group->second;
}

NetlinkMessage makeGenericRequest(uint16_t family, const GenericMessage &message,
                                  uint16_t flags) {
  return {family, flags, 0, 0, encodeGeneric(message)};
}

GenericFamily parseFamily(const GenericMessage &reply) {
  if (reply.command != CTRL_CMD_NEWFAMILY) {
    throw ProtocolError("unexpected controller command " +
                        std::to_string(reply.command));
  }

  const NetlinkAttribute *id = findAttribute(reply.attributes, CTRL_ATTR_FAMILY_ID);
  if (!id) {
    throw ProtocolError("controller reply without family id");
  }

  GenericFamily family{id->asU16(), {}, {}};

  if (const auto *name =
          findAttribute(reply.attributes, CTRL_ATTR_FAMILY_NAME)) {
    family.name = name->asString();
  }

  // CTRL_ATTR_MCAST_GROUPS is a list of nested groups, each holding a name
  // and an id
  if (const auto *groups =
          findAttribute(reply.attributes, CTRL_ATTR_MCAST_GROUPS)) {
    for (const auto &group : groups->asNested()) {
      AttributeList fields = group.asNested();
      const auto *group_name = findAttribute(fields, CTRL_ATTR_MCAST_GRP_NAME);
      const auto *group_id = findAttribute(fields, CTRL_ATTR_MCAST_GRP_ID);
      if (!group_name || !group_id) {
        throw ProtocolError("incomplete multicast group in controller reply");
      }
      family.multicast_groups[group_name->asString()] = group_id->asU32();
    }
  }

  return family;
}
