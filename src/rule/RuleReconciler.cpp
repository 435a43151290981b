// src/rule/RuleReconciler.cpp

#include "RuleReconciler.hpp"

#include <exception>
#include <initializer_list>
#include <string_view>

#include <linux/fib_rules.h>
#include <linux/netlink.h>
#include <linux/rtnetlink.h>
#include <spdlog/spdlog.h>
#include <sys/socket.h> // AF_INET, AF_INET6

namespace {

std::string_view familyName(uint8_t family) {
  switch (family) {
  case AF_INET:
    return "ipv4";
  case AF_INET6:
    return "ipv6";
  default:
    return "unknown";
  }
}

} // namespace

RuleReconciler::RuleReconciler(const Config &config, NetlinkChannel &channel)
    : config_(config), channel_(channel) {}

bool RuleReconciler::ruleExists(uint8_t family) {
  // the kernel ignores the selectors of a dump request, filter here
  RuleMessage query{};
  query.family = family;

  std::vector<NetlinkMessage> replies = channel_.exchange(
      {RTM_GETRULE, NLM_F_REQUEST | NLM_F_DUMP, 0, 0, encodeRule(query)});

  for (const auto &reply : replies) {
    if (reply.type != RTM_NEWRULE) {
      continue;
    }
    if (matchesTable(decodeRule(reply.payload), config_.table)) {
      return true;
    }
  }
  return false;
}

void RuleReconciler::addRule(uint8_t family) {
  if (ruleExists(family)) {
    spdlog::debug("{} rule to table {} already present", familyName(family),
                  config_.table);
    return;
  }

  RuleMessage rule = makeRule(family, config_.fwmark, config_.table);
  channel_.exchange({RTM_NEWRULE,
                     NLM_F_REQUEST | NLM_F_CREATE | NLM_F_EXCL | NLM_F_ACK, 0,
                     0, encodeRule(rule)});
  spdlog::info("Added {} rule: fwmark {} lookup {}", familyName(family),
               config_.fwmark, config_.table);
}

void RuleReconciler::removeRule(uint8_t family) {
  if (!ruleExists(family)) {
    spdlog::debug("no {} rule to table {}", familyName(family), config_.table);
    return;
  }

  RuleMessage rule = makeRule(family, config_.fwmark, config_.table);
  channel_.exchange(
      {RTM_DELRULE, NLM_F_REQUEST | NLM_F_ACK, 0, 0, encodeRule(rule)});
  spdlog::info("Removed {} rule: fwmark {} lookup {}", familyName(family),
               config_.fwmark, config_.table);
}

void RuleReconciler::enable() {
  addRule(AF_INET);
  if (config_.ipv6) {
    addRule(AF_INET6);
  }
}

void RuleReconciler::disable() {
  // a failure on one family must not keep the other one in place
  std::exception_ptr first_error;
  for (uint8_t family : {AF_INET, AF_INET6}) {
    try {
      removeRule(family);
    } catch (const std::exception &error) {
      spdlog::error("Failed to remove {} rule: {}", familyName(family),
                    error.what());
      if (!first_error) {
        first_error = std::current_exception();
      }
    }
  }
  if (first_error) {
    std::rethrow_exception(first_error);
  }
}

void RuleReconciler::handle(ControlMessage message) {
  try {
    switch (message) {
    case ControlMessage::ENABLE:
      enable();
      break;
    case ControlMessage::DISABLE:
      disable();
      break;
    case ControlMessage::QUIT:
      break;
    }
  } catch (const std::exception &error) {
    spdlog::error("Rule update on {} failed: {}", toString(message),
                  error.what());
  }
}

RuleMessage RuleReconciler::makeRule(uint8_t family, uint32_t fwmark,
                                     uint32_t table) {
  RuleMessage rule{};
  rule.family = family;
  // the header only has room for the classic table ids, FRA_TABLE wins
  rule.table = table < 256 ? static_cast<uint8_t>(table) : RT_TABLE_UNSPEC;
  rule.action = FR_ACT_TO_TBL;
  rule.attributes = {
      // zero length source selector: match every source
      makeEmptyAttribute(FRA_SRC),
      makeU32Attribute(FRA_FWMARK, fwmark),
      makeU32Attribute(FRA_TABLE, table),
  };
  return rule;
}

bool RuleReconciler::matchesTable(const RuleMessage &rule, uint32_t table) {
  if (const auto *attribute = findAttribute(rule.attributes, FRA_TABLE)) {
    return attribute->asU32() == table;
  }
  return rule.table == table;
}
