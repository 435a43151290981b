// src/rule/RuleReconciler.hpp

// ---- RuleReconciler Usage ---- //

// Keeps the policy routing rule "fwmark <fwmark> lookup <table>" in step
// with the ENABLE / DISABLE state, once per address family.

// Example:
// NetlinkSocket route(NETLINK_ROUTE);
// RuleReconciler reconciler(config, route);
// reconciler.enable();  // AF_INET, plus AF_INET6 when config.ipv6 is set
// reconciler.disable(); // AF_INET and AF_INET6, whatever config.ipv6 says

// addRule() / removeRule() are idempotent: both dump the family's rules
// first and only touch the kernel when the rule is missing / present. The
// check and the change are not atomic; the daemon is assumed to be the only
// owner of its fwmark and table.

// disable() always covers IPv6 so a rule created under an older config
// (ipv6 = true) does not outlive it.

// All calls block on the route netlink socket; run them on the blocking
// pool. handle() is the bus entry point and logs failures instead of
// throwing.

#pragma once

#include <cstdint>

#include "ConfigManager.hpp"
#include "ControlMessage.hpp"
#include "NetlinkChannel.hpp"
#include "NetlinkMessage.hpp"

class RuleReconciler {
public:
  RuleReconciler(const Config &config, NetlinkChannel &channel);

  bool ruleExists(uint8_t family);
  void addRule(uint8_t family);
  void removeRule(uint8_t family);

  void enable();
  void disable();
  void handle(ControlMessage message);

  // rule record body shared by the dump, create and delete requests
  static RuleMessage makeRule(uint8_t family, uint32_t fwmark, uint32_t table);
  static bool matchesTable(const RuleMessage &rule, uint32_t table);

private:
  const Config &config_;
  NetlinkChannel &channel_;
};
