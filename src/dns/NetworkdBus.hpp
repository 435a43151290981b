// src/dns/NetworkdBus.hpp

// ---- NetworkdBus Usage ---- //

// The two systemd-networkd manager calls the DNS toggle needs.
// SdBusNetworkd talks to the real service, tests provide a mock.

// getLinkByName("wg0")                => interface index of the link
// setLinkDomains(index, {{"", true}}) => replaces the link's DNS domains;
//                                        the empty routing-only domain
//                                        makes the link the default DNS
//                                        route, an empty list removes it

// Both throw SystemBusError when the call fails.

#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct LinkDomain {
  std::string name;
  // routing-only ("~domain") instead of a search domain
  bool routing_only;
};

class NetworkdBus {
public:
  virtual ~NetworkdBus() = default;

  virtual int32_t getLinkByName(const std::string &name) = 0;
  virtual void setLinkDomains(int32_t ifindex,
                              const std::vector<LinkDomain> &domains) = 0;
};
