// src/dns/SdBusNetworkd.hpp

// NetworkdBus over the system D-Bus (sd-bus). The connection is opened in the
// constructor, which throws SystemBusError when the bus is unreachable. Every
// call is synchronous with a SYSTEM_BUS_CALL_TIMEOUT limit; use it from the
// blocking pool and from one thread at a time.

#pragma once

#include <memory>

#include <systemd/sd-bus.h>

#include "NetworkdBus.hpp"

class SdBusNetworkd : public NetworkdBus {
public:
  SdBusNetworkd();

  int32_t getLinkByName(const std::string &name) override;
  void setLinkDomains(int32_t ifindex,
                      const std::vector<LinkDomain> &domains) override;

private:
  struct BusDeleter {
    void operator()(sd_bus *bus) const { sd_bus_flush_close_unref(bus); }
  };

  std::unique_ptr<sd_bus, BusDeleter> bus_;
};
