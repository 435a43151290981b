// src/main.cpp

#include <exception>
#include <memory>
#include <optional>

#include <linux/netlink.h>
#include <spdlog/spdlog.h>

#include "ConfigManager.hpp"
#include "Coordinator.hpp"
#include "DnsToggle.hpp"
#include "EventBus.hpp"
#include "Logging.hpp"
#include "NetlinkSocket.hpp"
#include "PortRotator.hpp"
#include "RuleReconciler.hpp"
#include "Runtime.hpp"
#include "SdBusNetworkd.hpp"
#include "SubscriberTask.hpp"
#include "WifiMonitor.hpp"
#include "configs.hpp"

int main() {
  try {
    // create config manager
    ConfigManager config_manager(CONFIG_FILE_PATH);
    const Config &config = config_manager.getConfig();
    setupLogging(config);

    spdlog::info("Starting wifi-tunnel-daemon on {} (vpn {})",
                 config.wifi_interface, config.vpn_interface);

    Runtime runtime(WORKER_THREADS, BLOCKING_THREADS);
    EventBus bus(BUS_CAPACITY);
    Coordinator coordinator(runtime, bus);

    // one socket per component, each is only used by its own task
    NetlinkSocket route_socket(NETLINK_ROUTE);
    RuleReconciler reconciler(config, route_socket);
    coordinator.addTask(
        std::make_unique<SubscriberTask>(
            "rules", runtime, bus,
            [&reconciler](ControlMessage message) { reconciler.handle(message); }),
        ShutdownPolicy::DRAIN);

    NetlinkSocket wireguard_socket(NETLINK_GENERIC);
    PortRotator rotator(config, wireguard_socket);
    coordinator.addTask(
        std::make_unique<SubscriberTask>(
            "port-rotator", runtime, bus,
            [&rotator](ControlMessage message) { rotator.handle(message); }),
        ShutdownPolicy::ABORT);

    std::unique_ptr<SdBusNetworkd> networkd;
    std::optional<DnsToggle> dns;
    if (config.manage_dns) {
      networkd = std::make_unique<SdBusNetworkd>();
      dns.emplace(config, *networkd);
      coordinator.addTask(
          std::make_unique<SubscriberTask>(
              "dns", runtime, bus,
              [&dns](ControlMessage message) { dns->handle(message); }),
          ShutdownPolicy::DRAIN);
    } else {
      spdlog::info("DNS management disabled");
    }

    // subscribers exist before the monitor can publish its first decision
    coordinator.addTask(std::make_unique<WifiMonitor>(config, runtime, bus),
                        ShutdownPolicy::ABORT);

    // blocks until a signal (or a failed task) has run the shutdown sequence
    return coordinator.run();

  } catch (const std::exception &error) {
    spdlog::critical("Fatal error: {}", error.what());
  }

  return 1;
}
