// src/wifi/WifiMonitor.hpp

// ---- WifiMonitor Usage ---- //

// WifiMonitor is the task that watches nl80211 and publishes ENABLE /
// DISABLE on the bus. It owns its own generic netlink socket.

// Example:
// auto monitor = std::make_unique<WifiMonitor>(config, runtime, bus);
// coordinator.addTask(std::move(monitor), ShutdownPolicy::ABORT);

// Startup (on the blocking pool):
// 1. resolve the nl80211 family and its "mlme" multicast group
// 2. dump the wireless interfaces to find the configured one, and classify
//    its network right away if it is already associated
// 3. join the multicast group and switch the socket to non-blocking

// After that the socket is watched by the io_context; the monitor never
// blocks a thread while waiting for events. SSID queries go out on the same
// socket, their replies come back through the same event stream.

// A malformed message is logged and skipped. Losing the socket is fatal for
// the monitor: it is logged and the task ends, there is no reconnect.

#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include <boost/asio/posix/stream_descriptor.hpp>

#include "ConfigManager.hpp"
#include "EventBus.hpp"
#include "NetlinkSocket.hpp"
#include "Runtime.hpp"
#include "Task.hpp"
#include "WifiStateMachine.hpp"

class WifiMonitor : public Task {
public:
  WifiMonitor(const Config &config, Runtime &runtime, EventBus &bus);
  ~WifiMonitor() override;

  const std::string &name() const override;
  void start(ExitHandler on_exit) override;
  void cancel() override;

private:
  void setup();
  void waitForEvents();
  // true while the stream is usable
  bool drainEvents();
  void apply(const WifiStateMachine::Action &action);
  void finish(TaskExit exit);

  std::string name_;
  Runtime &runtime_;
  EventBus &bus_;
  Runtime::Strand strand_;
  WifiStateMachine state_machine_;

  std::unique_ptr<NetlinkSocket> socket_;
  boost::asio::posix::stream_descriptor descriptor_;
  uint16_t family_;

  ExitHandler on_exit_;
  bool cancelled_;
  bool finished_;
};
