// src/coordinator/SubscriberTask.hpp

// ---- SubscriberTask Usage ---- //

// Runs a handler for every ENABLE / DISABLE published on the bus, one at a
// time and in publish order, and stops on QUIT.

// Example:
// SubscriberTask rules("rules", runtime, bus, [&](ControlMessage message) {
//   reconciler.handle(message);
// });
// rules.start([](TaskExit exit) { ... });

// The handler runs on the runtime's blocking pool, so it may make
// synchronous kernel or D-Bus calls. An exception escaping the handler is
// logged and the task carries on with the next message.

// The subscription is taken in the constructor: messages published between
// construction and start() are not lost.

#pragma once

#include <functional>
#include <string>

#include "ControlMessage.hpp"
#include "EventBus.hpp"
#include "Runtime.hpp"
#include "Task.hpp"

class SubscriberTask : public Task {
public:
  using Handler = std::function<void(ControlMessage)>;

  SubscriberTask(std::string name, Runtime &runtime, EventBus &bus,
                 Handler handler);

  const std::string &name() const override;
  void start(ExitHandler on_exit) override;
  void cancel() override;

private:
  void receiveNext();
  void onDelivery(const boost::system::error_code &ec,
                  EventBus::Delivery delivery);
  void onHandled(ControlMessage message, std::exception_ptr error);
  void finish(TaskExit exit);

  std::string name_;
  Runtime &runtime_;
  Runtime::Strand strand_;
  EventBus::Receiver receiver_;
  Handler handler_;
  ExitHandler on_exit_;

  // only touched on strand_
  bool cancelled_;
  bool finished_;
};
