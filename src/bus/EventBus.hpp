// src/bus/EventBus.hpp

// ---- EventBus Usage ---- //

// EventBus is a broadcast channel for ControlMessages: every live Receiver
// sees every message published after it subscribed, in publish order.

// Example:
// EventBus bus(BUS_CAPACITY);
// EventBus::Receiver rules = bus.subscribe();
// bus.publish(ControlMessage::ENABLE);
// rules.asyncReceive(strand, [](const boost::system::error_code &ec,
//                               EventBus::Delivery delivery) { ... });

// The bus keeps only the last `capacity` messages. Publishing never waits
// for a slow receiver; a receiver that falls further behind than the buffer
// gets one Delivery with `missed` set to the number of messages it lost and
// then continues with the oldest message still buffered.

// publish() throws ChannelError when nobody is subscribed, the message is
// dropped in that case.

// asyncReceive() completes on the given executor, at most one receive may be
// outstanding per Receiver. cancel() completes a pending receive with
// boost::asio::error::operation_aborted.

// Destroying a Receiver unsubscribes it.

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

#include <boost/asio/any_io_executor.hpp>
#include <boost/system/error_code.hpp>

#include "ControlMessage.hpp"

class EventBus {
  struct Shared;

public:
  struct Delivery {
    std::optional<ControlMessage> message;
    uint64_t missed = 0;
  };

  using ReceiveHandler =
      std::function<void(const boost::system::error_code &, Delivery)>;

  class Receiver {
  public:
    Receiver(Receiver &&other) noexcept;
    Receiver &operator=(Receiver &&other) noexcept;
    ~Receiver();

    Receiver(const Receiver &) = delete;
    Receiver &operator=(const Receiver &) = delete;

    std::optional<Delivery> tryReceive();
    void asyncReceive(boost::asio::any_io_executor executor,
                      ReceiveHandler handler);
    void cancel();

  private:
    friend class EventBus;
    Receiver(std::shared_ptr<Shared> shared, uint64_t id);

    void unsubscribe();

    std::shared_ptr<Shared> shared_;
    uint64_t id_;
  };

  explicit EventBus(std::size_t capacity);

  Receiver subscribe();

  // returns the number of receivers the message was queued for
  std::size_t publish(ControlMessage message);

  std::size_t receiverCount() const;

private:
  std::shared_ptr<Shared> shared_;
};
