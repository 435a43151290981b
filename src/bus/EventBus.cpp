// src/bus/EventBus.cpp

#include "EventBus.hpp"
#include "Errors.hpp"

#include <deque>
#include <map>
#include <mutex>
#include <stdexcept>
#include <utility>
#include <vector>

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>

namespace {

struct Waiter {
  boost::asio::any_io_executor executor;
  EventBus::ReceiveHandler handler;
};

struct Subscription {
  // sequence number of the next message this receiver will read
  uint64_t cursor;
  std::optional<Waiter> waiter;
};

// hands a completed receive to the receiver's executor, never inline, so a
// handler can't run while the publisher still holds anything
void complete(Waiter waiter, const boost::system::error_code &ec,
              EventBus::Delivery delivery) {
  boost::asio::post(waiter.executor,
                    [handler = std::move(waiter.handler), ec, delivery]() {
                      handler(ec, delivery);
                    });
}

} // namespace

struct EventBus::Shared {
  explicit Shared(std::size_t capacity) : capacity(capacity) {}

  mutable std::mutex mutex;
  const std::size_t capacity;

  // buffer.front() has sequence number head, buffer.back() has tail - 1
  std::deque<ControlMessage> buffer;
  uint64_t head = 0;
  uint64_t tail = 0;

  std::map<uint64_t, Subscription> subscriptions;
  uint64_t next_id = 0;

  // caller holds mutex
  std::optional<Delivery> take(Subscription &subscription) {
    if (subscription.cursor < head) {
      Delivery lagged{std::nullopt, head - subscription.cursor};
      subscription.cursor = head;
      return lagged;
    }
    if (subscription.cursor < tail) {
      Delivery delivery{buffer[subscription.cursor - head], 0};
      ++subscription.cursor;
      return delivery;
    }
    return std::nullopt;
  }
};

EventBus::EventBus(std::size_t capacity)
    : shared_(std::make_shared<Shared>(capacity)) {
  if (capacity == 0) {
    throw std::invalid_argument("EventBus capacity must be at least 1");
  }
}

EventBus::Receiver EventBus::subscribe() {
  std::lock_guard<std::mutex> lock(shared_->mutex);
  uint64_t id = shared_->next_id++;
  // new receivers only see what is published from now on
  shared_->subscriptions.emplace(id, Subscription{shared_->tail, std::nullopt});
  return Receiver(shared_, id);
}

std::size_t EventBus::publish(ControlMessage message) {
  std::vector<std::pair<Waiter, Delivery>> ready;
  std::size_t receivers = 0;

  {
    std::lock_guard<std::mutex> lock(shared_->mutex);

    receivers = shared_->subscriptions.size();
    if (receivers == 0) {
      throw ChannelError("no live receivers for " +
                         std::string(toString(message)));
    }

    shared_->buffer.push_back(message);
    ++shared_->tail;
    if (shared_->buffer.size() > shared_->capacity) {
      shared_->buffer.pop_front();
      ++shared_->head;
    }

    for (auto &[id, subscription] : shared_->subscriptions) {
      if (!subscription.waiter) {
        continue;
      }
      // a parked receiver was fully caught up, so there is always something
      std::optional<Delivery> delivery = shared_->take(subscription);
      ready.emplace_back(std::move(*subscription.waiter), *delivery);
      subscription.waiter.reset();
    }
  }

  for (auto &[waiter, delivery] : ready) {
    complete(std::move(waiter), {}, delivery);
  }
  return receivers;
}

std::size_t EventBus::receiverCount() const {
  std::lock_guard<std::mutex> lock(shared_->mutex);
  return shared_->subscriptions.size();
}

EventBus::Receiver::Receiver(std::shared_ptr<Shared> shared, uint64_t id)
    : shared_(std::move(shared)), id_(id) {}

EventBus::Receiver::Receiver(Receiver &&other) noexcept
    : shared_(std::move(other.shared_)), id_(other.id_) {}

EventBus::Receiver &EventBus::Receiver::operator=(Receiver &&other) noexcept {
  if (this != &other) {
    unsubscribe();
    shared_ = std::move(other.shared_);
    id_ = other.id_;
  }
  return *this;
}

EventBus::Receiver::~Receiver() { unsubscribe(); }

void EventBus::Receiver::unsubscribe() {
  if (!shared_) {
    return;
  }
  std::lock_guard<std::mutex> lock(shared_->mutex);
  shared_->subscriptions.erase(id_);
  shared_.reset();
}

std::optional<EventBus::Delivery> EventBus::Receiver::tryReceive() {
  if (!shared_) {
    throw std::logic_error("receive on a moved-from EventBus::Receiver");
  }
  std::lock_guard<std::mutex> lock(shared_->mutex);
  return shared_->take(shared_->subscriptions.at(id_));
}

void EventBus::Receiver::asyncReceive(boost::asio::any_io_executor executor,
                                      ReceiveHandler handler) {
  if (!shared_) {
    throw std::logic_error("receive on a moved-from EventBus::Receiver");
  }

  std::optional<Delivery> delivery;
  {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    Subscription &subscription = shared_->subscriptions.at(id_);
    if (subscription.waiter) {
      throw std::logic_error("EventBus::Receiver already has a pending receive");
    }

    delivery = shared_->take(subscription);
    if (!delivery) {
      subscription.waiter = Waiter{std::move(executor), std::move(handler)};
      return;
    }
  }

  complete(Waiter{std::move(executor), std::move(handler)}, {}, *delivery);
}

void EventBus::Receiver::cancel() {
  if (!shared_) {
    return;
  }

  std::optional<Waiter> waiter;
  {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    auto subscription = shared_->subscriptions.find(id_);
    if (subscription == shared_->subscriptions.end() ||
        !subscription->second.waiter) {
      return;
    }
    waiter = std::move(subscription->second.waiter);
    subscription->second.waiter.reset();
  }

  complete(std::move(*waiter), boost::asio::error::operation_aborted, {});
}
