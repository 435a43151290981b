// src/coordinator/SubscriberTask.cpp

#include "SubscriberTask.hpp"

#include <utility>

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

SubscriberTask::SubscriberTask(std::string name, Runtime &runtime,
                               EventBus &bus, Handler handler)
    : name_(std::move(name)), runtime_(runtime),
      strand_(runtime.makeStrand()), receiver_(bus.subscribe()),
      handler_(std::move(handler)), cancelled_(false), finished_(false) {}

const std::string &SubscriberTask::name() const { return name_; }

void SubscriberTask::start(ExitHandler on_exit) {
  on_exit_ = std::move(on_exit);
  boost::asio::post(strand_, [this] {
    spdlog::debug("{}: waiting for control messages", name_);
    receiveNext();
  });
}

void SubscriberTask::cancel() {
  boost::asio::post(strand_, [this] {
    if (finished_ || cancelled_) {
      return;
    }
    cancelled_ = true;
    // completes a parked receive with operation_aborted; if a handler is in
    // flight instead, onHandled sees the flag
    receiver_.cancel();
  });
}

void SubscriberTask::receiveNext() {
  if (cancelled_) {
    finish(TaskExit::CANCELLED);
    return;
  }
  receiver_.asyncReceive(
      strand_,
      [this](const boost::system::error_code &ec, EventBus::Delivery delivery) {
        onDelivery(ec, delivery);
      });
}

void SubscriberTask::onDelivery(const boost::system::error_code &ec,
                                EventBus::Delivery delivery) {
  if (ec == boost::asio::error::operation_aborted) {
    finish(TaskExit::CANCELLED);
    return;
  }

  if (!delivery.message) {
    spdlog::warn("{}: fell behind and missed {} control message(s)", name_,
                 delivery.missed);
    receiveNext();
    return;
  }

  ControlMessage message = *delivery.message;
  if (message == ControlMessage::QUIT) {
    spdlog::debug("{}: quit", name_);
    finish(TaskExit::FINISHED);
    return;
  }

  spdlog::debug("{}: handling {}", name_, toString(message));
  runtime_.runBlocking(
      strand_, [this, message] { handler_(message); },
      [this, message](std::exception_ptr error) { onHandled(message, error); });
}

void SubscriberTask::onHandled(ControlMessage message,
                               std::exception_ptr error) {
  if (error) {
    try {
      std::rethrow_exception(error);
    } catch (const std::exception &e) {
      spdlog::error("{}: error on {}: {}", name_, toString(message), e.what());
    }
  }
  receiveNext();
}

void SubscriberTask::finish(TaskExit exit) {
  if (finished_) {
    return;
  }
  finished_ = true;
  if (on_exit_) {
    on_exit_(exit);
  }
}
