// src/wifi/WifiMonitor.cpp

#include "WifiMonitor.hpp"
#include "Errors.hpp"
#include "GenericNetlink.hpp"
#include "Nl80211.hpp"

#include <cerrno>
#include <system_error>
#include <vector>

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <linux/netlink.h>
#include <spdlog/spdlog.h>

WifiMonitor::WifiMonitor(const Config &config, Runtime &runtime, EventBus &bus)
    : name_("wifi-monitor"), runtime_(runtime), bus_(bus),
      strand_(runtime.makeStrand()), state_machine_(config),
      descriptor_(runtime.context()), family_(0), cancelled_(false),
      finished_(false) {}

WifiMonitor::~WifiMonitor() {
  // the fd belongs to socket_, don't let the descriptor close it as well
  if (descriptor_.is_open()) {
    descriptor_.release();
  }
}

const std::string &WifiMonitor::name() const { return name_; }

void WifiMonitor::start(ExitHandler on_exit) {
  on_exit_ = std::move(on_exit);

  runtime_.runBlocking(
      strand_, [this] { setup(); },
      [this](std::exception_ptr error) {
        if (error) {
          try {
            std::rethrow_exception(error);
          } catch (const std::exception &e) {
            spdlog::critical("WiFi monitor setup failed: {}", e.what());
          }
          finish(TaskExit::SETUP_FAILED);
          return;
        }
        if (cancelled_) {
          finish(TaskExit::CANCELLED);
          return;
        }

        descriptor_.assign(socket_->fd());
        spdlog::info("Listening for nl80211 events");
        waitForEvents();
      });
}

void WifiMonitor::cancel() {
  boost::asio::post(strand_, [this] {
    if (finished_ || cancelled_) {
      return;
    }
    cancelled_ = true;
    if (descriptor_.is_open()) {
      boost::system::error_code ignored;
      descriptor_.cancel(ignored);
    }
  });
}

void WifiMonitor::setup() {
  socket_ = std::make_unique<NetlinkSocket>(NETLINK_GENERIC);

  family_ = resolveFamily(*socket_, NL80211_GENL_NAME);
  uint32_t group = resolveMulticastGroup(*socket_, NL80211_GENL_NAME,
                                         NL80211_MULTICAST_GROUP_MLME);

  // find the configured interface before any event can arrive
  std::vector<GenericMessage> interfaces;
  for (const auto &reply :
       socket_->exchange(WifiStateMachine::makeInterfaceDump(family_))) {
    if (reply.type == family_) {
      interfaces.push_back(decodeGeneric(reply.payload));
    }
  }
  apply(state_machine_.onInterfaceDump(interfaces));

  socket_->joinMulticast(group);
  socket_->setNonBlocking(true);
}

void WifiMonitor::waitForEvents() {
  descriptor_.async_wait(
      boost::asio::posix::stream_descriptor::wait_read,
      boost::asio::bind_executor(
          strand_, [this](const boost::system::error_code &ec) {
            if (ec == boost::asio::error::operation_aborted || cancelled_) {
              finish(TaskExit::CANCELLED);
              return;
            }
            if (ec) {
              spdlog::critical("Lost the nl80211 event stream: {}",
                               ec.message());
              finish(TaskExit::FINISHED);
              return;
            }
            if (!drainEvents()) {
              finish(TaskExit::FINISHED);
              return;
            }
            waitForEvents();
          }));
}

bool WifiMonitor::drainEvents() {
  for (;;) {
    std::optional<std::vector<NetlinkMessage>> batch;
    try {
      batch = socket_->receive();
    } catch (const ProtocolError &error) {
      // the bad datagram is consumed, the next one may be fine
      spdlog::error("Malformed nl80211 datagram: {}", error.what());
      continue;
    } catch (const std::system_error &error) {
      if (error.code().value() == ENOBUFS) {
        spdlog::warn("Kernel dropped nl80211 events, re-reading the SSID");
        apply(state_machine_.onEventsLost());
        continue;
      }
      spdlog::critical("Lost the nl80211 event stream: {}", error.what());
      return false;
    }

    if (!batch) {
      return true;
    }
    for (const auto &message : *batch) {
      apply(state_machine_.onMessage(message, family_));
    }
  }
}

void WifiMonitor::apply(const WifiStateMachine::Action &action) {
  if (action.query_ifindex) {
    try {
      NetlinkMessage query =
          WifiStateMachine::makeInterfaceQuery(family_, *action.query_ifindex);
      socket_->send(query);
    } catch (const std::exception &error) {
      spdlog::error("Failed to query SSID of ifindex {}: {}",
                    *action.query_ifindex, error.what());
    }
  }

  if (action.publish) {
    try {
      bus_.publish(*action.publish);
    } catch (const ChannelError &error) {
      spdlog::warn("Dropped {}: {}", toString(*action.publish), error.what());
    }
  }
}

void WifiMonitor::finish(TaskExit exit) {
  if (finished_) {
    return;
  }
  finished_ = true;
  if (on_exit_) {
    on_exit_(exit);
  }
}
