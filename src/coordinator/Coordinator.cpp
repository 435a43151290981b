// src/coordinator/Coordinator.cpp

#include "Coordinator.hpp"
#include "Errors.hpp"

#include <csignal>
#include <utility>

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

namespace {

const char *policyName(ShutdownPolicy policy) {
  return policy == ShutdownPolicy::DRAIN ? "drain" : "abort";
}

const char *exitName(TaskExit exit) {
  switch (exit) {
  case TaskExit::FINISHED:
    return "finished";
  case TaskExit::CANCELLED:
    return "cancelled";
  case TaskExit::SETUP_FAILED:
    return "setup failed";
  }
  return "unknown";
}

} // namespace

Coordinator::Coordinator(Runtime &runtime, EventBus &bus)
    : runtime_(runtime), bus_(bus), strand_(runtime.makeStrand()),
      signals_(runtime.context()), shutting_down_(false), exit_code_(0) {}

void Coordinator::addTask(std::unique_ptr<Task> task, ShutdownPolicy policy) {
  entries_.push_back(
      std::make_unique<Entry>(Entry{std::move(task), policy, false}));
}

int Coordinator::run() {
  // Register for common termination signals
  signals_.add(SIGINT);  // Ctrl+C
  signals_.add(SIGTERM); // Termination signal
  signals_.add(SIGHUP);  // Terminal closed
  waitForSignal();

  boost::asio::post(strand_, [this] {
    for (auto &entry : entries_) {
      spdlog::debug("Starting task {} ({})", entry->task->name(),
                    policyName(entry->policy));
      entry->running = true;
      Entry *raw = entry.get();
      entry->task->start([this, raw](TaskExit exit) {
        boost::asio::post(strand_, [this, raw, exit] { onTaskExit(*raw, exit); });
      });
    }
  });

  // blocks until the shutdown sequence has completed
  runtime_.run();

  spdlog::info("Shutdown complete.");
  return exit_code_;
}

void Coordinator::requestShutdown(int exit_code) {
  boost::asio::post(strand_, [this, exit_code] { beginShutdown(exit_code); });
}

void Coordinator::waitForSignal() {
  signals_.async_wait(boost::asio::bind_executor(
      strand_, [this](const boost::system::error_code &ec, int signal) {
        if (ec) {
          return;
        }
        spdlog::info("Received signal {}, shutting down.", signal);
        beginShutdown(0);
      }));
}

void Coordinator::onTaskExit(Entry &entry, TaskExit exit) {
  entry.running = false;

  if (exit == TaskExit::SETUP_FAILED) {
    spdlog::critical("Task {} failed to start, shutting down.",
                     entry.task->name());
    beginShutdown(1);
    return;
  }

  if (!shutting_down_ && exit == TaskExit::FINISHED) {
    // e.g. the monitor lost its event stream, the rest keeps running
    spdlog::error("Task {} ended on its own, its subsystem is now inactive.",
                  entry.task->name());
  } else {
    spdlog::debug("Task {} exited ({})", entry.task->name(), exitName(exit));
  }

  finishIfDrained();
}

void Coordinator::beginShutdown(int exit_code) {
  if (shutting_down_) {
    return;
  }
  shutting_down_ = true;
  exit_code_ = exit_code;

  boost::system::error_code ignored;
  signals_.cancel(ignored);

  for (auto &entry : entries_) {
    if (entry->policy == ShutdownPolicy::ABORT && entry->running) {
      entry->task->cancel();
    }
  }

  // revert first, then let the reverting subscribers go
  try {
    bus_.publish(ControlMessage::DISABLE);
    bus_.publish(ControlMessage::QUIT);
  } catch (const ChannelError &error) {
    spdlog::warn("Shutdown: {}", error.what());
  }

  finishIfDrained();
}

void Coordinator::finishIfDrained() {
  if (!shutting_down_) {
    return;
  }
  for (const auto &entry : entries_) {
    if (entry->policy == ShutdownPolicy::DRAIN && entry->running) {
      return;
    }
  }
  runtime_.stop();
}
