// src/coordinator/Coordinator.hpp

// ---- Coordinator Usage ---- //

// The Coordinator owns the tasks, starts them, and runs the shutdown
// sequence when SIGINT / SIGTERM / SIGHUP arrives (or requestShutdown() is
// called).

// Example:
// Coordinator coordinator(runtime, bus);
// coordinator.addTask(std::move(rules), ShutdownPolicy::DRAIN);
// coordinator.addTask(std::move(monitor), ShutdownPolicy::ABORT);
// int exit_code = coordinator.run(); // blocks until shutdown completes

// Shutdown sequence:
// 1. ABORT tasks are cancelled, they hold no kernel state to revert
// 2. DISABLE is published, then QUIT
// 3. the runtime keeps running until every DRAIN task has handled DISABLE
//    and exited on QUIT
// so routing and DNS state are always reverted before run() returns.

// A task exiting with SETUP_FAILED starts the same sequence with exit code 1.

#pragma once

#include <memory>
#include <vector>

#include <boost/asio/signal_set.hpp>

#include "EventBus.hpp"
#include "Runtime.hpp"
#include "Task.hpp"

enum class ShutdownPolicy { ABORT, DRAIN };

class Coordinator {
public:
  Coordinator(Runtime &runtime, EventBus &bus);

  void addTask(std::unique_ptr<Task> task, ShutdownPolicy policy);

  int run();

  // safe to call from any thread, only the first call counts
  void requestShutdown(int exit_code);

private:
  struct Entry {
    std::unique_ptr<Task> task;
    ShutdownPolicy policy;
    bool running;
  };

  void waitForSignal();
  void onTaskExit(Entry &entry, TaskExit exit);
  void beginShutdown(int exit_code);
  void finishIfDrained();

  Runtime &runtime_;
  EventBus &bus_;
  Runtime::Strand strand_;
  boost::asio::signal_set signals_;

  // only touched on strand_ once run() has been called
  std::vector<std::unique_ptr<Entry>> entries_;
  bool shutting_down_;
  int exit_code_;
};
