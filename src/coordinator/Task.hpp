// src/coordinator/Task.hpp

// ---- Task Usage ---- //

// A long running unit of work owned by the Coordinator (a bus subscriber or
// the WiFi monitor).

// start() returns immediately; on_exit is called exactly once, from the
// task's own strand, when the task has stopped for good:
// - FINISHED     => the task ran to completion (a subscriber saw QUIT, or the
//                   monitor lost its event stream)
// - CANCELLED    => cancel() was called
// - SETUP_FAILED => the task never became ready

// cancel() may be called from any thread, and more than once.

#pragma once

#include <functional>
#include <string>

enum class TaskExit { FINISHED, CANCELLED, SETUP_FAILED };

class Task {
public:
  using ExitHandler = std::function<void(TaskExit)>;

  virtual ~Task() = default;

  virtual const std::string &name() const = 0;
  virtual void start(ExitHandler on_exit) = 0;
  virtual void cancel() = 0;
};
