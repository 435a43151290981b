// src/runtime/Runtime.hpp

// ---- Runtime Usage ---- //

// Runtime owns the two execution contexts of the daemon:
// - an io_context run by a few worker threads, where every task's handlers
//   run (each task serialises itself on its own strand)
// - a thread pool for calls that block (netlink request/response, D-Bus)

// Example:
// Runtime runtime(WORKER_THREADS, BLOCKING_THREADS);
// auto strand = runtime.makeStrand();
// runtime.runBlocking(strand, [&] { reconciler.enable(); },
//                     [](std::exception_ptr error) { ... });
// runtime.run(); // blocks until runtime.stop()

// runBlocking() never runs work on a worker thread, and done() is always
// posted to the completion executor, so the caller's strand is not held
// while the blocking call is in progress. An exception thrown by work is
// handed to done() instead of being lost.

#pragma once

#include <cstddef>
#include <exception>
#include <functional>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>

class Runtime {
public:
  using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;

  Runtime(std::size_t worker_threads, std::size_t blocking_threads);
  ~Runtime();

  Runtime(const Runtime &) = delete;
  Runtime &operator=(const Runtime &) = delete;

  boost::asio::io_context &context();
  Strand makeStrand();

  void runBlocking(boost::asio::any_io_executor completion,
                   std::function<void()> work,
                   std::function<void(std::exception_ptr)> done);

  // runs the io_context on worker_threads threads (the caller being one of
  // them) until stop() is called, then waits for in-flight blocking work
  void run();
  void stop();

private:
  std::size_t worker_threads_;
  boost::asio::io_context io_context_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type>
      work_guard_;
  boost::asio::thread_pool blocking_pool_;
};
