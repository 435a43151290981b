// src/runtime/Runtime.cpp

#include "Runtime.hpp"

#include <thread>
#include <utility>
#include <vector>

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

Runtime::Runtime(std::size_t worker_threads, std::size_t blocking_threads)
    : worker_threads_(worker_threads == 0 ? 1 : worker_threads),
      io_context_(static_cast<int>(worker_threads_)),
      work_guard_(boost::asio::make_work_guard(io_context_)),
      blocking_pool_(blocking_threads == 0 ? 1 : blocking_threads) {}

Runtime::~Runtime() {
  stop();
  blocking_pool_.join();
}

boost::asio::io_context &Runtime::context() { return io_context_; }

Runtime::Strand Runtime::makeStrand() {
  return boost::asio::make_strand(io_context_);
}

void Runtime::runBlocking(boost::asio::any_io_executor completion,
                          std::function<void()> work,
                          std::function<void(std::exception_ptr)> done) {
  boost::asio::post(blocking_pool_, [completion = std::move(completion),
                                     work = std::move(work),
                                     done = std::move(done)]() {
    std::exception_ptr error;
    try {
      work();
    } catch (...) {
      // handed to done() on the caller's executor
      error = std::current_exception();
    }
    boost::asio::post(completion, [done, error]() { done(error); });
  });
}

void Runtime::run() {
  spdlog::debug("Runtime starting {} worker thread(s)", worker_threads_);

  std::vector<std::thread> workers;
  for (std::size_t i = 1; i < worker_threads_; ++i) {
    workers.emplace_back([this] { io_context_.run(); });
  }
  io_context_.run();

  // Join threads
  for (auto &worker : workers) {
    if (worker.joinable()) {
      worker.join();
    }
  }

  // blocking calls are bounded by their own timeouts
  blocking_pool_.join();
  spdlog::debug("Runtime stopped");
}

void Runtime::stop() {
  work_guard_.reset();
  io_context_.stop();
}
