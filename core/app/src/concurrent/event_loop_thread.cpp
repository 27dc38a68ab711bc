#include "arb/concurrent/event_loop_thread.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <utility>

namespace arb {

namespace {

// Upper bound on how long an idle loop sleeps before re-checking the queue.
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(5);

}  // namespace

EventLoopThread::EventLoopThread(std::string name) : name_(std::move(name)) {}

EventLoopThread::~EventLoopThread() { stop(); }

void EventLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

void EventLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }
  running_.store(false);
  stop_cv_.notify_all();
  thread_.join();
}

// -----------------------------------------------------------------------------
// run()
// -----------------------------------------------------------------------------
// A subscriber that throws would otherwise terminate the process from a
// worker thread. The exception is logged with the loop name and the loop
// carries on with the next event.
// -----------------------------------------------------------------------------
void EventLoopThread::run() {
  while (running_.load()) {
    std::optional<Event> event = queue_.try_pop();

    if (event) {
      try {
        bus_.publish(*event);
      } catch (const std::exception& e) {
        std::cerr << "[EventLoopThread:" << name_
                  << "] ERROR: subscriber threw: " << e.what() << "\n";
      }
      dispatched_.fetch_add(1);
      continue;
    }

    std::unique_lock lock(stop_mutex_);
    stop_cv_.wait_for(lock, kIdleWaitTimeout,
                      [this] { return !running_.load(); });
  }
}

}  // namespace arb
