#pragma once

#include "arb/concurrent/thread_safe_queue.hpp"
#include "arb/eventbus/event_bus.hpp"
#include "arb/events/event.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace arb {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
//
// @brief  One worker thread draining a ThreadSafeQueue<Event> into an
//         EventBus.
//
// @details
// ArbitrageEngine runs its whole evaluation path (pair update, signal
// generation, allocation, ledger, order placement, fill bookkeeping) on a
// single EventLoopThread. Anything produced elsewhere, quotes from the
// market data thread and order status from brokerage I/O threads, is
// push()ed here and handled in arrival order, so the evaluation path never
// runs concurrently with itself.
//
// Thread model:
//   push() from any thread. Subscribers on eventBus() run on the loop
//   thread. start()/stop() from the owning thread only; both idempotent.
//   Events still queued when stop() is called are discarded.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  explicit EventLoopThread(std::string name = "event_loop");

  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  void start();
  void stop();

  void push(Event event) { queue_.push(std::move(event)); }

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

  bool running() const { return running_.load(); }

  // Number of events handed to the bus so far. Lets tests wait for a loop
  // to catch up without sleeping for a fixed time.
  std::uint64_t dispatchedCount() const { return dispatched_.load(); }

 private:
  void run();

  std::string name_;
  ThreadSafeQueue<Event> queue_;
  EventBus bus_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> dispatched_{0};
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  std::thread thread_;
};

}  // namespace arb
