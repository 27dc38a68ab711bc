#pragma once

#include "arb/events/event.hpp"
#include "arb/gateway/market_data_gateway.hpp"
#include "arb/time/simulation_time_provider.hpp"

#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace arb {

// -----------------------------------------------------------------------------
// MarketDataThread
// -----------------------------------------------------------------------------
// Owns a MarketDataGateway and the std::thread running its recv loop.
// The gateway (and its ZMQ socket) is created in start() so a thread that
// is never started never opens a socket. Quotes go to event_sink on the
// recv thread; ArbitrageEngine's sink pushes them onto the evaluation
// loop's queue.
//
// stop() is idempotent and called by the destructor.
// -----------------------------------------------------------------------------
class MarketDataThread {
 public:
  using EventSink = std::function<void(Event)>;

  MarketDataThread(EventSink event_sink, std::string endpoint,
                   SimulationTimeProvider* replay_clock = nullptr);

  ~MarketDataThread();

  MarketDataThread(const MarketDataThread&) = delete;
  MarketDataThread& operator=(const MarketDataThread&) = delete;
  MarketDataThread(MarketDataThread&&) = delete;
  MarketDataThread& operator=(MarketDataThread&&) = delete;

  void start();

  void stop();

 private:
  EventSink event_sink_;
  std::string endpoint_;
  SimulationTimeProvider* replay_clock_;

  std::unique_ptr<MarketDataGateway> gateway_;
  std::thread thread_;
};

}  // namespace arb
