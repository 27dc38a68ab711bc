#include "arb/network/market_data_thread.hpp"

#include <iostream>
#include <utility>

namespace arb {

MarketDataThread::MarketDataThread(EventSink event_sink, std::string endpoint,
                                   SimulationTimeProvider* replay_clock)
    : event_sink_(std::move(event_sink)),
      endpoint_(std::move(endpoint)),
      replay_clock_(replay_clock) {}

MarketDataThread::~MarketDataThread() { stop(); }

void MarketDataThread::start() {
  if (thread_.joinable()) {
    return;
  }

  gateway_ = std::make_unique<MarketDataGateway>(event_sink_, endpoint_,
                                                 replay_clock_);

  thread_ = std::thread([this] {
    std::cout << "[MarketDataThread] listening on " << endpoint_
              << (replay_clock_ ? " (replay clock)" : "") << "\n";
    gateway_->run();
    std::cout << "[MarketDataThread] recv loop exited.\n";
  });
}

void MarketDataThread::stop() {
  if (gateway_) {
    gateway_->stop();
  }
  if (thread_.joinable()) {
    thread_.join();
  }
  gateway_.reset();
}

}  // namespace arb
