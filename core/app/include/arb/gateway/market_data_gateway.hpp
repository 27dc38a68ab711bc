#pragma once

#include "arb/events/event.hpp"
#include "arb/time/simulation_time_provider.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace arb {

// -----------------------------------------------------------------------------
// MarketDataGateway: ZeroMQ SUB socket → QuoteEvent
// -----------------------------------------------------------------------------
//
// @brief  Receives top-of-book quotes as JSON and hands them to the engine.
//
// @details
// Wire format, one quote per message:
//
//     {"timestamp_ms": 1700000000000, "symbol": "BTCUSDT",
//      "bid": 43000.5, "ask": 43001.0}
//
// Malformed messages (bad JSON, missing fields, bid > ask, non-positive
// prices) are logged and dropped; the loop never stops on bad input.
//
// Replay mode:
//   When a SimulationTimeProvider is supplied, its clock is advanced to the
//   quote's timestamp before the event is handed on, so everything that
//   reads time while processing the quote sees the quote's time.
//
// Thread model:
//   run() blocks and belongs to the thread MarketDataThread creates.
//   stop() may be called from any thread; run() notices within
//   kRecvTimeoutMs.
// -----------------------------------------------------------------------------
class MarketDataGateway {
 public:
  using EventSink = std::function<void(Event)>;

  MarketDataGateway(EventSink event_sink, const std::string& endpoint,
                    SimulationTimeProvider* replay_clock = nullptr);

  ~MarketDataGateway() = default;

  MarketDataGateway(const MarketDataGateway&) = delete;
  MarketDataGateway& operator=(const MarketDataGateway&) = delete;
  MarketDataGateway(MarketDataGateway&&) = delete;
  MarketDataGateway& operator=(MarketDataGateway&&) = delete;

  void run();

  void stop();

  // Decodes one wire message. std::nullopt (with a log line) on bad input.
  static std::optional<QuoteEvent> parseQuote(const std::string& payload);

 private:
  static constexpr int kRecvTimeoutMs = 100;

  EventSink event_sink_;
  SimulationTimeProvider* replay_clock_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  std::atomic<bool> running_{false};
  std::uint64_t next_sequence_{1};
};

}  // namespace arb
