#include "arb/gateway/market_data_gateway.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <string>
#include <utility>

namespace arb {

MarketDataGateway::MarketDataGateway(EventSink event_sink,
                                     const std::string& endpoint,
                                     SimulationTimeProvider* replay_clock)
    : event_sink_(std::move(event_sink)), replay_clock_(replay_clock) {
  socket_.set(zmq::sockopt::subscribe, "");

  // Without a receive timeout recv() would block forever and stop() would
  // never be observed.
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);

  socket_.connect(endpoint);
}

// -----------------------------------------------------------------------------
// parseQuote
// -----------------------------------------------------------------------------
std::optional<QuoteEvent> MarketDataGateway::parseQuote(
    const std::string& payload) {
  try {
    auto json = nlohmann::json::parse(payload);

    QuoteEvent quote;
    quote.timestamp_ms = json.at("timestamp_ms").get<std::int64_t>();
    quote.symbol = json.at("symbol").get<std::string>();
    quote.bid = json.at("bid").get<double>();
    quote.ask = json.at("ask").get<double>();

    if (quote.symbol.empty() || !(quote.bid > 0.0) || !(quote.ask > 0.0) ||
        quote.bid > quote.ask) {
      std::cerr << "[MarketDataGateway] invalid quote dropped: " << payload
                << "\n";
      return std::nullopt;
    }
    return quote;
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[MarketDataGateway] JSON parse error: " << e.what()
              << ", payload: " << payload << "\n";
    return std::nullopt;
  }
}

// -----------------------------------------------------------------------------
// run(): blocking recv loop
// -----------------------------------------------------------------------------
void MarketDataGateway::run() {
  running_.store(true);

  while (running_.load()) {
    zmq::message_t msg;
    auto result = socket_.recv(msg, zmq::recv_flags::none);
    if (!result.has_value()) {
      continue;  // timeout; re-check running_
    }

    auto quote = parseQuote(msg.to_string());
    if (!quote) {
      continue;
    }

    if (replay_clock_ != nullptr) {
      replay_clock_->advance_time(quote->timestamp_ms);
    }
    quote->sequence_id = next_sequence_++;
    event_sink_(std::move(*quote));
  }
}

void MarketDataGateway::stop() { running_.store(false); }

}  // namespace arb
