// -----------------------------------------------------------------------------
// arb_core_engine: single executable entry point.
//
//   arb_core_engine [config.json]
//
//   1) Load the engine config (default "config/engine.json").
//   2) Pick the clock: wall clock, or a SimulationTimeProvider driven by
//      quote timestamps when "replay_clock" is set.
//   3) Start the ArbitrageEngine. Market data, commands and telemetry run
//      on the engine's own threads.
//   4) Block the main thread until SIGINT/SIGTERM, then stop the engine.
//
// Exit codes: 0 clean shutdown, 1 bad config, 2 startup failure.
// -----------------------------------------------------------------------------

#include "arb/config/config_loader.hpp"
#include "arb/engine/arbitrage_engine.hpp"
#include "arb/time/live_time_provider.hpp"
#include "arb/time/simulation_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <string>
#include <thread>

namespace {

// Set by the signal handler, polled by main(). Lock-free atomic store is
// async-signal-safe.
std::atomic<bool> g_shutdown{false};

void shutdown_handler(int /*signum*/) { g_shutdown.store(true); }

}  // namespace

int main(int argc, char** argv) {
  const std::string config_path = argc > 1 ? argv[1] : "config/engine.json";

  // -------------------------------------------------------------------------
  // 1) Config
  // -------------------------------------------------------------------------
  arb::config::EngineConfig config;
  try {
    config = arb::config::loadConfig(config_path);
  } catch (const std::exception& e) {
    std::cerr << "[main] " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 2) Clock
  // -------------------------------------------------------------------------
  arb::LiveTimeProvider live_clock;
  arb::SimulationTimeProvider replay_clock;
  const arb::ITimeProvider& clock =
      config.replay_clock ? static_cast<const arb::ITimeProvider&>(replay_clock)
                          : live_clock;

  // -------------------------------------------------------------------------
  // 3) Engine
  // -------------------------------------------------------------------------
  arb::ArbitrageEngine engine(config, clock,
                              config.replay_clock ? &replay_clock : nullptr);
  try {
    engine.start();
  } catch (const std::exception& e) {
    std::cerr << "[main] startup failed: " << e.what() << "\n";
    return 2;
  }

  std::signal(SIGINT, shutdown_handler);
  std::signal(SIGTERM, shutdown_handler);

  std::cout << "[main] engine running ("
            << (config.replay_clock ? "replay clock" : "wall clock")
            << "). Quotes on " << config.endpoints.market_data
            << ", commands on " << config.endpoints.command
            << ". Press Ctrl-C to shut down.\n";

  // -------------------------------------------------------------------------
  // 4) Wait, then shut down
  // -------------------------------------------------------------------------
  while (!g_shutdown.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] shutdown requested. Stopping engine...\n";
  engine.stop();
  return 0;
}
