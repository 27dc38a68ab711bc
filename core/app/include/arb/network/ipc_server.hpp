#pragma once

#include "arb/concurrent/thread_safe_queue.hpp"
#include "arb/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace arb {

// -----------------------------------------------------------------------------
// IpcServer: ZeroMQ command (REP) and telemetry (PUB) endpoint
// -----------------------------------------------------------------------------
//
// @brief  Lets an operator process query and steer the engine, and streams
//         grid activity out as JSON.
//
// @details
// Commands arrive as plain strings on the REP socket ("PING", "STATUS",
// "HALT", "RESUME", "BACKUP", "RECONCILE"); each is answered with the JSON
// string the command handler returns. The handler is
// ArbitrageEngine::executeCommand and runs on this server's thread, so
// everything it reads must be safe to read from here.
//
// Telemetry is pushed from the evaluation loop with pushTelemetry() and
// published on the PUB socket. One JSON object per message, with "type"
// one of:
//
//   grid_signal      GridSignalEvent
//   order_status     OrderStatusEvent
//   position_update  GridPositionUpdateEvent
//   brokerage        BrokerageMessageEvent
//
// Other event kinds are not published.
//
// Thread model:
//   Sockets are created in start() and used only by the worker thread.
//   pushTelemetry() is safe from any thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
            std::string pub_endpoint);

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  void start();

  void stop();

  void pushTelemetry(Event event);

  // JSON text for a telemetry event, or std::nullopt for event kinds that
  // are not published.
  static std::optional<std::string> formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace arb
