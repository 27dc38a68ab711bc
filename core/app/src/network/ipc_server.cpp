#include "arb/network/ipc_server.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <type_traits>
#include <utility>

namespace arb {

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create sockets and spawn worker thread
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

void IpcServer::stop() {
  if (!running_.load()) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped.\n";
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }
  // Publish whatever is left before the sockets go away.
  processTelemetry();
}

void IpcServer::processTelemetry() {
  while (auto event = telemetry_queue_.try_pop()) {
    auto text = formatTelemetry(*event);
    if (text.has_value()) {
      zmq::message_t msg(text->data(), text->size());
      pub_socket_->send(msg, zmq::send_flags::dontwait);
    }
  }
}

void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }
  if (!result.has_value()) {
    return;
  }

  std::string cmd(static_cast<const char*>(request.data()), request.size());
  std::string response = command_handler_(cmd);

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

// -----------------------------------------------------------------------------
// formatTelemetry()
// -----------------------------------------------------------------------------
std::optional<std::string> IpcServer::formatTelemetry(const Event& event) {
  return std::visit(
      [](const auto& e) -> std::optional<std::string> {
        using T = std::decay_t<decltype(e)>;
        nlohmann::json j;

        if constexpr (std::is_same_v<T, GridSignalEvent>) {
          j["type"] = "grid_signal";
          j["id"] = e.signal.id;
          j["symbol"] = e.signal.symbol;
          j["direction"] = domain::toString(e.signal.direction);
          j["level"] = e.signal.level.naturalKey();
          j["tag"] = e.signal.tag;
          j["generated_ms"] = e.signal.generated_ms;
          j["close_ms"] = e.signal.close_ms;
        } else if constexpr (std::is_same_v<T, OrderStatusEvent>) {
          j["type"] = "order_status";
          j["account"] = e.account;
          j["order_id"] = e.order_id;
          j["broker_order_id"] = e.broker_order_id;
          j["symbol"] = e.symbol;
          j["status"] = domain::toString(e.status);
          j["fill_quantity"] = e.fill_quantity;
          j["fill_price"] = e.fill_price;
          j["execution_id"] = e.execution_id;
          j["tag"] = e.tag;
          j["timestamp_ms"] = e.timestamp_ms;
        } else if constexpr (std::is_same_v<T, GridPositionUpdateEvent>) {
          j["type"] = "position_update";
          j["pair"] = e.pair_key;
          j["tag"] = e.tag;
          j["leg1_quantity"] = e.leg1_quantity;
          j["leg1_average_cost"] = e.leg1_average_cost;
          j["leg2_quantity"] = e.leg2_quantity;
          j["leg2_average_cost"] = e.leg2_average_cost;
          j["invested"] = e.invested;
          j["removed"] = e.removed;
          j["timestamp_ms"] = e.timestamp_ms;
        } else if constexpr (std::is_same_v<T, BrokerageMessageEvent>) {
          j["type"] = "brokerage";
          j["account"] = e.account;
          j["level"] = toString(e.type);
          j["code"] = e.code;
          j["message"] = e.message;
          j["timestamp_ms"] = e.timestamp_ms;
        } else {
          return std::nullopt;
        }
        return j.dump();
      },
      event);
}

}  // namespace arb
