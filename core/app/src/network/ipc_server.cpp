#include "perpsim/network/ipc_server.hpp"

#include "perpsim/network/json_codec.hpp"
#include "perpsim/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <chrono>
#include <iostream>
#include <utility>
#include <variant>

namespace perpsim {

IpcServer::IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint,
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

  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);
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

  std::cout << "[IpcServer] stopped. telemetry sent=" << telemetry_sent_.load()
            << " dropped=" << telemetryDropped() << "\n";
}

void IpcServer::pushTelemetry(Event event) {
  if (std::holds_alternative<TickEvent>(event)) {
    return;
  }
  if (!telemetry_queue_.push(std::move(event))) {
    std::cerr << "[IpcServer] telemetry backlog full, dropped oldest\n";
  }
}

void IpcServer::run() {
  try {
    while (running_.load()) {
      processTelemetry();
      processCommands();
    }
    processTelemetry();
  } catch (const zmq::error_t& e) {
    std::cerr << "[IpcServer] stopped on ZeroMQ error: " << e.what() << "\n";
    running_.store(false);
  }
}

// -----------------------------------------------------------------------------
// processTelemetry(): one batch onto the PUB socket
// -----------------------------------------------------------------------------
void IpcServer::processTelemetry() {
  for (const Event& event : telemetry_queue_.drain(kTelemetryBatch)) {
    auto text = formatTelemetry(event);
    if (!text) {
      continue;
    }
    zmq::message_t msg(text->data(), text->size());
    // dontwait: a slow subscriber must not stall the IPC thread.
    if (pub_socket_->send(msg, zmq::send_flags::dontwait).has_value()) {
      ++telemetry_sent_;
    } else {
      ++send_dropped_;
    }
  }
}

// -----------------------------------------------------------------------------
// processCommands(): poll the REP socket, answer at most one request
// -----------------------------------------------------------------------------
void IpcServer::processCommands() {
  zmq::pollitem_t items[] = {{cmd_socket_->handle(), 0, ZMQ_POLLIN, 0}};
  try {
    zmq::poll(items, 1, std::chrono::milliseconds(kPollTimeoutMs));
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }
  if ((items[0].revents & ZMQ_POLLIN) == 0) {
    return;
  }

  zmq::message_t request;
  if (!cmd_socket_->recv(request, zmq::recv_flags::dontwait).has_value()) {
    return;
  }

  const std::string response = handle(request.to_string());
  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

std::string IpcServer::handle(const std::string& request) {
  try {
    return command_handler_(request);
  } catch (const std::exception& e) {
    std::cerr << "[IpcServer] command failed: " << e.what() << "\n";
    nlohmann::json error;
    error["status"] = "error";
    error["response"] = e.what();
    return error.dump();
  }
}

std::optional<std::string> IpcServer::formatTelemetry(const Event& event) {
  if (auto* e = std::get_if<OrderUpdateEvent>(&event)) {
    return formatOrderUpdate(*e);
  }
  if (auto* e = std::get_if<PositionUpdateEvent>(&event)) {
    return formatPositionUpdate(*e);
  }
  if (auto* e = std::get_if<LiquidationEvent>(&event)) {
    return formatLiquidation(*e);
  }
  if (auto* e = std::get_if<SnapshotEvent>(&event)) {
    return formatSnapshot(*e);
  }
  return std::nullopt;
}

std::string IpcServer::formatOrderUpdate(const OrderUpdateEvent& e) {
  nlohmann::json j = toJson(e.order);
  j["type"] = "order_update";
  j["status"] = domain::toString(e.order.status);
  j["sequence_id"] = e.sequence_id;
  j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
  if (e.reason != domain::RejectReason::None) {
    j["reason"] = domain::toString(e.reason);
  }
  if (e.fill_price) {
    j["fill_price"] = toDouble(*e.fill_price);
    j["leverage"] = e.leverage;
  }
  return j.dump();
}

std::string IpcServer::formatPositionUpdate(const PositionUpdateEvent& e) {
  nlohmann::json j;
  j["type"] = "position_update";
  j["sequence_id"] = e.sequence_id;
  j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
  j["price"] = toDouble(e.price);
  j["balance"] = roundForReport(e.balance, kReportPlaces);
  j["position"] =
      e.position ? toJson(*e.position) : nlohmann::json::object();
  return j.dump();
}

std::string IpcServer::formatLiquidation(const LiquidationEvent& e) {
  nlohmann::json j;
  j["type"] = "liquidation";
  j["sequence_id"] = e.sequence_id;
  j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
  j["side"] = domain::toString(e.side);
  j["quantity"] = toDouble(e.quantity);
  j["entry_price"] = roundForReport(e.entry_price, kReportPlaces);
  j["liquidation_price"] = roundForReport(e.liquidation_price, kReportPlaces);
  j["price"] = toDouble(e.price);
  j["forfeited"] = roundForReport(e.forfeited, kReportPlaces);
  return j.dump();
}

std::string IpcServer::formatSnapshot(const SnapshotEvent& e) {
  nlohmann::json j = toJson(e.snapshot);
  j["type"] = "snapshot";
  j["sequence_id"] = e.snapshot.sequence_id;
  return j.dump();
}

}  // namespace perpsim
