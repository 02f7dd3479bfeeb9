#pragma once

#include "perpsim/concurrent/thread_safe_queue.hpp"
#include "perpsim/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace perpsim {

// -----------------------------------------------------------------------------
// IpcServer - control and telemetry endpoint for status clients
// -----------------------------------------------------------------------------
//
// @brief  One worker thread serving two ZeroMQ sockets:
//           REP  commands from perpsim_ctl (request/response JSON)
//           PUB  telemetry: order updates, position updates, liquidations
//                and the per-tick snapshot, one JSON document per message
//
// @details
// Commands are passed verbatim to the CommandHandler (TickLoop's
// executeCommand) on the IPC thread. The handler must only touch
// thread-safe state: the CommandChannel and the SnapshotStore. Every
// request gets exactly one reply; if the handler throws, the reply is
// {"status": "error", ...} so the REP socket never wedges.
//
// Telemetry is produced on the tick thread. pushTelemetry() enqueues into a
// bounded ThreadSafeQueue (kTelemetryCapacity, oldest dropped first); the
// IPC thread drains it in batches between command polls. The tick thread
// never blocks on a socket.
//
// Lifecycle:
//   start()  creates the context and both sockets, binds, spawns the thread.
//   stop()   joins the thread (after a final telemetry drain) and closes
//            the sockets. Called by the destructor.
//
// A ZeroMQ error on the IPC thread is logged and ends the thread; the
// engine keeps running without IPC.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // @throws zmq::error_t if either endpoint cannot be bound.
  void start();

  void stop();

  bool running() const { return running_.load(); }

  // Thread-safe. TickEvents are ignored here; everything else is queued.
  void pushTelemetry(Event event);

  std::uint64_t telemetrySent() const { return telemetry_sent_.load(); }

  // Dropped because the backlog was full or the PUB socket would block.
  std::uint64_t telemetryDropped() const {
    return telemetry_queue_.dropped() + send_dropped_.load();
  }

  // -------------------------------------------------------------------------
  // formatTelemetry(event)
  // -------------------------------------------------------------------------
  // @return JSON text with a "type" field ("order_update",
  //         "position_update", "liquidation", "snapshot"), or std::nullopt
  //         for events that are not published (TickEvent: the snapshot
  //         already carries the price).
  // -------------------------------------------------------------------------
  static std::optional<std::string> formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;
  static constexpr std::size_t kTelemetryCapacity = 4096;
  static constexpr std::size_t kTelemetryBatch = 256;

  void run();

  void processTelemetry();

  void processCommands();

  std::string handle(const std::string& request);

  static std::string formatOrderUpdate(const OrderUpdateEvent& e);
  static std::string formatPositionUpdate(const PositionUpdateEvent& e);
  static std::string formatLiquidation(const LiquidationEvent& e);
  static std::string formatSnapshot(const SnapshotEvent& e);

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_{kTelemetryCapacity};
  std::atomic<std::uint64_t> telemetry_sent_{0};
  std::atomic<std::uint64_t> send_dropped_{0};

  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace perpsim
