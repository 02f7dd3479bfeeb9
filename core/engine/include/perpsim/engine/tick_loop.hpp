#pragma once

#include "perpsim/concurrent/command_channel.hpp"
#include "perpsim/concurrent/order_id_generator.hpp"
#include "perpsim/config/engine_config.hpp"
#include "perpsim/domain/account.hpp"
#include "perpsim/domain/account_snapshot.hpp"
#include "perpsim/domain/position.hpp"
#include "perpsim/eventbus/event_bus.hpp"
#include "perpsim/execution/matching_engine.hpp"
#include "perpsim/gateway/i_price_source.hpp"
#include "perpsim/risk/liquidation_monitor.hpp"
#include "perpsim/risk/order_queue.hpp"
#include "perpsim/snapshot/i_snapshot_sink.hpp"
#include "perpsim/snapshot/snapshot_store.hpp"
#include "perpsim/time/i_time_provider.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace perpsim {

// -----------------------------------------------------------------------------
// TickLoop - the simulator engine
// -----------------------------------------------------------------------------
//
// @brief  Owns the account, the position and the order queue, and advances
//         them one price tick at a time.
//
// @details
// One iteration (runOnce):
//
//   1. price = source.nextPrice()         blocks; nullopt -> tick skipped
//   2. ingest from the CommandChannel:
//        cancellations      (removed before matching can fill them)
//        leverage request   (becomes the desired leverage)
//        pending order      (gets the next id, queued as Open)
//   3. LiquidationMonitor::check
//   4. MatchingEngine::process            at most one order
//   5. snapshot -> SnapshotEvent on the bus, then every ISnapshotSink
//   6. status log line; open order ids handed back to the channel
//
// A snapshot sink that throws is logged; the tick still counts and the loop
// continues. FeedError from the price source propagates out of run().
//
// State machine:
//   Idle        waiting in nextPrice() or the tick throttle
//   Processing  inside steps 2..6
//
// Events (published synchronously on the tick thread):
//   TickEvent, OrderUpdateEvent, PositionUpdateEvent, LiquidationEvent,
//   SnapshotEvent
//
// Thread model:
//   run()/runOnce() and the accessors below belong to the tick thread.
//   executeCommand(), stop(), state() and tickCount() are safe from any
//   thread; executeCommand() only touches the CommandChannel and the
//   internal SnapshotStore.
//
// Ownership:
//   The price source, command channel, clock and registered sinks are
//   borrowed and must outlive the loop.
// -----------------------------------------------------------------------------
class TickLoop {
 public:
  enum class State { Idle, Processing };

  TickLoop(EngineConfig config, IPriceSource& source, CommandChannel& channel,
           const ITimeProvider& clock);

  TickLoop(const TickLoop&) = delete;
  TickLoop& operator=(const TickLoop&) = delete;
  TickLoop(TickLoop&&) = delete;
  TickLoop& operator=(TickLoop&&) = delete;

  // Sinks are called in registration order, after the internal store.
  void addSnapshotSink(ISnapshotSink& sink);

  // -------------------------------------------------------------------------
  // run()
  // -------------------------------------------------------------------------
  // @brief  runOnce() until stop(), sleeping tick_interval_ms after each
  //         iteration.
  //
  // @throws FeedError when the price source fails.
  // -------------------------------------------------------------------------
  void run();

  // -------------------------------------------------------------------------
  // runOnce()
  // -------------------------------------------------------------------------
  // @return true if a tick was processed, false if the source produced no
  //         usable price.
  //
  // @throws FeedError from the price source.
  // -------------------------------------------------------------------------
  bool runOnce();

  // Cooperative: checked between ticks. Also stops the price source so a
  // ZmqPriceFeed blocked in recv() returns.
  void stop();
  bool stopRequested() const { return stop_requested_.load(); }

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  // @brief  IPC command handler. `cmd` is a JSON object with a "command"
  //         field, or a bare command name ("PING", "status").
  //
  // @return JSON text: {"status": "ok", ...} or
  //         {"status": "error", "response": "<reason>"}. Never throws for
  //         bad client input.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  EventBus& eventBus() { return bus_; }

  State state() const { return state_.load(); }
  std::uint64_t tickCount() const { return tick_count_.load(); }

  // --- tick-thread accessors -------------------------------------------------
  const domain::Position& position() const { return position_; }
  const domain::Account& account() const { return account_; }
  const OrderQueue& orders() const { return queue_; }
  int desiredLeverage() const { return desired_leverage_; }
  const EngineConfig& config() const { return config_; }
  const SnapshotStore& snapshots() const { return store_; }

  // Snapshot of the current state at `price`, stamped `now_ms`.
  domain::AccountSnapshot buildSnapshot(const Decimal& price,
                                        std::int64_t now_ms) const;

 private:
  void ingestCommands(const Decimal& price, Timestamp ts);
  void checkLiquidation(const Decimal& price, Timestamp ts);
  void runMatching(const Decimal& price, Timestamp ts);
  void publishSnapshot(const Decimal& price, std::int64_t now_ms);
  void publishPositionUpdate(const Decimal& price, Timestamp ts);
  void logStatus(const Decimal& price) const;

  std::optional<domain::PositionSnapshot> positionSnapshot(
      const Decimal& price) const;

  std::string priceText(const Decimal& price) const;

  EngineConfig config_;
  IPriceSource& source_;
  CommandChannel& channel_;
  const ITimeProvider& clock_;

  domain::Account account_;
  domain::Position position_;
  OrderQueue queue_;
  int desired_leverage_{1};

  OrderIdGenerator ids_;
  MatchingEngine matcher_;
  LiquidationMonitor liquidation_;

  EventBus bus_;
  SnapshotStore store_;
  std::vector<ISnapshotSink*> sinks_;

  std::atomic<State> state_{State::Idle};
  std::atomic<std::uint64_t> tick_count_{0};
  std::atomic<bool> stop_requested_{false};

  std::mutex throttle_mutex_;
  std::condition_variable throttle_cv_;
};

const char* toString(TickLoop::State state);

}  // namespace perpsim
