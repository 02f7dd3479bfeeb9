// =============================================================================
// tick_loop_test.cpp
// =============================================================================
// Integration tests for perpsim::TickLoop driven by a scripted price source
// and a simulation clock.
//
// Validates:
//   - The two reference scenarios: buy/sell round trip and liquidation
//   - Per-tick event order on the bus
//   - Skipped ticks change nothing
//   - Cancellation through the channel, applied before matching
//   - Rejections drop the order and leave the account alone
//   - Snapshot sinks: every tick, in order, a throwing sink is survived
//   - IPC command handler responses
//   - run() stops cooperatively
// =============================================================================

#include "perpsim/engine/tick_loop.hpp"
#include "perpsim/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <deque>
#include <functional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

using perpsim::CommandChannel;
using perpsim::Decimal;
using perpsim::EngineConfig;
using perpsim::parseDecimal;
using perpsim::TickLoop;
using perpsim::domain::OrderRequest;
using perpsim::domain::OrderStatus;
using perpsim::domain::PositionSide;
using perpsim::domain::Side;
using nlohmann::json;

namespace {

// Replays a fixed list of prices; nullopt entries model malformed ticks.
class ScriptedPriceSource final : public perpsim::IPriceSource {
 public:
  void push(const char* price) { prices_.push_back(parseDecimal(price)); }
  void pushSkip() { prices_.push_back(std::nullopt); }

  std::optional<Decimal> nextPrice() override {
    if (prices_.empty()) {
      if (on_exhausted) {
        on_exhausted();
      }
      return std::nullopt;
    }
    auto next = prices_.front();
    prices_.pop_front();
    return next;
  }

  void stop() override { stopped = true; }

  std::function<void()> on_exhausted;
  bool stopped{false};

 private:
  std::deque<std::optional<Decimal>> prices_;
};

class CapturingSink final : public perpsim::ISnapshotSink {
 public:
  void publish(const perpsim::domain::AccountSnapshot& snapshot) override {
    snapshots.push_back(snapshot);
  }
  std::vector<perpsim::domain::AccountSnapshot> snapshots;
};

class ThrowingSink final : public perpsim::ISnapshotSink {
 public:
  void publish(const perpsim::domain::AccountSnapshot&) override {
    ++calls;
    throw std::runtime_error("disk full");
  }
  int calls{0};
};

EngineConfig testConfig() {
  EngineConfig config;
  config.symbol = "btcusdt";
  config.starting_balance = 1000;
  config.fee_rate = 0;
  config.tick_interval_ms = 0;
  config.ipc_cmd_endpoint.clear();
  config.ipc_pub_endpoint.clear();
  config.snapshot_path.clear();
  return config;
}

OrderRequest market(Side side, const char* qty) {
  OrderRequest r;
  r.side = side;
  r.quantity = parseDecimal(qty);
  return r;
}

OrderRequest limit(Side side, const char* qty, const char* price) {
  OrderRequest r = market(side, qty);
  r.limit_price = parseDecimal(price);
  return r;
}

}  // namespace

class TickLoopTest : public ::testing::Test {
 protected:
  ScriptedPriceSource source;
  CommandChannel channel;
  perpsim::SimulationTimeProvider clock{1700000000000};
  TickLoop loop{testConfig(), source, channel, clock};

  // Feeds one price and runs one tick.
  bool tick(const char* price) {
    source.push(price);
    const bool processed = loop.runOnce();
    clock.advance_by(1000);
    return processed;
  }

  static json reply(const std::string& text) { return json::parse(text); }
};

// -----------------------------------------------------------------------------
// 1. Buy 1 @ 100, then sell 1 @ 110: balance 900 then 1010, Flat.
// -----------------------------------------------------------------------------
TEST_F(TickLoopTest, BuyThenSellRoundTrip) {
  channel.submitOrder(market(Side::Buy, "1"));
  ASSERT_TRUE(tick("100"));

  EXPECT_EQ(loop.account().balance, 900);
  EXPECT_EQ(loop.position().side(), PositionSide::Long);
  EXPECT_EQ(loop.position().quantity(), 1);
  EXPECT_EQ(loop.position().entryPrice(), 100);
  EXPECT_EQ(loop.position().leverage(), 1);

  channel.submitOrder(market(Side::Sell, "1"));
  ASSERT_TRUE(tick("110"));

  EXPECT_EQ(loop.account().balance, 1010);
  EXPECT_TRUE(loop.position().isFlat());
  EXPECT_EQ(loop.tickCount(), 2u);

  auto latest = loop.snapshots().latest();
  ASSERT_TRUE(latest.has_value());
  EXPECT_EQ(latest->symbol, "BTCUSDT");
  EXPECT_EQ(latest->total_value, 1010);
  EXPECT_FALSE(latest->position.has_value());
}

// -----------------------------------------------------------------------------
// 2. Long 1 @ 100 at 10X liquidates at 90; the balance is not credited.
// -----------------------------------------------------------------------------
TEST_F(TickLoopTest, LiquidationAtLiquidationPrice) {
  std::vector<perpsim::LiquidationEvent> liquidations;
  loop.eventBus().subscribe<perpsim::LiquidationEvent>(
      [&](const perpsim::LiquidationEvent& e) { liquidations.push_back(e); });

  channel.requestLeverage(10);
  channel.submitOrder(market(Side::Buy, "1"));
  ASSERT_TRUE(tick("100"));

  EXPECT_EQ(loop.position().leverage(), 10);
  EXPECT_EQ(loop.position().liquidationPrice(0), 90);
  EXPECT_EQ(loop.account().balance, 990);

  ASSERT_TRUE(tick("95"));
  EXPECT_EQ(loop.position().side(), PositionSide::Long);
  EXPECT_TRUE(liquidations.empty());

  ASSERT_TRUE(tick("90"));
  EXPECT_TRUE(loop.position().isFlat());
  EXPECT_EQ(loop.account().balance, 990);

  ASSERT_EQ(liquidations.size(), 1u);
  EXPECT_EQ(liquidations[0].side, PositionSide::Long);
  EXPECT_EQ(liquidations[0].liquidation_price, 90);
  EXPECT_EQ(liquidations[0].price, 90);
  EXPECT_EQ(liquidations[0].forfeited, 0);
  EXPECT_EQ(liquidations[0].sequence_id, 3u);
}

// -----------------------------------------------------------------------------
// 3. Event order within one tick that ingests and fills an order.
// -----------------------------------------------------------------------------
TEST_F(TickLoopTest, EventOrderOnFillTick) {
  std::vector<std::size_t> kinds;
  std::vector<std::uint64_t> sequences;
  loop.eventBus().subscribe([&](const perpsim::Event& e) {
    kinds.push_back(e.index());
    std::visit(
        [&](const auto& ev) {
          using T = std::decay_t<decltype(ev)>;
          if constexpr (std::is_same_v<T, perpsim::SnapshotEvent>) {
            sequences.push_back(ev.snapshot.sequence_id);
          } else {
            sequences.push_back(ev.sequence_id);
          }
        },
        e);
  });

  channel.submitOrder(market(Side::Buy, "1"));
  ASSERT_TRUE(tick("100"));

  // Tick, Open, Filled, PositionUpdate, Snapshot
  const std::vector<std::size_t> expected = {0, 1, 1, 2, 4};
  EXPECT_EQ(kinds, expected);
  for (auto seq : sequences) {
    EXPECT_EQ(seq, 1u);
  }
}

// -----------------------------------------------------------------------------
// 4. A tick without a usable price publishes nothing and changes nothing.
// -----------------------------------------------------------------------------
TEST_F(TickLoopTest, SkippedTickChangesNothing) {
  CapturingSink sink;
  loop.addSnapshotSink(sink);
  channel.submitOrder(market(Side::Buy, "1"));

  source.pushSkip();
  EXPECT_FALSE(loop.runOnce());
  EXPECT_EQ(loop.tickCount(), 0u);
  EXPECT_TRUE(sink.snapshots.empty());
  EXPECT_EQ(loop.account().balance, 1000);

  // Why: the pending order stays in the channel for the next real tick.
  ASSERT_TRUE(tick("100"));
  EXPECT_EQ(loop.position().side(), PositionSide::Long);
  EXPECT_EQ(sink.snapshots.size(), 1u);
}

// -----------------------------------------------------------------------------
// 5. Resting limit order canceled before the tick that would fill it.
// -----------------------------------------------------------------------------
TEST_F(TickLoopTest, CancelRemovesOrderBeforeMatching) {
  std::vector<perpsim::OrderUpdateEvent> updates;
  loop.eventBus().subscribe<perpsim::OrderUpdateEvent>(
      [&](const perpsim::OrderUpdateEvent& e) { updates.push_back(e); });

  channel.submitOrder(limit(Side::Buy, "1", "95"));
  ASSERT_TRUE(tick("100"));
  ASSERT_EQ(loop.orders().size(), 1u);
  const auto id = loop.orders().ids().front();
  EXPECT_EQ(id, 1u);

  EXPECT_TRUE(channel.cancelOrder(id));
  EXPECT_FALSE(channel.cancelOrder(id));

  // 94 would fill the order if it were still queued.
  ASSERT_TRUE(tick("94"));
  EXPECT_TRUE(loop.orders().empty());
  EXPECT_TRUE(loop.position().isFlat());
  EXPECT_EQ(loop.account().balance, 1000);

  ASSERT_EQ(updates.size(), 2u);
  EXPECT_EQ(updates[0].order.status, OrderStatus::Open);
  EXPECT_EQ(updates[1].order.status, OrderStatus::Canceled);
  EXPECT_EQ(updates[1].order.id, id);
}

// -----------------------------------------------------------------------------
// 6. Limit order rests until eligible, then fills at its limit.
// -----------------------------------------------------------------------------
TEST_F(TickLoopTest, LimitOrderRestsThenFills) {
  channel.submitOrder(limit(Side::Sell, "1", "105"));
  ASSERT_TRUE(tick("100"));
  EXPECT_EQ(loop.orders().size(), 1u);

  auto resting = loop.snapshots().latest();
  ASSERT_TRUE(resting.has_value());
  ASSERT_EQ(resting->open_orders.size(), 1u);
  EXPECT_EQ(*resting->open_orders[0].limit_price, 105);

  ASSERT_TRUE(tick("107"));
  EXPECT_TRUE(loop.orders().empty());
  EXPECT_EQ(loop.position().side(), PositionSide::Short);
  EXPECT_EQ(loop.position().entryPrice(), 105);
  EXPECT_EQ(loop.account().balance, 895);
}

// -----------------------------------------------------------------------------
// 7. Rejection drops the order; account and position untouched.
// -----------------------------------------------------------------------------
TEST_F(TickLoopTest, RejectedOrderIsDropped) {
  std::vector<perpsim::OrderUpdateEvent> updates;
  loop.eventBus().subscribe<perpsim::OrderUpdateEvent>(
      [&](const perpsim::OrderUpdateEvent& e) { updates.push_back(e); });

  channel.submitOrder(market(Side::Buy, "20"));
  ASSERT_TRUE(tick("100"));

  EXPECT_TRUE(loop.orders().empty());
  EXPECT_TRUE(loop.position().isFlat());
  EXPECT_EQ(loop.account().balance, 1000);

  ASSERT_EQ(updates.size(), 2u);
  EXPECT_EQ(updates[1].order.status, OrderStatus::Rejected);
  EXPECT_EQ(updates[1].reason,
            perpsim::domain::RejectReason::InsufficientBalance);
  EXPECT_FALSE(updates[1].fill_price.has_value());
}

// -----------------------------------------------------------------------------
// 8. Sinks see every tick; a throwing sink does not stop the loop or the
//    sinks after it.
// -----------------------------------------------------------------------------
TEST_F(TickLoopTest, SnapshotSinks) {
  ThrowingSink failing;
  CapturingSink capturing;
  loop.addSnapshotSink(failing);
  loop.addSnapshotSink(capturing);

  channel.submitOrder(market(Side::Buy, "1"));
  ASSERT_TRUE(tick("100"));
  ASSERT_TRUE(tick("101.5"));

  EXPECT_EQ(failing.calls, 2);
  ASSERT_EQ(capturing.snapshots.size(), 2u);
  EXPECT_EQ(capturing.snapshots[0].sequence_id, 1u);
  EXPECT_EQ(capturing.snapshots[1].sequence_id, 2u);
  EXPECT_EQ(capturing.snapshots[1].timestamp_ms, 1700000001000);

  const auto& last = capturing.snapshots[1];
  EXPECT_EQ(last.price, parseDecimal("101.5"));
  EXPECT_EQ(last.balance, 900);
  EXPECT_EQ(last.total_value, parseDecimal("1001.5"));
  ASSERT_TRUE(last.position.has_value());
  EXPECT_EQ(last.position->pnl, parseDecimal("1.5"));
  EXPECT_EQ(last.position->margin, parseDecimal("1.5"));
}

// -----------------------------------------------------------------------------
// 9. IPC command handler.
// -----------------------------------------------------------------------------
TEST_F(TickLoopTest, QueryCommands) {
  EXPECT_EQ(reply(loop.executeCommand("PING")).at("response"), "PONG");
  EXPECT_EQ(reply(loop.executeCommand(R"({"command": "ping"})")).at("status"),
            "ok");

  auto no_tick = reply(loop.executeCommand(R"({"command": "get_price"})"));
  EXPECT_EQ(no_tick.at("status"), "error");

  auto status = reply(loop.executeCommand("status"));
  EXPECT_EQ(status.at("ticks"), 0);
  EXPECT_TRUE(status.at("snapshot").is_null());

  ASSERT_TRUE(tick("100"));

  EXPECT_DOUBLE_EQ(
      reply(loop.executeCommand("get_price")).at("price").get<double>(), 100.0);
  auto account = reply(loop.executeCommand("get_account"));
  EXPECT_DOUBLE_EQ(account.at("balance").get<double>(), 1000.0);
  EXPECT_EQ(account.at("leverage"), 1);
  EXPECT_TRUE(reply(loop.executeCommand("get_position")).at("position").empty());
  EXPECT_EQ(reply(loop.executeCommand("status")).at("state"), "Idle");

  EXPECT_EQ(reply(loop.executeCommand("launch_rocket")).at("status"), "error");
  EXPECT_EQ(reply(loop.executeCommand("[]")).at("status"), "error");
}

TEST_F(TickLoopTest, MutatingCommands) {
  auto bad_side = reply(loop.executeCommand(
      R"({"command": "submit_order", "side": "hold", "quantity": 1})"));
  EXPECT_EQ(bad_side.at("status"), "error");

  auto bad_qty = reply(loop.executeCommand(
      R"({"command": "submit_order", "side": "buy", "quantity": -1})"));
  EXPECT_EQ(bad_qty.at("status"), "error");

  EXPECT_EQ(reply(loop.executeCommand(
                      R"({"command": "set_leverage", "leverage": "5"})"))
                .at("status"),
            "error");
  EXPECT_EQ(reply(loop.executeCommand(
                      R"({"command": "set_leverage", "leverage": 0})"))
                .at("status"),
            "error");
  // 4294967306 is 2^32 + 10; it must not wrap to 10X.
  EXPECT_EQ(reply(loop.executeCommand(
                      R"({"command": "set_leverage", "leverage": 4294967306})"))
                .at("status"),
            "error");
  EXPECT_FALSE(channel.getLeverageRequest().has_value());
  EXPECT_EQ(reply(loop.executeCommand(
                      R"({"command": "set_leverage", "leverage": 5})"))
                .at("status"),
            "ok");

  EXPECT_EQ(reply(loop.executeCommand(R"({"command": "close_position"})"))
                .at("status"),
            "error");
  EXPECT_EQ(reply(loop.executeCommand(
                      R"({"command": "cancel_order", "id": 42})"))
                .at("status"),
            "error");

  auto submitted = reply(loop.executeCommand(
      R"({"command": "submit_order", "side": "BUY", "quantity": "2"})"));
  EXPECT_EQ(submitted.at("status"), "ok");

  ASSERT_TRUE(tick("100"));
  EXPECT_EQ(loop.desiredLeverage(), 5);
  EXPECT_EQ(loop.position().leverage(), 5);
  EXPECT_EQ(loop.position().quantity(), 2);
  EXPECT_EQ(loop.account().balance, 960);

  auto account = reply(loop.executeCommand("get_account"));
  EXPECT_EQ(account.at("leverage"), 5);

  auto close = reply(loop.executeCommand(R"({"command": "close_position"})"));
  EXPECT_EQ(close.at("status"), "ok");
  ASSERT_TRUE(tick("110"));
  EXPECT_TRUE(loop.position().isFlat());
  EXPECT_EQ(loop.account().balance, 1020);
}

// -----------------------------------------------------------------------------
// 10. Construction and run()/stop().
// -----------------------------------------------------------------------------
TEST_F(TickLoopTest, RejectsInvalidConfig) {
  EngineConfig bad = testConfig();
  bad.starting_balance = 0;
  ScriptedPriceSource other;
  EXPECT_THROW({ TickLoop invalid(bad, other, channel, clock); },
               std::invalid_argument);
}

TEST_F(TickLoopTest, RunStopsCooperatively) {
  source.push("100");
  source.pushSkip();
  source.push("101");
  source.on_exhausted = [this] { loop.stop(); };

  loop.run();

  EXPECT_TRUE(loop.stopRequested());
  EXPECT_TRUE(source.stopped);
  EXPECT_EQ(loop.tickCount(), 2u);
  EXPECT_EQ(loop.state(), TickLoop::State::Idle);
}

// -----------------------------------------------------------------------------
// 11. A bus subscriber that throws does not interrupt the tick.
// -----------------------------------------------------------------------------
TEST_F(TickLoopTest, ThrowingSubscriberDoesNotAbortTick) {
  loop.eventBus().subscribe<perpsim::OrderUpdateEvent>(
      [](const perpsim::OrderUpdateEvent&) {
        throw std::runtime_error("telemetry bridge down");
      });

  channel.submitOrder(market(Side::Buy, "1"));
  ASSERT_TRUE(tick("100"));

  EXPECT_EQ(loop.position().side(), PositionSide::Long);
  EXPECT_EQ(loop.account().balance, 900);
  EXPECT_EQ(loop.snapshots().publishedCount(), 1u);
  EXPECT_EQ(loop.eventBus().failureCount(), 2u);  // Open and Filled
}
