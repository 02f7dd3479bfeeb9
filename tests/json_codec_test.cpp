// =============================================================================
// json_codec_test.cpp
// =============================================================================
// Unit tests for perpsim/network/json_codec.hpp and the IPC telemetry
// formatter built on it.
//
// Validates:
//   - Snapshot document keys and 2-place rounding
//   - Flat position serializes as {}, market order price as null
//   - Order requests parse from numbers or strings, any side case
//   - Malformed requests throw std::invalid_argument
//   - Telemetry messages carry a "type" and skip TickEvent
// =============================================================================

#include "perpsim/network/ipc_server.hpp"
#include "perpsim/network/json_codec.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using perpsim::Decimal;
using perpsim::parseDecimal;
using nlohmann::json;

class JsonCodecTest : public ::testing::Test {
 protected:
  static perpsim::domain::AccountSnapshot makeSnapshot() {
    perpsim::domain::AccountSnapshot s;
    s.sequence_id = 3;
    s.timestamp_ms = 1700000000000;
    s.time = "22:13:20";
    s.symbol = "BTCUSDT";
    s.price = parseDecimal("101.5");
    s.balance = parseDecimal("899.996");
    s.total_value = parseDecimal("1001.4949");
    s.leverage = 1;
    return s;
  }
};

// -----------------------------------------------------------------------------
// 1. All top-level keys present; money rounded to 2 places.
// -----------------------------------------------------------------------------
TEST_F(JsonCodecTest, FlatSnapshotDocument) {
  const json j = perpsim::toJson(makeSnapshot());

  EXPECT_EQ(j.at("timestamp_ms").get<std::int64_t>(), 1700000000000);
  EXPECT_EQ(j.at("time"), "22:13:20");
  EXPECT_EQ(j.at("symbol"), "BTCUSDT");
  EXPECT_DOUBLE_EQ(j.at("price").get<double>(), 101.5);
  EXPECT_DOUBLE_EQ(j.at("balance").get<double>(), 900.0);
  EXPECT_DOUBLE_EQ(j.at("total_value").get<double>(), 1001.49);
  EXPECT_EQ(j.at("leverage"), 1);
  EXPECT_TRUE(j.at("position").is_object());
  EXPECT_TRUE(j.at("position").empty());
  EXPECT_TRUE(j.at("open_orders").is_array());
  EXPECT_TRUE(j.at("open_orders").empty());
}

// -----------------------------------------------------------------------------
// 2. Position and open orders serialize with their fixed keys.
// -----------------------------------------------------------------------------
TEST_F(JsonCodecTest, PositionAndOrders) {
  auto s = makeSnapshot();
  perpsim::domain::PositionSnapshot p;
  p.side = perpsim::domain::PositionSide::Short;
  p.quantity = parseDecimal("0.5");
  p.entry_price = parseDecimal("100.123");
  p.leverage = 10;
  p.liquidation_price = parseDecimal("110.1353");
  p.pnl = parseDecimal("-0.6885");
  p.margin = parseDecimal("-13.75");
  s.position = p;

  perpsim::domain::Order limit;
  limit.id = 4;
  limit.side = perpsim::domain::Side::Buy;
  limit.quantity = 2;
  limit.limit_price = parseDecimal("99.5");
  perpsim::domain::Order market;
  market.id = 5;
  market.side = perpsim::domain::Side::Sell;
  market.quantity = 1;
  s.open_orders = {limit, market};

  const json j = perpsim::toJson(s);
  const json& pos = j.at("position");
  EXPECT_EQ(pos.at("side"), "Short");
  EXPECT_DOUBLE_EQ(pos.at("quantity").get<double>(), 0.5);
  EXPECT_DOUBLE_EQ(pos.at("entry_price").get<double>(), 100.12);
  EXPECT_EQ(pos.at("leverage"), 10);
  EXPECT_DOUBLE_EQ(pos.at("liquidation_price").get<double>(), 110.14);
  EXPECT_DOUBLE_EQ(pos.at("pnl").get<double>(), -0.69);
  EXPECT_DOUBLE_EQ(pos.at("margin").get<double>(), -13.75);

  const json& orders = j.at("open_orders");
  ASSERT_EQ(orders.size(), 2u);
  EXPECT_EQ(orders[0].at("id"), 4);
  EXPECT_EQ(orders[0].at("side"), "BUY");
  EXPECT_DOUBLE_EQ(orders[0].at("price").get<double>(), 99.5);
  EXPECT_EQ(orders[1].at("side"), "SELL");
  EXPECT_TRUE(orders[1].at("price").is_null());
}

// -----------------------------------------------------------------------------
// 3. Order requests: side in any case, numbers or strings, optional price.
// -----------------------------------------------------------------------------
TEST_F(JsonCodecTest, ParsesOrderRequests) {
  auto market = perpsim::orderRequestFromJson(
      json::parse(R"({"side": "buy", "quantity": 0.1})"));
  EXPECT_EQ(market.side, perpsim::domain::Side::Buy);
  EXPECT_EQ(market.quantity, parseDecimal("0.1"));
  EXPECT_FALSE(market.limit_price.has_value());

  auto limit = perpsim::orderRequestFromJson(
      json::parse(R"({"side": "SELL", "quantity": "2", "price": "101.5"})"));
  EXPECT_EQ(limit.side, perpsim::domain::Side::Sell);
  EXPECT_EQ(limit.quantity, 2);
  ASSERT_TRUE(limit.limit_price.has_value());
  EXPECT_EQ(*limit.limit_price, parseDecimal("101.5"));

  auto null_price = perpsim::orderRequestFromJson(
      json::parse(R"({"side": "Sell", "quantity": 1, "price": null})"));
  EXPECT_FALSE(null_price.limit_price.has_value());
}

// -----------------------------------------------------------------------------
// 4. Malformed requests are rejected before reaching the channel.
// -----------------------------------------------------------------------------
TEST_F(JsonCodecTest, RejectsMalformedRequests) {
  EXPECT_THROW(perpsim::orderRequestFromJson(json::parse(R"({"quantity": 1})")),
               std::invalid_argument);
  EXPECT_THROW(perpsim::orderRequestFromJson(
                   json::parse(R"({"side": "hold", "quantity": 1})")),
               std::invalid_argument);
  EXPECT_THROW(perpsim::orderRequestFromJson(json::parse(R"({"side": "buy"})")),
               std::invalid_argument);
  EXPECT_THROW(perpsim::orderRequestFromJson(
                   json::parse(R"({"side": "buy", "quantity": true})")),
               std::invalid_argument);
  EXPECT_THROW(perpsim::orderRequestFromJson(
                   json::parse(R"({"side": "buy", "quantity": "lots"})")),
               std::invalid_argument);
  EXPECT_THROW(perpsim::orderRequestFromJson(json::parse("[1, 2]")),
               std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 5. Telemetry: every published message has a "type"; ticks are not sent.
// -----------------------------------------------------------------------------
TEST_F(JsonCodecTest, TelemetryFormatting) {
  perpsim::OrderUpdateEvent rejected;
  rejected.order.id = 9;
  rejected.order.side = perpsim::domain::Side::Buy;
  rejected.order.quantity = 1;
  rejected.order.status = perpsim::domain::OrderStatus::Rejected;
  rejected.reason = perpsim::domain::RejectReason::InsufficientBalance;

  auto text = perpsim::IpcServer::formatTelemetry(rejected);
  ASSERT_TRUE(text.has_value());
  const json j = json::parse(*text);
  EXPECT_EQ(j.at("type"), "order_update");
  EXPECT_EQ(j.at("id"), 9);
  EXPECT_EQ(j.at("status"), "Rejected");
  EXPECT_EQ(j.at("reason"), "not enough balance");
  EXPECT_FALSE(j.contains("fill_price"));

  perpsim::SnapshotEvent snapshot{makeSnapshot()};
  auto snap_text = perpsim::IpcServer::formatTelemetry(snapshot);
  ASSERT_TRUE(snap_text.has_value());
  EXPECT_EQ(json::parse(*snap_text).at("type"), "snapshot");

  perpsim::LiquidationEvent liquidation;
  liquidation.forfeited = parseDecimal("-5");
  auto liq_text = perpsim::IpcServer::formatTelemetry(liquidation);
  ASSERT_TRUE(liq_text.has_value());
  EXPECT_DOUBLE_EQ(json::parse(*liq_text).at("forfeited").get<double>(), -5.0);

  EXPECT_FALSE(
      perpsim::IpcServer::formatTelemetry(perpsim::TickEvent{}).has_value());
}
