// =============================================================================
// command_channel_test.cpp
// =============================================================================
// Unit tests for perpsim::CommandChannel.
//
// Validates:
//   - Take-and-clear semantics for the order and leverage slots
//   - Overwrite-on-conflict: the newest submission wins
//   - Validation happens at submission and leaves the slot untouched
//   - Cancel succeeds only for published open ids, once
//   - Concurrent submitters never corrupt the slot
// =============================================================================

#include "perpsim/concurrent/command_channel.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <thread>
#include <vector>

using perpsim::CommandChannel;
using perpsim::Decimal;
using perpsim::parseDecimal;
using perpsim::domain::OrderRequest;
using perpsim::domain::Side;

class CommandChannelTest : public ::testing::Test {
 protected:
  CommandChannel channel;

  static OrderRequest order(Side side, const char* qty) {
    OrderRequest r;
    r.side = side;
    r.quantity = parseDecimal(qty);
    return r;
  }
};

// -----------------------------------------------------------------------------
// 1. Slots are empty until written and empty again after being read.
// -----------------------------------------------------------------------------
TEST_F(CommandChannelTest, TakeAndClear) {
  EXPECT_FALSE(channel.getPendingOrder().has_value());
  EXPECT_FALSE(channel.getLeverageRequest().has_value());

  channel.submitOrder(order(Side::Buy, "1"));
  channel.requestLeverage(5);

  auto pending = channel.getPendingOrder();
  ASSERT_TRUE(pending.has_value());
  EXPECT_EQ(pending->side, Side::Buy);
  EXPECT_EQ(channel.getLeverageRequest(), std::optional<int>(5));

  EXPECT_FALSE(channel.getPendingOrder().has_value());
  EXPECT_FALSE(channel.getLeverageRequest().has_value());
}

// -----------------------------------------------------------------------------
// 2. A second submission before the tick consumes the first replaces it.
// -----------------------------------------------------------------------------
TEST_F(CommandChannelTest, NewestSubmissionWins) {
  channel.submitOrder(order(Side::Buy, "1"));
  channel.submitOrder(order(Side::Sell, "2"));
  channel.requestLeverage(2);
  channel.requestLeverage(20);

  auto pending = channel.getPendingOrder();
  ASSERT_TRUE(pending.has_value());
  EXPECT_EQ(pending->side, Side::Sell);
  EXPECT_EQ(pending->quantity, 2);
  EXPECT_EQ(channel.getLeverageRequest(), std::optional<int>(20));
}

// -----------------------------------------------------------------------------
// 3. Invalid submissions throw and do not clobber a valid pending one.
// -----------------------------------------------------------------------------
TEST_F(CommandChannelTest, ValidationAtSubmission) {
  channel.submitOrder(order(Side::Buy, "1"));

  EXPECT_THROW(channel.submitOrder(order(Side::Buy, "0")),
               std::invalid_argument);
  EXPECT_THROW(channel.submitOrder(order(Side::Buy, "-1")),
               std::invalid_argument);
  OrderRequest bad_limit = order(Side::Sell, "1");
  bad_limit.limit_price = Decimal(0);
  EXPECT_THROW(channel.submitOrder(bad_limit), std::invalid_argument);
  EXPECT_THROW(channel.requestLeverage(0), std::invalid_argument);

  auto pending = channel.getPendingOrder();
  ASSERT_TRUE(pending.has_value());
  EXPECT_EQ(pending->quantity, 1);
  EXPECT_FALSE(channel.getLeverageRequest().has_value());
}

// -----------------------------------------------------------------------------
// 4. Cancel only works for ids the engine reported as open, and only once.
// -----------------------------------------------------------------------------
TEST_F(CommandChannelTest, CancelOnlyOpenIdsOnce) {
  EXPECT_FALSE(channel.cancelOrder(1));

  channel.publishOpenOrders({1, 2});
  EXPECT_TRUE(channel.cancelOrder(2));
  EXPECT_FALSE(channel.cancelOrder(2));
  EXPECT_FALSE(channel.cancelOrder(3));

  EXPECT_EQ(channel.takeCancelRequests(),
            (std::vector<perpsim::domain::OrderId>{2}));
  EXPECT_TRUE(channel.takeCancelRequests().empty());
}

// -----------------------------------------------------------------------------
// 5. An id with a pending cancel stays non-cancellable across a refresh.
// Why: The tick loop may publish its open ids between a cancel and the next
//      tick's ingest.
// -----------------------------------------------------------------------------
TEST_F(CommandChannelTest, PendingCancelSurvivesRefresh) {
  channel.publishOpenOrders({1});
  ASSERT_TRUE(channel.cancelOrder(1));

  channel.publishOpenOrders({1});
  EXPECT_FALSE(channel.cancelOrder(1));
  EXPECT_EQ(channel.takeCancelRequests().size(), 1u);
}

// -----------------------------------------------------------------------------
// 6. Concurrent writers: the slot always holds one complete submission.
// -----------------------------------------------------------------------------
TEST_F(CommandChannelTest, ConcurrentSubmitters) {
  std::vector<std::thread> writers;
  for (int t = 0; t < 4; ++t) {
    writers.emplace_back([this, t] {
      for (int i = 1; i <= 500; ++i) {
        OrderRequest r;
        r.side = (t % 2 == 0) ? Side::Buy : Side::Sell;
        r.quantity = Decimal(t * 1000 + i);
        channel.submitOrder(r);
      }
    });
  }
  for (auto& w : writers) w.join();

  auto pending = channel.getPendingOrder();
  ASSERT_TRUE(pending.has_value());
  EXPECT_GT(pending->quantity, 0);
  EXPECT_FALSE(channel.getPendingOrder().has_value());
}
