#pragma once

#include "perpsim/domain/account.hpp"
#include "perpsim/domain/decimal.hpp"
#include "perpsim/domain/order.hpp"
#include "perpsim/domain/order_status.hpp"
#include "perpsim/domain/position.hpp"
#include "perpsim/risk/order_queue.hpp"

#include <optional>

namespace perpsim {

// -----------------------------------------------------------------------------
// MatchingEngine
// -----------------------------------------------------------------------------
// Responsibility: Turns the order queue plus one tick price into balance and
// position mutations. Picks the first eligible order in queue order, fills
// or rejects it, and removes it from the queue. Later orders wait for the
// next tick, even if they are eligible too.
//
// Per order:
//   1. leverage  = position.setLeverage(desired)   (frozen while open)
//   2. execution price: tick price for market orders, the limit price for
//      limit orders
//   3. quantity * price / leverage < min_notional  -> Rejected
//   4. same direction as the position (or Flat)    -> open / increase
//      opposite, quantity <= position quantity     -> decrease / close
//      opposite, quantity >  position quantity     -> close and reverse,
//        funded by balance + position.value(); rejected as a whole
//        (nothing closes) when that is not enough
//
// Thread model: stateless; called on the tick thread with state owned by
// TickLoop.
// -----------------------------------------------------------------------------
class MatchingEngine {
 public:
  enum class FillKind {
    None,      // rejected
    Open,      // opened from Flat
    Increase,  // added to a same-direction position
    Decrease,  // reduced, position stays open
    Close,     // reduced to Flat
    Reverse,   // closed and reopened the other way
  };

  struct MatchResult {
    domain::Order order;  // status is Filled or Rejected
    domain::RejectReason reason{domain::RejectReason::None};
    Decimal execution_price{0};
    int leverage{1};
    FillKind kind{FillKind::None};
    Decimal balance_delta{0};
  };

  // -------------------------------------------------------------------------
  // process(price, queue, position, account, desired_leverage)
  // -------------------------------------------------------------------------
  // @return The order that was processed this tick, or std::nullopt when no
  //         queued order is eligible. With an empty queue nothing is touched.
  //
  // @throws std::invalid_argument if desired_leverage < 1 (propagated from
  //         Position::setLeverage) or price <= 0.
  // -------------------------------------------------------------------------
  std::optional<MatchResult> process(const Decimal& price, OrderQueue& queue,
                                     domain::Position& position,
                                     domain::Account& account,
                                     int desired_leverage) const;

  // Price an eligible order executes at. A limit order that the tick has
  // reached or crossed fills at its own limit.
  static Decimal executionPrice(const domain::Order& order,
                                const Decimal& tick_price);

  // qty * price * fee_rate + qty * price / leverage
  static Decimal openCost(const Decimal& quantity, const Decimal& price,
                          int leverage, const Decimal& fee_rate);

 private:
  // Closes `quantity` and returns the amount credited to the balance.
  static Decimal settleDecrease(domain::Position& position,
                                const Decimal& quantity, const Decimal& price,
                                int leverage, const Decimal& fee_rate);
};

const char* toString(MatchingEngine::FillKind kind);

}  // namespace perpsim
