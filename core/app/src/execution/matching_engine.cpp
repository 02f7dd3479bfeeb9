#include "perpsim/execution/matching_engine.hpp"

#include <stdexcept>

namespace perpsim {

const char* toString(MatchingEngine::FillKind kind) {
  switch (kind) {
    case MatchingEngine::FillKind::None:     return "none";
    case MatchingEngine::FillKind::Open:     return "open";
    case MatchingEngine::FillKind::Increase: return "increase";
    case MatchingEngine::FillKind::Decrease: return "decrease";
    case MatchingEngine::FillKind::Close:    return "close";
    case MatchingEngine::FillKind::Reverse:  return "reverse";
  }
  return "unknown";
}

Decimal MatchingEngine::executionPrice(const domain::Order& order,
                                       const Decimal& tick_price) {
  if (order.isMarket()) {
    return tick_price;
  }
  return *order.limit_price;
}

Decimal MatchingEngine::openCost(const Decimal& quantity, const Decimal& price,
                                 int leverage, const Decimal& fee_rate) {
  const Decimal fee = quantity * price * fee_rate;
  return quantity * price / leverage + fee;
}

Decimal MatchingEngine::settleDecrease(domain::Position& position,
                                       const Decimal& quantity,
                                       const Decimal& price, int leverage,
                                       const Decimal& fee_rate) {
  const auto reduction = position.decrease(quantity, price);
  const Decimal fee = (reduction.initial + reduction.pnl) * fee_rate;
  return reduction.initial / leverage + reduction.pnl - fee;
}

std::optional<MatchingEngine::MatchResult> MatchingEngine::process(
    const Decimal& price, OrderQueue& queue, domain::Position& position,
    domain::Account& account, int desired_leverage) const {
  if (price <= 0) {
    throw std::invalid_argument("MatchingEngine: price must be positive");
  }

  const auto eligible = queue.eligible(price);
  if (eligible.empty()) {
    return std::nullopt;
  }

  MatchResult result;
  result.order = eligible.front();
  queue.remove(result.order.id);

  const domain::Order& order = result.order;
  const Decimal exec_price = executionPrice(order, price);
  const int leverage = position.setLeverage(desired_leverage);
  result.execution_price = exec_price;
  result.leverage = leverage;

  auto reject = [&result](domain::RejectReason reason) {
    result.order.status = domain::OrderStatus::Rejected;
    result.reason = reason;
    result.kind = FillKind::None;
    return result;
  };

  // ---------------------------------------------------------------------------
  // Value floor
  // ---------------------------------------------------------------------------
  if (order.quantity * exec_price / leverage < account.min_notional) {
    return reject(domain::RejectReason::BelowMinNotional);
  }

  const Decimal& fee_rate = account.fee_rate;

  // ---------------------------------------------------------------------------
  // Open or increase
  // ---------------------------------------------------------------------------
  if (position.isFlat() || domain::isSameDirection(order.side, position.side())) {
    const Decimal cost = openCost(order.quantity, exec_price, leverage, fee_rate);
    if (account.balance < cost) {
      return reject(domain::RejectReason::InsufficientBalance);
    }
    result.kind = position.isFlat() ? FillKind::Open : FillKind::Increase;
    account.balance -= cost;
    position.setSide(domain::positionSideFor(order.side));
    position.increase(order.quantity, exec_price);
    result.balance_delta = -cost;
    result.order.status = domain::OrderStatus::Filled;
    return result;
  }

  // ---------------------------------------------------------------------------
  // Decrease or close
  // ---------------------------------------------------------------------------
  if (order.quantity <= position.quantity()) {
    const Decimal credit =
        settleDecrease(position, order.quantity, exec_price, leverage, fee_rate);
    account.balance += credit;
    result.kind = position.isFlat() ? FillKind::Close : FillKind::Decrease;
    result.balance_delta = credit;
    result.order.status = domain::OrderStatus::Filled;
    return result;
  }

  // ---------------------------------------------------------------------------
  // Close and reverse
  // ---------------------------------------------------------------------------
  const Decimal remaining = order.quantity - position.quantity();
  const Decimal cost = openCost(remaining, exec_price, leverage, fee_rate);
  const Decimal available =
      account.balance + position.value(exec_price, fee_rate);
  if (available < cost) {
    return reject(domain::RejectReason::InsufficientBalance);
  }

  const Decimal credit = settleDecrease(position, position.quantity(),
                                        exec_price, leverage, fee_rate);
  account.balance += credit;
  account.balance -= cost;
  position.setSide(domain::positionSideFor(order.side));
  position.increase(remaining, exec_price);

  result.kind = FillKind::Reverse;
  result.balance_delta = credit - cost;
  result.order.status = domain::OrderStatus::Filled;
  return result;
}

}  // namespace perpsim
