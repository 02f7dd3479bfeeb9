#include "perpsim/risk/liquidation_monitor.hpp"

namespace perpsim {

bool LiquidationMonitor::breached(domain::PositionSide side,
                                  const Decimal& price,
                                  const Decimal& liquidation_price) {
  switch (side) {
    case domain::PositionSide::Long:  return price <= liquidation_price;
    case domain::PositionSide::Short: return price >= liquidation_price;
    case domain::PositionSide::Flat:  return false;
  }
  return false;
}

std::optional<LiquidationMonitor::Result> LiquidationMonitor::check(
    const Decimal& price, domain::Position& position,
    const Decimal& fee_rate) const {
  if (position.isFlat()) {
    return std::nullopt;
  }

  const Decimal liquidation_price = position.liquidationPrice(fee_rate);
  if (!breached(position.side(), price, liquidation_price)) {
    return std::nullopt;
  }

  Result result;
  result.side = position.side();
  result.quantity = position.quantity();
  result.entry_price = position.entryPrice();
  result.liquidation_price = liquidation_price;
  result.price = price;

  const int leverage = position.leverage();
  const auto reduction = position.decrease(position.quantity(), price);
  result.forfeited = reduction.initial / leverage + reduction.pnl;
  return result;
}

}  // namespace perpsim
