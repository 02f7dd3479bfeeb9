#include "perpsim/domain/position.hpp"

#include <stdexcept>

namespace perpsim {
namespace domain {

// -----------------------------------------------------------------------------
// setLeverage: frozen while a position is open
// -----------------------------------------------------------------------------
int Position::setLeverage(int leverage) {
  if (leverage < 1) {
    throw std::invalid_argument("leverage must be >= 1");
  }
  if (side_ == PositionSide::Flat) {
    leverage_ = leverage;
  }
  return leverage_;
}

// -----------------------------------------------------------------------------
// setSide
// -----------------------------------------------------------------------------
void Position::setSide(PositionSide side) {
  if (side == PositionSide::Flat) {
    throw std::logic_error("Position::setSide: only decrease() may flatten");
  }
  if (side_ != PositionSide::Flat && side_ != side) {
    throw std::logic_error(
        "Position::setSide: cannot reverse an open position");
  }
  side_ = side;
}

// -----------------------------------------------------------------------------
// increase: weighted-average entry
// -----------------------------------------------------------------------------
void Position::increase(Decimal quantity, const Decimal& price) {
  if (quantity <= 0) {
    throw std::invalid_argument("increase: quantity must be positive");
  }
  if (price <= 0) {
    throw std::invalid_argument("increase: price must be positive");
  }
  if (side_ == PositionSide::Flat) {
    throw std::logic_error("increase: side must be set on a flat position");
  }

  // Starting from zero, the formula degenerates to entry = price.
  entry_price_ = (quantity_ * entry_price_ + quantity * price) /
                 (quantity_ + quantity);
  quantity_ += quantity;
}

// -----------------------------------------------------------------------------
// decrease: release capital and realize PnL
// -----------------------------------------------------------------------------
Position::Reduction Position::decrease(Decimal quantity,
                                       const Decimal& price) {
  if (quantity <= 0 || quantity > quantity_) {
    throw std::invalid_argument(
        "decrease: quantity must be in (0, position quantity]");
  }
  if (price <= 0) {
    throw std::invalid_argument("decrease: price must be positive");
  }

  Reduction result;
  result.initial = quantity * entry_price_;
  result.pnl = sign(side_) * quantity * (price - entry_price_);

  quantity_ -= quantity;
  if (quantity_ == 0) {
    side_ = PositionSide::Flat;
    entry_price_ = 0;
  }
  return result;
}

Decimal Position::pnl(const Decimal& price) const {
  return sign(side_) * quantity_ * (price - entry_price_);
}

// -----------------------------------------------------------------------------
// margin: unrealized PnL as a percentage of posted margin
// -----------------------------------------------------------------------------
Decimal Position::margin(const Decimal& price) const {
  if (side_ == PositionSide::Flat) {
    return Decimal(0);
  }
  const Decimal posted = quantity_ * entry_price_ / leverage_;
  return 100 * pnl(price) / posted;
}

Decimal Position::value(const Decimal& price, const Decimal& fee_rate) const {
  const Decimal unrealized = pnl(price);
  const Decimal fee = (quantity_ * entry_price_ + unrealized) * fee_rate;
  return quantity_ * entry_price_ / leverage_ + unrealized - fee;
}

// -----------------------------------------------------------------------------
// liquidationPrice: where margin() reaches -100, nudged by the closing fee
// -----------------------------------------------------------------------------
Decimal Position::liquidationPrice(const Decimal& fee_rate) const {
  const int s = sign(side_);
  const Decimal base = entry_price_ - s * entry_price_ / leverage_;
  const Decimal fee = base * quantity_ * fee_rate;
  return base + s * fee;
}

}  // namespace domain
}  // namespace perpsim
