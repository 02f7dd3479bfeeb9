#pragma once

#include "perpsim/domain/decimal.hpp"
#include "perpsim/domain/side.hpp"

namespace perpsim {
namespace domain {

// -----------------------------------------------------------------------------
// Position - the account's single leveraged margin position
// -----------------------------------------------------------------------------
//
// @brief  Holds side, quantity, weighted-average entry price and leverage,
//         and derives PnL, margin ratio, liquidation price and value from
//         them. Pure value type: no I/O, no events, no balance.
//
// @details
// Invariant (enforced by every mutator):
//
//   quantity == 0  <=>  side == Flat  <=>  entry_price == 0
//
// Sign convention: every formula multiplies by sign(side), +1 for Long and
// -1 for Short, so the same expression covers both directions.
//
// Math rules:
//
//   increase(q, p):
//     entry = (qty * entry + q * p) / (qty + q)
//     qty  += q
//
//   decrease(q, p):
//     initial = q * entry                  (capital returned, unleveraged)
//     pnl     = sign * q * (p - entry)
//     qty    -= q;  qty == 0 resets side to Flat and entry to 0.
//     Leverage is kept across the reset.
//
//   margin(p)   = 100 * pnl(p) / (qty * entry / leverage)
//                 -100 means the posted margin is fully consumed.
//
//   value(p, f) = qty * entry / leverage + pnl(p) - fee
//                 fee = (qty * entry + pnl(p)) * f   (cost of closing at p)
//
//   liquidationPrice(f):
//     base = entry - sign * entry / leverage
//     liq  = base + sign * base * qty * f
//
// The caller (MatchingEngine) is responsible for balance bookkeeping: the
// Position never sees the account balance.
//
// Thread model:
//   Owned by TickLoop and mutated only on the tick thread. Snapshots leave
//   the thread as PositionSnapshot copies.
// -----------------------------------------------------------------------------
class Position {
 public:
  // Result of decrease(): the caller credits initial / leverage + pnl - fee.
  struct Reduction {
    Decimal initial;
    Decimal pnl;
  };

  Position() = default;

  // -------------------------------------------------------------------------
  // setLeverage(leverage)
  // -------------------------------------------------------------------------
  // @brief  Changes leverage only while the position is Flat.
  //
  // @return The leverage in effect after the call. Callers must use the
  //         returned value; while a position is open the request is ignored
  //         and the old leverage comes back.
  //
  // @throws std::invalid_argument if leverage < 1.
  // -------------------------------------------------------------------------
  int setLeverage(int leverage);

  // -------------------------------------------------------------------------
  // setSide(side)
  // -------------------------------------------------------------------------
  // @brief  Chooses the direction before the first increase() of a new
  //         position. Re-asserting the current side is allowed.
  //
  // @throws std::logic_error when switching direction while not Flat, or
  //         when asked to set Flat explicitly (only decrease() flattens).
  // -------------------------------------------------------------------------
  void setSide(PositionSide side);

  // -------------------------------------------------------------------------
  // increase(quantity, price)
  // -------------------------------------------------------------------------
  // @brief  Adds quantity at price and re-weights the entry price.
  //
  // @throws std::invalid_argument if quantity <= 0 or price <= 0.
  //         std::logic_error if the side has not been set (still Flat).
  // -------------------------------------------------------------------------
  void increase(Decimal quantity, const Decimal& price);

  // -------------------------------------------------------------------------
  // decrease(quantity, price)
  // -------------------------------------------------------------------------
  // @brief  Removes quantity at price and reports capital and PnL released.
  //
  // @throws std::invalid_argument unless 0 < quantity <= this->quantity()
  //         and price > 0.
  //
  // quantity is copied so decrease(quantity(), price) closes the whole
  // position.
  // -------------------------------------------------------------------------
  Reduction decrease(Decimal quantity, const Decimal& price);

  Decimal pnl(const Decimal& price) const;
  Decimal margin(const Decimal& price) const;
  Decimal value(const Decimal& price, const Decimal& fee_rate) const;
  Decimal liquidationPrice(const Decimal& fee_rate) const;

  PositionSide side() const { return side_; }
  const Decimal& quantity() const { return quantity_; }
  const Decimal& entryPrice() const { return entry_price_; }
  int leverage() const { return leverage_; }
  bool isFlat() const { return side_ == PositionSide::Flat; }

 private:
  PositionSide side_{PositionSide::Flat};
  Decimal quantity_{0};
  Decimal entry_price_{0};
  int leverage_{1};
};

}  // namespace domain
}  // namespace perpsim
