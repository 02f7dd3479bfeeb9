#pragma once

#include "perpsim/domain/decimal.hpp"
#include "perpsim/domain/position.hpp"
#include "perpsim/domain/side.hpp"

#include <optional>

namespace perpsim {

// -----------------------------------------------------------------------------
// LiquidationMonitor - forced closure when margin is exhausted
// -----------------------------------------------------------------------------
//
// @brief  Runs once per tick, before matching. If the tick has reached the
//         position's fee-adjusted liquidation price, closes the whole
//         position at the tick price.
//
// @details
// Trigger:
//   Long  and price <= liquidationPrice(fee_rate)
//   Short and price >= liquidationPrice(fee_rate)
//
// On trigger the full quantity is decreased at the tick price. There is no
// partial liquidation. The released capital and PnL are NOT credited to
// the account: whatever margin remained at the trigger price is lost. The
// forfeited amount is reported in the result for logging.
//
// Thread model: stateless; called on the tick thread.
// -----------------------------------------------------------------------------
class LiquidationMonitor {
 public:
  struct Result {
    domain::PositionSide side{domain::PositionSide::Flat};
    Decimal quantity{0};
    Decimal entry_price{0};
    Decimal liquidation_price{0};
    Decimal price{0};
    Decimal forfeited{0};
  };

  // True if a position on `side` with this liquidation price must be closed
  // at `price`. Always false for Flat.
  static bool breached(domain::PositionSide side, const Decimal& price,
                       const Decimal& liquidation_price);

  // -------------------------------------------------------------------------
  // check(price, position, fee_rate)
  // -------------------------------------------------------------------------
  // @return The liquidation that was carried out, or std::nullopt if the
  //         position is Flat or the price has not reached the threshold.
  //
  // Side-effects: On trigger, position becomes Flat (leverage kept).
  // -------------------------------------------------------------------------
  std::optional<Result> check(const Decimal& price,
                              domain::Position& position,
                              const Decimal& fee_rate) const;
};

}  // namespace perpsim
