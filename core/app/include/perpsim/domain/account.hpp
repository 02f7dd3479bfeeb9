#pragma once

#include "perpsim/domain/decimal.hpp"

namespace perpsim {
namespace domain {

// -----------------------------------------------------------------------------
// Account - quote-asset funds and trading costs
// -----------------------------------------------------------------------------
//
// @brief  Balance not committed as position margin, plus the fee rate and
//         minimum order value applied by the matching engine.
//
// @details
// The balance is debited by margin + fee when a position opens or grows, and
// credited by released margin + PnL - fee when it shrinks. Forced
// liquidation does not credit anything.
//
// fee_rate is a fraction of notional (0.0004 = 4 bps) charged on both the
// opening and the closing leg. min_notional is compared against
// quantity * price / leverage, i.e. against the margin an order would post.
//
// Thread model:
//   Owned by TickLoop, mutated only on the tick thread.
// -----------------------------------------------------------------------------
struct Account {
  Decimal balance{0};
  Decimal fee_rate{0};
  Decimal min_notional{1};
};

}  // namespace domain
}  // namespace perpsim
