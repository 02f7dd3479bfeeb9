#pragma once

#include "perpsim/domain/decimal.hpp"
#include "perpsim/domain/side.hpp"
#include "perpsim/events/event_types.hpp"

namespace perpsim {

// -----------------------------------------------------------------------------
// LiquidationEvent
// -----------------------------------------------------------------------------
//
// @brief  The liquidation monitor force-closed the position at the tick
//         price.
//
// @details
// Carries the state of the position just before it was closed. The realized
// proceeds are reported for visibility only; they are not credited to the
// balance.
// -----------------------------------------------------------------------------
struct LiquidationEvent {
  domain::PositionSide side{domain::PositionSide::Flat};
  Decimal quantity{0};
  Decimal entry_price{0};
  Decimal liquidation_price{0};
  Decimal price{0};
  Decimal forfeited{0};  // initial / leverage + pnl that was not credited
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace perpsim
