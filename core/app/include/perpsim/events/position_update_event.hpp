#pragma once

#include "perpsim/domain/account_snapshot.hpp"
#include "perpsim/events/event_types.hpp"

namespace perpsim {

// -----------------------------------------------------------------------------
// PositionUpdateEvent
// -----------------------------------------------------------------------------
//
// @brief  Snapshot of the position and balance after a fill changed them.
//
// @details
// Published by the tick loop right after the matching engine fills an
// order (not on rejections, which leave the position untouched). The
// position field is empty when the fill closed the position.
// -----------------------------------------------------------------------------
struct PositionUpdateEvent {
  std::optional<domain::PositionSnapshot> position;
  Decimal balance{0};
  Decimal price{0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace perpsim
