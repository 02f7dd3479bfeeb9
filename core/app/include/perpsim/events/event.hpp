#pragma once

#include "perpsim/events/event_types.hpp"
#include "perpsim/events/liquidation_event.hpp"
#include "perpsim/events/order_update_event.hpp"
#include "perpsim/events/position_update_event.hpp"
#include "perpsim/events/snapshot_event.hpp"

#include <variant>

namespace perpsim {

// -----------------------------------------------------------------------------
// Event
// -----------------------------------------------------------------------------
// Responsibility: The single envelope type carried by the EventBus and by
// the IPC telemetry queue. Everything the tick loop announces is one of
// these alternatives.
// -----------------------------------------------------------------------------
using Event = std::variant<
    TickEvent,
    OrderUpdateEvent,
    PositionUpdateEvent,
    LiquidationEvent,
    SnapshotEvent>;

// Alternative name for log lines: "TickEvent", "OrderUpdateEvent", ...
inline const char* eventName(const Event& event) {
  switch (event.index()) {
    case 0: return "TickEvent";
    case 1: return "OrderUpdateEvent";
    case 2: return "PositionUpdateEvent";
    case 3: return "LiquidationEvent";
    case 4: return "SnapshotEvent";
  }
  return "UnknownEvent";
}

}  // namespace perpsim
