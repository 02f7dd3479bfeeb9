#pragma once

#include "perpsim/domain/decimal.hpp"
#include "perpsim/domain/order.hpp"
#include "perpsim/domain/order_status.hpp"
#include "perpsim/events/event_types.hpp"

#include <optional>

namespace perpsim {

// -----------------------------------------------------------------------------
// OrderUpdateEvent
// -----------------------------------------------------------------------------
//
// @brief  Published whenever an order enters the queue or leaves it.
//
// @details
//   Open      order ingested from the CommandChannel and queued.
//   Filled    executed; fill_price and leverage describe the execution.
//   Rejected  dropped by the matching engine; reason says why.
//   Canceled  removed on client request.
//
// The order field is a copy taken after the transition, so order.status
// always equals the new status.
// -----------------------------------------------------------------------------
struct OrderUpdateEvent {
  domain::Order order;
  domain::RejectReason reason{domain::RejectReason::None};
  std::optional<Decimal> fill_price;
  int leverage{1};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace perpsim
