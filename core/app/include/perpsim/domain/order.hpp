#pragma once

#include "perpsim/domain/decimal.hpp"
#include "perpsim/domain/order_status.hpp"
#include "perpsim/domain/side.hpp"

#include <cstdint>
#include <optional>

namespace perpsim {
namespace domain {

// Unique per process lifetime, assigned when the tick loop ingests a
// submission. 0 is never handed out.
using OrderId = std::uint64_t;

// -----------------------------------------------------------------------------
// OrderRequest
// -----------------------------------------------------------------------------
// Responsibility: What a client asks for before the engine has accepted it:
// direction, size, and an optional limit price. It has no id yet; the tick
// loop assigns one when it moves the request into the OrderQueue.
//
// Validation (CommandChannel::validate) requires quantity > 0 and, when
// present, limit_price > 0. Invalid requests never reach the queue.
// -----------------------------------------------------------------------------
struct OrderRequest {
  Side side{Side::Buy};
  Decimal quantity{0};
  std::optional<Decimal> limit_price;  // nullopt => market order
};

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
// Responsibility: A queued order. Owned by the OrderQueue until it is
// filled, rejected or canceled; copies travel in OrderUpdateEvent and in
// snapshots and are never mutated by their recipients.
// -----------------------------------------------------------------------------
struct Order {
  OrderId id{};
  Side side{Side::Buy};
  Decimal quantity{0};
  std::optional<Decimal> limit_price;
  OrderStatus status{OrderStatus::Open};

  bool isMarket() const { return !limit_price.has_value(); }
};

}  // namespace domain
}  // namespace perpsim
