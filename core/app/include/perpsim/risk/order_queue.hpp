#pragma once

#include "perpsim/domain/decimal.hpp"
#include "perpsim/domain/order.hpp"

#include <optional>
#include <vector>

namespace perpsim {

// -----------------------------------------------------------------------------
// OrderQueue - pending orders in submission order
// -----------------------------------------------------------------------------
//
// @brief  Holds every Open order until the matching engine fills or rejects
//         it, or the client cancels it.
//
// @details
// Orders are kept in the order the tick loop ingested them, which is also
// id order. The matching engine walks the queue front to back and processes
// at most one eligible order per tick, so an older eligible order always
// goes before a newer one.
//
// Eligibility against a tick price:
//   market order      always
//   limit Buy         price <= limit
//   limit Sell        price >= limit
//
// Thread model:
//   Owned by TickLoop, touched only on the tick thread. Cancellations from
//   clients arrive through CommandChannel and are applied by the tick loop.
// -----------------------------------------------------------------------------
class OrderQueue {
 public:
  OrderQueue() = default;

  OrderQueue(const OrderQueue&) = delete;
  OrderQueue& operator=(const OrderQueue&) = delete;

  // -------------------------------------------------------------------------
  // enqueue(id, request)
  // -------------------------------------------------------------------------
  // @brief  Appends a new Open order built from the request.
  //
  // @return Copy of the queued order.
  //
  // @throws std::logic_error if an order with the same id is queued.
  // -------------------------------------------------------------------------
  domain::Order enqueue(domain::OrderId id,
                        const domain::OrderRequest& request);

  // Removes the order with the given id and returns it, or std::nullopt if
  // no such order is queued.
  std::optional<domain::Order> remove(domain::OrderId id);

  // Orders eligible at this price, in queue order.
  std::vector<domain::Order> eligible(const Decimal& price) const;

  static bool isEligible(const domain::Order& order, const Decimal& price);

  const std::vector<domain::Order>& orders() const { return orders_; }
  std::vector<domain::OrderId> ids() const;
  bool empty() const { return orders_.empty(); }
  std::size_t size() const { return orders_.size(); }

 private:
  std::vector<domain::Order> orders_;
};

}  // namespace perpsim
