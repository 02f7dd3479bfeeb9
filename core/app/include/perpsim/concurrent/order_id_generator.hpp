#pragma once

#include "perpsim/domain/order.hpp"

#include <atomic>

namespace perpsim {

// -----------------------------------------------------------------------------
// OrderIdGenerator - monotonically increasing order id source
// -----------------------------------------------------------------------------
//
// @brief  Hands out 1, 2, 3, ... for the lifetime of the process. Id 0 is
//         reserved as "unset".
//
// @details
// Ids are assigned when the tick loop ingests a submission from the
// CommandChannel, not when the client submits it: a submission that is
// overwritten before the next tick never consumes an id.
//
// Only the tick thread calls next_id() today. The counter is atomic so the
// generator stays correct if ids are ever assigned from the IPC thread.
//
// Ownership:
//   Value member of TickLoop.
// -----------------------------------------------------------------------------
class OrderIdGenerator {
 public:
  OrderIdGenerator() = default;

  // Copying would create two sources handing out the same ids.
  OrderIdGenerator(const OrderIdGenerator&) = delete;
  OrderIdGenerator& operator=(const OrderIdGenerator&) = delete;
  OrderIdGenerator(OrderIdGenerator&&) = delete;
  OrderIdGenerator& operator=(OrderIdGenerator&&) = delete;

  domain::OrderId next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

  // The id the next call to next_id() will return.
  domain::OrderId peek() const {
    return next_id_.load(std::memory_order_relaxed);
  }

 private:
  std::atomic<domain::OrderId> next_id_{1};
};

}  // namespace perpsim
