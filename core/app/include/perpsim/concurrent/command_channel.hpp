#pragma once

#include "perpsim/domain/order.hpp"

#include <mutex>
#include <optional>
#include <vector>

namespace perpsim {

// -----------------------------------------------------------------------------
// CommandChannel - single-slot hand-off from clients to the tick loop
// -----------------------------------------------------------------------------
//
// @brief  The only way the outside world changes the engine's desired
//         state: one pending order slot, one pending leverage slot, and a
//         list of cancellation requests.
//
// @details
// Writers (the IPC thread handling client commands) and the reader (the
// tick thread) meet here under a mutex. The tick thread drains the channel
// exactly once per tick, between fetching the price and running the
// liquidation check, so engine state is never mutated mid-tick.
//
// Overwrite-on-conflict:
//   A new order submitted before the previous one was consumed replaces
//   it. The same holds for leverage. Clients that need several orders must
//   pace their submissions to the tick rate.
//
// Cancellation:
//   cancelOrder(id) answers synchronously. It succeeds only for ids that
//   were open in the last snapshot the tick loop reported via
//   publishOpenOrders() and that have not already been asked to cancel.
//   The order leaves the queue on the next tick, before matching runs.
//
// Validation happens on the writer side: a malformed request throws
// std::invalid_argument back to the submitter and the slot is untouched.
//
// Thread model:
//   Every public method is safe to call from any thread.
// -----------------------------------------------------------------------------
class CommandChannel {
 public:
  CommandChannel() = default;

  CommandChannel(const CommandChannel&) = delete;
  CommandChannel& operator=(const CommandChannel&) = delete;

  // --- client side ----------------------------------------------------------

  // @throws std::invalid_argument if validate(request) fails.
  void submitOrder(domain::OrderRequest request);

  // @throws std::invalid_argument if leverage < 1.
  void requestLeverage(int leverage);

  bool cancelOrder(domain::OrderId id);

  // --- engine side (tick thread) --------------------------------------------

  // Take-and-clear: each call empties the slot it reads.
  std::optional<domain::OrderRequest> getPendingOrder();
  std::optional<int> getLeverageRequest();
  std::vector<domain::OrderId> takeCancelRequests();

  // Records which ids are cancellable. Called once per tick after matching.
  void publishOpenOrders(const std::vector<domain::OrderId>& ids);

  // -------------------------------------------------------------------------
  // validate(request)
  // -------------------------------------------------------------------------
  // @brief  Rejects non-positive quantity and non-positive limit price.
  //
  // @throws std::invalid_argument describing the first violation.
  // -------------------------------------------------------------------------
  static void validate(const domain::OrderRequest& request);

 private:
  mutable std::mutex mutex_;
  std::optional<domain::OrderRequest> pending_order_;
  std::optional<int> pending_leverage_;
  std::vector<domain::OrderId> open_order_ids_;
  std::vector<domain::OrderId> cancel_requests_;
};

}  // namespace perpsim
