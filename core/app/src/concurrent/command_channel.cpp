#include "perpsim/concurrent/command_channel.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace perpsim {

// -----------------------------------------------------------------------------
// validate
// -----------------------------------------------------------------------------
void CommandChannel::validate(const domain::OrderRequest& request) {
  if (request.quantity <= 0) {
    throw std::invalid_argument("order quantity must be positive");
  }
  if (request.limit_price.has_value() && *request.limit_price <= 0) {
    throw std::invalid_argument("order limit price must be positive");
  }
}

// -----------------------------------------------------------------------------
// submitOrder: overwrite the pending slot
// -----------------------------------------------------------------------------
void CommandChannel::submitOrder(domain::OrderRequest request) {
  validate(request);
  std::lock_guard lock(mutex_);
  pending_order_ = std::move(request);
}

// -----------------------------------------------------------------------------
// requestLeverage: overwrite the pending slot
// -----------------------------------------------------------------------------
void CommandChannel::requestLeverage(int leverage) {
  if (leverage < 1) {
    throw std::invalid_argument("leverage must be >= 1");
  }
  std::lock_guard lock(mutex_);
  pending_leverage_ = leverage;
}

// -----------------------------------------------------------------------------
// cancelOrder: accept only ids that are currently open
// -----------------------------------------------------------------------------
bool CommandChannel::cancelOrder(domain::OrderId id) {
  std::lock_guard lock(mutex_);

  auto it = std::find(open_order_ids_.begin(), open_order_ids_.end(), id);
  if (it == open_order_ids_.end()) {
    return false;
  }

  // Forget the id right away so a second cancel for it fails even before
  // the next tick refreshes the open set.
  open_order_ids_.erase(it);
  cancel_requests_.push_back(id);
  return true;
}

std::optional<domain::OrderRequest> CommandChannel::getPendingOrder() {
  std::lock_guard lock(mutex_);
  std::optional<domain::OrderRequest> out = std::move(pending_order_);
  pending_order_.reset();
  return out;
}

std::optional<int> CommandChannel::getLeverageRequest() {
  std::lock_guard lock(mutex_);
  std::optional<int> out = pending_leverage_;
  pending_leverage_.reset();
  return out;
}

std::vector<domain::OrderId> CommandChannel::takeCancelRequests() {
  std::lock_guard lock(mutex_);
  std::vector<domain::OrderId> out;
  out.swap(cancel_requests_);
  return out;
}

// -----------------------------------------------------------------------------
// publishOpenOrders: refresh the set of cancellable ids
// -----------------------------------------------------------------------------
void CommandChannel::publishOpenOrders(
    const std::vector<domain::OrderId>& ids) {
  std::lock_guard lock(mutex_);
  open_order_ids_.clear();
  for (domain::OrderId id : ids) {
    // An id already queued for cancellation stays non-cancellable.
    if (std::find(cancel_requests_.begin(), cancel_requests_.end(), id) ==
        cancel_requests_.end()) {
      open_order_ids_.push_back(id);
    }
  }
}

}  // namespace perpsim
