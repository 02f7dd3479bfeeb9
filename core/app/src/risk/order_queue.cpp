#include "perpsim/risk/order_queue.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace perpsim {

domain::Order OrderQueue::enqueue(domain::OrderId id,
                                  const domain::OrderRequest& request) {
  auto same_id = [id](const domain::Order& o) { return o.id == id; };
  if (std::any_of(orders_.begin(), orders_.end(), same_id)) {
    throw std::logic_error("duplicate order id " + std::to_string(id));
  }

  domain::Order order;
  order.id = id;
  order.side = request.side;
  order.quantity = request.quantity;
  order.limit_price = request.limit_price;
  order.status = domain::OrderStatus::Open;

  orders_.push_back(order);
  return order;
}

std::optional<domain::Order> OrderQueue::remove(domain::OrderId id) {
  auto it = std::find_if(orders_.begin(), orders_.end(),
                         [id](const domain::Order& o) { return o.id == id; });
  if (it == orders_.end()) {
    return std::nullopt;
  }
  domain::Order removed = *it;
  orders_.erase(it);
  return removed;
}

// -----------------------------------------------------------------------------
// isEligible: market always, limit only when the tick reaches the limit
// -----------------------------------------------------------------------------
bool OrderQueue::isEligible(const domain::Order& order, const Decimal& price) {
  if (order.isMarket()) {
    return true;
  }
  const Decimal& limit = *order.limit_price;
  return order.side == domain::Side::Buy ? price <= limit : price >= limit;
}

std::vector<domain::Order> OrderQueue::eligible(const Decimal& price) const {
  std::vector<domain::Order> result;
  for (const auto& order : orders_) {
    if (isEligible(order, price)) {
      result.push_back(order);
    }
  }
  return result;
}

std::vector<domain::OrderId> OrderQueue::ids() const {
  std::vector<domain::OrderId> result;
  result.reserve(orders_.size());
  for (const auto& order : orders_) {
    result.push_back(order.id);
  }
  return result;
}

}  // namespace perpsim
