#pragma once

namespace perpsim {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatus - order lifecycle
// -----------------------------------------------------------------------------
//
// @brief  Every state an order can occupy between submission and removal
//         from the queue.
//
// @details
// There is no partially-filled state: an order is either fully processed in
// one tick or left untouched.
//
//   Open ──> Filled
//     │
//     ├────> Rejected   (below minimum notional, insufficient balance)
//     │
//     └────> Canceled   (explicit cancel from the command channel)
//
// Terminal states: Filled, Rejected, Canceled. A terminal order is removed
// from the OrderQueue in the same tick it reaches that state.
// -----------------------------------------------------------------------------
enum class OrderStatus {
  Open,      // Accepted into the queue, waiting for an eligible tick
  Filled,    // Executed against the position - terminal
  Rejected,  // Dropped by the matching engine - terminal
  Canceled,  // Removed on request - terminal
};

// -----------------------------------------------------------------------------
// RejectReason - why the matching engine dropped an order
// -----------------------------------------------------------------------------
enum class RejectReason {
  None,
  BelowMinNotional,     // quantity * price / leverage < min notional
  InsufficientBalance,  // cost exceeds balance (plus close proceeds on flip)
};

inline const char* toString(OrderStatus s) {
  switch (s) {
    case OrderStatus::Open:     return "Open";
    case OrderStatus::Filled:   return "Filled";
    case OrderStatus::Rejected: return "Rejected";
    case OrderStatus::Canceled: return "Canceled";
  }
  return "Unknown";
}

inline const char* toString(RejectReason r) {
  switch (r) {
    case RejectReason::None:                return "none";
    case RejectReason::BelowMinNotional:    return "value below minimum notional";
    case RejectReason::InsufficientBalance: return "not enough balance";
  }
  return "unknown";
}

}  // namespace domain
}  // namespace perpsim
