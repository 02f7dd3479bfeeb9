#pragma once

#include "perpsim/domain/decimal.hpp"
#include "perpsim/domain/order.hpp"
#include "perpsim/domain/side.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace perpsim {
namespace domain {

// Derived view of an open position at one tick's price.
struct PositionSnapshot {
  PositionSide side{PositionSide::Flat};
  Decimal quantity{0};
  Decimal entry_price{0};
  int leverage{1};
  Decimal liquidation_price{0};
  Decimal pnl{0};
  Decimal margin{0};
};

// -----------------------------------------------------------------------------
// AccountSnapshot - full engine state published once per tick
// -----------------------------------------------------------------------------
//
// @brief  Everything an external reader (status client, state file, IPC
//         subscriber) needs: price, balance, total value, leverage, the
//         position and the open orders.
//
// @details
// Values are kept exact; rounding to two places happens when the snapshot
// is serialized. `position` is empty while the account is Flat. `leverage`
// is the leverage the client asked for, which takes effect only once the
// position is Flat; the position's own leverage is inside `position`.
//
// Each snapshot fully replaces the previous one. There is no schema version.
// -----------------------------------------------------------------------------
struct AccountSnapshot {
  std::uint64_t sequence_id{0};
  std::int64_t timestamp_ms{0};
  std::string time;  // HH:MM:SS, local time of timestamp_ms
  std::string symbol;
  Decimal price{0};
  Decimal balance{0};
  Decimal total_value{0};
  int leverage{1};
  std::optional<PositionSnapshot> position;
  std::vector<Order> open_orders;
};

}  // namespace domain
}  // namespace perpsim
