#pragma once

#include "perpsim/domain/account_snapshot.hpp"
#include "perpsim/domain/decimal.hpp"
#include "perpsim/domain/order.hpp"

#include <nlohmann/json.hpp>

namespace perpsim {

// -----------------------------------------------------------------------------
// JSON codec - the wire shape of snapshots and client requests
// -----------------------------------------------------------------------------
//
// @brief  Single place that maps domain types to and from nlohmann::json.
//         Used by the state file writer, the IPC server, and perpsim_ctl.
//
// @details
// Snapshot document (keys are fixed; readers depend on them):
//
//   {
//     "timestamp_ms": 1700000000000,
//     "time": "12:34:56",
//     "symbol": "BTCUSDT",
//     "price": 101.5,
//     "balance": 900.0,
//     "total_value": 1000.0,
//     "leverage": 1,
//     "position": {"side": "Long", "quantity": 1.0, "entry_price": 100.0,
//                  "leverage": 1, "liquidation_price": 0.0, "pnl": 1.5,
//                  "margin": 1.5},
//     "open_orders": [{"id": 3, "side": "BUY", "quantity": 1.0,
//                      "price": 99.0}]
//   }
//
// "position" is {} while Flat. A market order's "price" is null. Every
// monetary value is rounded half-even to 2 places at this boundary; the
// engine state itself is never rounded.
// -----------------------------------------------------------------------------

constexpr int kReportPlaces = 2;

nlohmann::json toJson(const domain::AccountSnapshot& snapshot);
nlohmann::json toJson(const domain::PositionSnapshot& position);
nlohmann::json toJson(const domain::Order& order);

// -------------------------------------------------------------------------
// decimalFromJson(value)
// -------------------------------------------------------------------------
// @brief  Accepts a JSON number or a numeric string.
//
// @throws std::invalid_argument for any other JSON type or bad text.
// -------------------------------------------------------------------------
Decimal decimalFromJson(const nlohmann::json& value);

// "buy"/"BUY"/"Buy" -> Buy, same for sell.
// @throws std::invalid_argument for anything else.
domain::Side sideFromString(const std::string& text);

// -------------------------------------------------------------------------
// orderRequestFromJson(json)
// -------------------------------------------------------------------------
// @brief  Reads {"side": "buy", "quantity": 0.5, "price": 100.0}.
//         "price" missing or null means a market order.
//
// @throws std::invalid_argument if a field is missing or has the wrong
//         type. Range checks (quantity > 0 ...) are CommandChannel's job.
// -------------------------------------------------------------------------
domain::OrderRequest orderRequestFromJson(const nlohmann::json& json);

}  // namespace perpsim
