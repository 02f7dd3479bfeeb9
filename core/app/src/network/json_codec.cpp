#include "perpsim/network/json_codec.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace perpsim {

namespace {

double report(const Decimal& value) {
  return roundForReport(value, kReportPlaces);
}

}  // namespace

nlohmann::json toJson(const domain::PositionSnapshot& position) {
  nlohmann::json j;
  j["side"] = domain::toString(position.side);
  j["quantity"] = toDouble(position.quantity);
  j["entry_price"] = report(position.entry_price);
  j["leverage"] = position.leverage;
  j["liquidation_price"] = report(position.liquidation_price);
  j["pnl"] = report(position.pnl);
  j["margin"] = report(position.margin);
  return j;
}

nlohmann::json toJson(const domain::Order& order) {
  nlohmann::json j;
  j["id"] = order.id;
  j["side"] = domain::toString(order.side);
  j["quantity"] = toDouble(order.quantity);
  if (order.limit_price) {
    j["price"] = toDouble(*order.limit_price);
  } else {
    j["price"] = nullptr;
  }
  return j;
}

nlohmann::json toJson(const domain::AccountSnapshot& snapshot) {
  nlohmann::json j;
  j["timestamp_ms"] = snapshot.timestamp_ms;
  j["time"] = snapshot.time;
  j["symbol"] = snapshot.symbol;
  j["price"] = toDouble(snapshot.price);
  j["balance"] = report(snapshot.balance);
  j["total_value"] = report(snapshot.total_value);
  j["leverage"] = snapshot.leverage;
  j["position"] = snapshot.position ? toJson(*snapshot.position)
                                    : nlohmann::json::object();
  j["open_orders"] = nlohmann::json::array();
  for (const auto& order : snapshot.open_orders) {
    j["open_orders"].push_back(toJson(order));
  }
  return j;
}

Decimal decimalFromJson(const nlohmann::json& value) {
  if (value.is_string()) {
    return parseDecimal(value.get<std::string>());
  }
  if (value.is_number()) {
    return parseDecimal(value.dump());
  }
  throw std::invalid_argument("expected a number, got " +
                              std::string(value.type_name()));
}

domain::Side sideFromString(const std::string& text) {
  std::string upper = text;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  if (upper == "BUY") {
    return domain::Side::Buy;
  }
  if (upper == "SELL") {
    return domain::Side::Sell;
  }
  throw std::invalid_argument("invalid side '" + text + "'");
}

domain::OrderRequest orderRequestFromJson(const nlohmann::json& json) {
  if (!json.is_object()) {
    throw std::invalid_argument("order must be a JSON object");
  }
  if (!json.contains("side") || !json["side"].is_string()) {
    throw std::invalid_argument("order needs a string 'side'");
  }
  if (!json.contains("quantity")) {
    throw std::invalid_argument("order needs a 'quantity'");
  }

  domain::OrderRequest request;
  request.side = sideFromString(json["side"].get<std::string>());
  request.quantity = decimalFromJson(json["quantity"]);
  if (json.contains("price") && !json["price"].is_null()) {
    request.limit_price = decimalFromJson(json["price"]);
  }
  return request;
}

}  // namespace perpsim
