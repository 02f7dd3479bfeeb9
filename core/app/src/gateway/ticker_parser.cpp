#include "perpsim/gateway/i_price_source.hpp"

#include <nlohmann/json.hpp>

namespace perpsim {

Decimal parseTickerPrice(const std::string& payload, int precision) {
  nlohmann::json json;
  try {
    json = nlohmann::json::parse(payload);
  } catch (const nlohmann::json::parse_error& e) {
    throw std::invalid_argument(std::string("malformed tick: ") + e.what());
  }

  if (!json.is_object()) {
    throw std::invalid_argument("malformed tick: not an object");
  }

  const nlohmann::json* field = nullptr;
  if (json.contains("c")) {
    field = &json["c"];
  } else if (json.contains("price")) {
    field = &json["price"];
  } else {
    throw std::invalid_argument("tick has no price field");
  }

  Decimal price;
  if (field->is_string()) {
    price = parseDecimal(field->get<std::string>());
  } else if (field->is_number()) {
    // dump() gives the shortest text that round-trips the number.
    price = parseDecimal(field->dump());
  } else {
    throw std::invalid_argument("tick price is neither string nor number");
  }

  price = quantize(price, precision);
  if (price <= 0) {
    throw std::invalid_argument("tick price must be positive");
  }
  return price;
}

}  // namespace perpsim
