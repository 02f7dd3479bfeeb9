#include "perpsim/config/engine_config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace perpsim {

namespace {

std::string lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return text;
}

Decimal decimalField(const nlohmann::json& value, const char* key) {
  if (value.is_string()) {
    return parseDecimal(value.get<std::string>());
  }
  if (value.is_number()) {
    return parseDecimal(value.dump());
  }
  throw std::invalid_argument(std::string("config: '") + key +
                              "' must be a number");
}

// Integral JSON numbers only; 1000.5 is rejected, not truncated.
std::int64_t integerField(const nlohmann::json& value, const char* key) {
  if (!value.is_number_integer()) {
    throw std::invalid_argument(std::string("config: '") + key +
                                "' must be an integer");
  }
  if (value.is_number_unsigned() &&
      value.get<std::uint64_t>() >
          static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
    throw std::invalid_argument(std::string("config: '") + key +
                                "' is out of range");
  }
  return value.get<std::int64_t>();
}

int intField(const nlohmann::json& value, const char* key) {
  const std::int64_t wide = integerField(value, key);
  if (wide < std::numeric_limits<int>::min() ||
      wide > std::numeric_limits<int>::max()) {
    throw std::invalid_argument(std::string("config: '") + key +
                                "' is out of range");
  }
  return static_cast<int>(wide);
}

std::string stringField(const nlohmann::json& value, const char* key) {
  if (!value.is_string()) {
    throw std::invalid_argument(std::string("config: '") + key +
                                "' must be a string");
  }
  return value.get<std::string>();
}

std::int64_t parseInteger(const std::string& text, const std::string& flag) {
  std::size_t used = 0;
  std::int64_t value = 0;
  try {
    value = std::stoll(text, &used);
  } catch (const std::logic_error&) {
    throw std::invalid_argument(flag + " expects an integer, got '" + text +
                                "'");
  }
  if (used != text.size()) {
    throw std::invalid_argument(flag + " expects an integer, got '" + text +
                                "'");
  }
  return value;
}

}  // namespace

void EngineConfig::validate() const {
  if (symbol.empty()) {
    throw std::invalid_argument("symbol must not be empty");
  }
  if (starting_balance <= 0) {
    throw std::invalid_argument("starting balance must be positive");
  }
  if (fee_rate < 0 || fee_rate >= 1) {
    throw std::invalid_argument("fee rate must be in [0, 1)");
  }
  if (min_notional < 0) {
    throw std::invalid_argument("min_notional must not be negative");
  }
  if (default_leverage < 1) {
    throw std::invalid_argument("default_leverage must be >= 1");
  }
  if (price_precision < 0) {
    throw std::invalid_argument("price_precision must be >= 0");
  }
  if (tick_interval_ms < 0) {
    throw std::invalid_argument("tick_interval_ms must be >= 0");
  }
}

const char* toString(FeedKind kind) {
  switch (kind) {
    case FeedKind::Binance: return "binance";
    case FeedKind::Zmq:     return "zmq";
  }
  return "unknown";
}

FeedKind feedKindFromString(const std::string& text) {
  const std::string key = lower(text);
  if (key == "binance") {
    return FeedKind::Binance;
  }
  if (key == "zmq") {
    return FeedKind::Zmq;
  }
  throw std::invalid_argument("unknown feed '" + text + "'");
}

// -----------------------------------------------------------------------------
// applyJson: field by field, only what is present
// -----------------------------------------------------------------------------
void applyJson(EngineConfig& config, const nlohmann::json& json) {
  if (!json.is_object()) {
    throw std::invalid_argument("config must be a JSON object");
  }

  if (json.contains("symbol")) {
    config.symbol = stringField(json["symbol"], "symbol");
  }
  if (json.contains("starting_balance")) {
    config.starting_balance =
        integerField(json["starting_balance"], "starting_balance");
  }
  if (json.contains("fee_rate")) {
    config.fee_rate =
        quantize(decimalField(json["fee_rate"], "fee_rate"), kFeeRatePlaces);
  }
  if (json.contains("min_notional")) {
    config.min_notional = decimalField(json["min_notional"], "min_notional");
  }
  if (json.contains("default_leverage")) {
    config.default_leverage =
        intField(json["default_leverage"], "default_leverage");
  }
  if (json.contains("price_precision")) {
    config.price_precision =
        intField(json["price_precision"], "price_precision");
  }
  if (json.contains("feed")) {
    config.feed = feedKindFromString(stringField(json["feed"], "feed"));
  }
  if (json.contains("zmq_feed_endpoint")) {
    config.zmq_feed_endpoint =
        stringField(json["zmq_feed_endpoint"], "zmq_feed_endpoint");
  }
  if (json.contains("ipc_cmd_endpoint")) {
    config.ipc_cmd_endpoint =
        stringField(json["ipc_cmd_endpoint"], "ipc_cmd_endpoint");
  }
  if (json.contains("ipc_pub_endpoint")) {
    config.ipc_pub_endpoint =
        stringField(json["ipc_pub_endpoint"], "ipc_pub_endpoint");
  }
  if (json.contains("snapshot_path")) {
    config.snapshot_path = stringField(json["snapshot_path"], "snapshot_path");
  }
  if (json.contains("tick_interval_ms")) {
    config.tick_interval_ms =
        intField(json["tick_interval_ms"], "tick_interval_ms");
  }
}

EngineConfig loadConfigFile(const std::string& path, EngineConfig base) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("cannot open config file " + path);
  }

  nlohmann::json json;
  try {
    json = nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    throw std::invalid_argument("config file " + path + ": " + e.what());
  }

  applyJson(base, json);
  return base;
}

// -----------------------------------------------------------------------------
// parseCommandLine
// -----------------------------------------------------------------------------
CommandLine parseCommandLine(const std::vector<std::string>& args) {
  CommandLine cli;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& flag = args[i];

    if (flag == "-h" || flag == "--help") {
      cli.help = true;
      continue;
    }

    if (i + 1 >= args.size()) {
      throw std::invalid_argument("missing value for " + flag);
    }
    const std::string& value = args[++i];

    if (flag == "-s" || flag == "--symbol") {
      cli.symbol = value;
    } else if (flag == "-b" || flag == "--balance") {
      cli.balance = parseInteger(value, flag);
    } else if (flag == "-f" || flag == "--fee") {
      cli.fee_rate = parseDecimal(value);
    } else if (flag == "-c" || flag == "--config") {
      cli.config_path = value;
    } else {
      throw std::invalid_argument("unknown option " + flag);
    }
  }
  return cli;
}

void applyCommandLine(EngineConfig& config, const CommandLine& cli) {
  if (cli.symbol) {
    config.symbol = *cli.symbol;
  }
  if (cli.balance) {
    config.starting_balance = *cli.balance;
  }
  if (cli.fee_rate) {
    config.fee_rate = quantize(*cli.fee_rate, kFeeRatePlaces);
  }
}

std::string usage(const std::string& program) {
  std::ostringstream out;
  out << "usage: " << program
      << " -s SYMBOL -b BALANCE -f FEE_RATE [-c CONFIG.json]\n"
      << "  -s, --symbol   futures symbol, e.g. BTCUSDT\n"
      << "  -b, --balance  starting balance in quote asset (integer)\n"
      << "  -f, --fee      fee rate as a fraction, e.g. 0.0004\n"
      << "  -c, --config   JSON config file; flags override it\n";
  return out.str();
}

}  // namespace perpsim
