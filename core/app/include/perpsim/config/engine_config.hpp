#pragma once

#include "perpsim/domain/decimal.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace perpsim {

enum class FeedKind {
  Binance,  // live <symbol>@miniTicker WebSocket
  Zmq,      // local ZeroMQ publisher (replay, offline runs)
};

// -----------------------------------------------------------------------------
// EngineConfig - everything the simulator process is started with
// -----------------------------------------------------------------------------
//
// @brief  Plain value struct. Built from defaults, then an optional JSON
//         file, then command-line flags, in that order; later sources win.
//
// @details
// JSON keys mirror the member names:
//
//   {
//     "symbol": "BTCUSDT",
//     "starting_balance": 1000,
//     "fee_rate": 0.0004,
//     "min_notional": 1,
//     "default_leverage": 1,
//     "price_precision": 1,
//     "feed": "binance",              // or "zmq"
//     "zmq_feed_endpoint": "tcp://127.0.0.1:5555",
//     "ipc_cmd_endpoint": "tcp://127.0.0.1:5556",
//     "ipc_pub_endpoint": "tcp://127.0.0.1:5557",
//     "snapshot_path": "perpsim_state.json",
//     "tick_interval_ms": 1000
//   }
//
// Unknown keys are ignored. An empty IPC endpoint disables the IPC server;
// an empty snapshot_path disables the state file.
//
// fee_rate is always quantized to 4 decimal places (half-even) when it is
// set from the file or the command line.
// -----------------------------------------------------------------------------
struct EngineConfig {
  std::string symbol;
  std::int64_t starting_balance{0};
  Decimal fee_rate{0};
  Decimal min_notional{1};
  int default_leverage{1};
  int price_precision{1};

  FeedKind feed{FeedKind::Binance};
  std::string zmq_feed_endpoint{"tcp://127.0.0.1:5555"};

  std::string ipc_cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string ipc_pub_endpoint{"tcp://127.0.0.1:5557"};

  std::string snapshot_path{"perpsim_state.json"};
  int tick_interval_ms{1000};

  // -------------------------------------------------------------------------
  // validate()
  // -------------------------------------------------------------------------
  // @throws std::invalid_argument unless: symbol non-empty,
  //         starting_balance > 0, 0 <= fee_rate < 1, min_notional >= 0,
  //         default_leverage >= 1, price_precision >= 0,
  //         tick_interval_ms >= 0.
  // -------------------------------------------------------------------------
  void validate() const;
};

constexpr int kFeeRatePlaces = 4;

const char* toString(FeedKind kind);

// "binance" / "zmq", case-insensitive.
// @throws std::invalid_argument otherwise.
FeedKind feedKindFromString(const std::string& text);

// -------------------------------------------------------------------------
// applyJson(config, json)
// -------------------------------------------------------------------------
// @brief  Overwrites the fields present in `json`.
//
// @throws std::invalid_argument if a present field has the wrong type or
//         an unparseable value. Does not call validate().
// -------------------------------------------------------------------------
void applyJson(EngineConfig& config, const nlohmann::json& json);

// -------------------------------------------------------------------------
// loadConfigFile(path, base)
// -------------------------------------------------------------------------
// @brief  Reads the JSON file at `path` and applies it on top of `base`.
//
// @throws std::runtime_error if the file cannot be opened.
//         std::invalid_argument if it is not valid JSON or a field is bad.
// -------------------------------------------------------------------------
EngineConfig loadConfigFile(const std::string& path,
                            EngineConfig base = EngineConfig{});

// -----------------------------------------------------------------------------
// CommandLine - parsed process arguments
// -----------------------------------------------------------------------------
//   -s, --symbol  SYMBOL
//   -b, --balance INTEGER
//   -f, --fee     FRACTION
//   -c, --config  PATH
//   -h, --help
// -----------------------------------------------------------------------------
struct CommandLine {
  std::optional<std::string> symbol;
  std::optional<std::int64_t> balance;
  std::optional<Decimal> fee_rate;
  std::optional<std::string> config_path;
  bool help{false};
};

// @param  args  argv[1..argc), without the program name.
// @throws std::invalid_argument on an unknown flag, a missing value, or a
//         value that does not parse.
CommandLine parseCommandLine(const std::vector<std::string>& args);

// Flags win over whatever the config already holds.
void applyCommandLine(EngineConfig& config, const CommandLine& cli);

// Usage text printed for --help and on argument errors.
std::string usage(const std::string& program);

}  // namespace perpsim
