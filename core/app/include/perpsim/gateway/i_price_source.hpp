#pragma once

#include "perpsim/domain/decimal.hpp"

#include <optional>
#include <stdexcept>
#include <string>

namespace perpsim {

// -----------------------------------------------------------------------------
// FeedError - the price source is gone
// -----------------------------------------------------------------------------
// Thrown by IPriceSource::nextPrice() when the connection is lost or the
// transport fails. There is no reconnect: the tick loop lets it propagate
// and the process exits.
// -----------------------------------------------------------------------------
class FeedError : public std::runtime_error {
 public:
  explicit FeedError(const std::string& what) : std::runtime_error(what) {}
};

// -----------------------------------------------------------------------------
// IPriceSource - blocking stream of decimal ticks
// -----------------------------------------------------------------------------
//
// @brief  The tick loop's only suspension point. Every call blocks until the
//         next message arrives; there is no timeout.
//
// @details
// nextPrice() outcomes:
//   Decimal       a usable tick, already rounded to the feed's precision
//   std::nullopt  a message arrived but carried no usable price (subscribe
//                 ack, malformed JSON, missing field), or stop() was called.
//                 The tick is skipped; the loop asks again.
//   FeedError     fatal, see above.
//
// Implementations:
//   BinanceTickerStream   live <symbol>@miniTicker over TLS WebSocket
//   ZmqPriceFeed          JSON ticks from a local ZeroMQ publisher
//
// Thread model:
//   nextPrice() is called only by the tick thread. stop() may be called from
//   any thread (including a signal handler) and only sets a flag.
// -----------------------------------------------------------------------------
class IPriceSource {
 public:
  virtual ~IPriceSource() = default;

  virtual std::optional<Decimal> nextPrice() = 0;

  virtual void stop() = 0;
};

// -------------------------------------------------------------------------
// parseTickerPrice(payload, precision)
// -------------------------------------------------------------------------
// @brief  Extracts the last price from a ticker JSON message.
//
// @details
// Looks for "c" (Binance miniTicker close price) first, then "price". Either
// may be a JSON string or number. The result is rounded half-even to
// `precision` fractional digits.
//
// @throws std::invalid_argument if the payload is not JSON, has neither
//         field, or the price is not a positive decimal.
// -------------------------------------------------------------------------
Decimal parseTickerPrice(const std::string& payload, int precision);

}  // namespace perpsim
