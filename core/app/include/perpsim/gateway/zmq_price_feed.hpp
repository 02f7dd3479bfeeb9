#pragma once

#include "perpsim/gateway/i_price_source.hpp"

#include <zmq.hpp>

#include <atomic>
#include <string>

namespace perpsim {

// -----------------------------------------------------------------------------
// ZmqPriceFeed - ticks from a local ZeroMQ publisher
// -----------------------------------------------------------------------------
//
// @brief  SUB socket that turns each JSON message into one tick. Used for
//         replaying recorded prices and for running without internet access.
//
// @details
// Accepted payloads: {"price": 101.5}, {"price": "101.5"} or a Binance
// miniTicker message ({"c": "101.5", ...}). Extra fields are ignored.
//
// recv() uses a short ZMQ_RCVTIMEO so the loop can notice stop(). A timeout
// is not a tick: nextPrice() keeps waiting until a message or stop().
//
// Thread model: nextPrice() on the tick thread only; stop() from anywhere.
// -----------------------------------------------------------------------------
class ZmqPriceFeed final : public IPriceSource {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  endpoint   Publisher to connect to, e.g. "tcp://127.0.0.1:5555".
  // @param  precision  Fractional digits every price is rounded to.
  //
  // @throws zmq::error_t if the endpoint is malformed.
  // -------------------------------------------------------------------------
  explicit ZmqPriceFeed(const std::string& endpoint, int precision = 1);

  ZmqPriceFeed(const ZmqPriceFeed&) = delete;
  ZmqPriceFeed& operator=(const ZmqPriceFeed&) = delete;

  std::optional<Decimal> nextPrice() override;

  void stop() override;

  // Messages received that did not yield a price.
  std::uint64_t skippedCount() const { return skipped_.load(); }

 private:
  static constexpr int kRecvTimeoutMs = 100;

  int precision_;
  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  std::atomic<bool> stopped_{false};
  std::atomic<std::uint64_t> skipped_{0};
};

}  // namespace perpsim
