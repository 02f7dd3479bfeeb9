#pragma once

#include "perpsim/gateway/i_price_source.hpp"

#include <atomic>
#include <memory>
#include <string>

namespace perpsim {

// -----------------------------------------------------------------------------
// BinanceTickerStream - live futures mini-ticker over TLS WebSocket
// -----------------------------------------------------------------------------
//
// @brief  Connects to wss://fstream.binance.com/ws, subscribes to
//         "<symbol>@miniTicker" and yields the close price ("c") of every
//         message as one tick.
//
// @details
// Handshake:
//   connect()      TCP, TLS (with SNI), WebSocket upgrade, then
//                  {"method":"SUBSCRIBE","params":["btcusdt@miniTicker"],"id":1}
//                  and one read for the acknowledgement.
//   unsubscribe()  sends the matching UNSUBSCRIBE. Called on shutdown.
//
// Reads block without a timeout. A stalled stream stalls the engine; a
// closed or broken stream throws FeedError, which ends the run.
//
// The Beast/Asio objects live behind a pimpl so that callers do not pull
// Boost.Beast and OpenSSL headers in.
// -----------------------------------------------------------------------------
class BinanceTickerStream final : public IPriceSource {
 public:
  static constexpr const char* kDefaultHost = "fstream.binance.com";
  static constexpr const char* kDefaultPort = "443";
  static constexpr const char* kDefaultPath = "/ws";

  BinanceTickerStream(std::string symbol, int precision = 1,
                      std::string host = kDefaultHost,
                      std::string port = kDefaultPort,
                      std::string path = kDefaultPath);

  // Closes the socket if still connected. A failed close is logged.
  ~BinanceTickerStream() override;

  BinanceTickerStream(const BinanceTickerStream&) = delete;
  BinanceTickerStream& operator=(const BinanceTickerStream&) = delete;

  // -------------------------------------------------------------------------
  // connect()
  // -------------------------------------------------------------------------
  // @brief  Opens the socket and subscribes. Must be called before the
  //         first nextPrice().
  //
  // @throws FeedError on resolve, TCP, TLS or WebSocket failure.
  // -------------------------------------------------------------------------
  void connect();

  std::optional<Decimal> nextPrice() override;

  void stop() override;

  // Sends UNSUBSCRIBE. Safe to call when not connected (no-op).
  void unsubscribe();

  bool connected() const;

  // Stream name sent in SUBSCRIBE: lowercase symbol + "@miniTicker".
  const std::string& streamName() const { return stream_name_; }

  // The SUBSCRIBE / UNSUBSCRIBE request body.
  static std::string controlMessage(const std::string& method,
                                    const std::string& stream_name);

 private:
  struct Impl;

  std::string host_;
  std::string port_;
  std::string path_;
  std::string stream_name_;
  int precision_;

  std::unique_ptr<Impl> impl_;
  std::atomic<bool> stopped_{false};
};

}  // namespace perpsim
