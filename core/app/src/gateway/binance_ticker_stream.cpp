#include "perpsim/gateway/binance_ticker_stream.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <iostream>

namespace perpsim {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

struct BinanceTickerStream::Impl {
  net::io_context ioc;
  ssl::context ctx{ssl::context::tls_client};
  std::unique_ptr<websocket::stream<beast::ssl_stream<beast::tcp_stream>>> ws;
  beast::flat_buffer buffer;
};

BinanceTickerStream::BinanceTickerStream(std::string symbol, int precision,
                                         std::string host, std::string port,
                                         std::string path)
    : host_(std::move(host)),
      port_(std::move(port)),
      path_(std::move(path)),
      precision_(precision),
      impl_(std::make_unique<Impl>()) {
  std::transform(symbol.begin(), symbol.end(), symbol.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  stream_name_ = symbol + "@miniTicker";
}

BinanceTickerStream::~BinanceTickerStream() {
  if (!connected()) {
    return;
  }
  beast::error_code ec;
  impl_->ws->close(websocket::close_code::normal, ec);
  if (ec) {
    std::cerr << "[BinanceTickerStream] close: " << ec.message() << "\n";
  }
}

std::string BinanceTickerStream::controlMessage(
    const std::string& method, const std::string& stream_name) {
  nlohmann::json msg;
  msg["method"] = method;
  msg["params"] = nlohmann::json::array({stream_name});
  msg["id"] = 1;
  return msg.dump();
}

bool BinanceTickerStream::connected() const {
  return impl_->ws != nullptr && impl_->ws->is_open();
}

// -----------------------------------------------------------------------------
// connect(): TCP -> TLS -> WebSocket -> SUBSCRIBE -> read ack
// -----------------------------------------------------------------------------
void BinanceTickerStream::connect() {
  std::cout << "[BinanceTickerStream] Connecting to " << host_ << path_
            << " ...\n";
  try {
    impl_->ctx.set_default_verify_paths();
    impl_->ctx.set_verify_mode(ssl::verify_peer);

    tcp::resolver resolver{impl_->ioc};
    auto const results = resolver.resolve(host_, port_);

    beast::ssl_stream<beast::tcp_stream> ssl_stream{impl_->ioc, impl_->ctx};

    // SNI, required by the Binance edge.
    if (!::SSL_set_tlsext_host_name(ssl_stream.native_handle(),
                                    host_.c_str())) {
      beast::error_code ec{static_cast<int>(::ERR_get_error()),
                           net::error::get_ssl_category()};
      throw beast::system_error{ec};
    }

    beast::get_lowest_layer(ssl_stream).connect(results);
    ssl_stream.handshake(ssl::stream_base::client);

    impl_->ws = std::make_unique<
        websocket::stream<beast::ssl_stream<beast::tcp_stream>>>(
        std::move(ssl_stream));
    impl_->ws->set_option(
        websocket::stream_base::timeout::suggested(beast::role_type::client));
    impl_->ws->set_option(websocket::stream_base::decorator(
        [](websocket::request_type& req) {
          req.set(http::field::user_agent, std::string("perpsim"));
        }));
    impl_->ws->handshake(host_, path_);

    const std::string sub = controlMessage("SUBSCRIBE", stream_name_);
    impl_->ws->write(net::buffer(sub));

    impl_->buffer.clear();
    impl_->ws->read(impl_->buffer);
  } catch (const beast::system_error& e) {
    impl_->ws.reset();
    throw FeedError(std::string("binance connect failed: ") + e.what());
  }
  std::cout << "[BinanceTickerStream] Subscribed to " << stream_name_ << "\n";
}

// -----------------------------------------------------------------------------
// nextPrice(): one blocking read per tick
// -----------------------------------------------------------------------------
std::optional<Decimal> BinanceTickerStream::nextPrice() {
  if (stopped_.load()) {
    return std::nullopt;
  }
  if (!connected()) {
    throw FeedError("binance stream is not connected");
  }

  impl_->buffer.clear();
  beast::error_code ec;
  impl_->ws->read(impl_->buffer, ec);
  if (ec == websocket::error::closed) {
    throw FeedError("binance stream closed by peer");
  }
  if (ec) {
    throw FeedError("binance read failed: " + ec.message());
  }

  const std::string text = beast::buffers_to_string(impl_->buffer.data());
  try {
    return parseTickerPrice(text, precision_);
  } catch (const std::invalid_argument& e) {
    std::cerr << "[BinanceTickerStream] Skipping message: " << e.what()
              << "\n";
    return std::nullopt;
  }
}

void BinanceTickerStream::stop() { stopped_.store(true); }

void BinanceTickerStream::unsubscribe() {
  if (!connected()) {
    return;
  }
  beast::error_code ec;
  const std::string msg = controlMessage("UNSUBSCRIBE", stream_name_);
  impl_->ws->write(net::buffer(msg), ec);
  if (ec) {
    std::cerr << "[BinanceTickerStream] unsubscribe: " << ec.message()
              << "\n";
    return;
  }
  std::cout << "[BinanceTickerStream] Unsubscribed from " << stream_name_
            << "\n";
}

}  // namespace perpsim
