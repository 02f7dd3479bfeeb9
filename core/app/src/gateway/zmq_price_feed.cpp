#include "perpsim/gateway/zmq_price_feed.hpp"

#include <iostream>

namespace perpsim {

ZmqPriceFeed::ZmqPriceFeed(const std::string& endpoint, int precision)
    : precision_(precision) {
  socket_.set(zmq::sockopt::subscribe, "");
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.connect(endpoint);
  std::cout << "[ZmqPriceFeed] Connected to " << endpoint << "\n";
}

// -----------------------------------------------------------------------------
// nextPrice(): block until a message arrives or stop() is called
// -----------------------------------------------------------------------------
std::optional<Decimal> ZmqPriceFeed::nextPrice() {
  while (!stopped_.load()) {
    zmq::message_t msg;
    zmq::recv_result_t result;
    try {
      result = socket_.recv(msg, zmq::recv_flags::none);
    } catch (const zmq::error_t& e) {
      throw FeedError(std::string("zmq recv failed: ") + e.what());
    }

    if (!result.has_value()) {
      continue;  // rcvtimeo expired
    }

    const std::string payload = msg.to_string();
    try {
      return parseTickerPrice(payload, precision_);
    } catch (const std::invalid_argument& e) {
      ++skipped_;
      std::cerr << "[ZmqPriceFeed] Skipping tick: " << e.what()
                << " payload: " << payload << "\n";
      return std::nullopt;
    }
  }
  return std::nullopt;
}

void ZmqPriceFeed::stop() { stopped_.store(true); }

}  // namespace perpsim
