// -----------------------------------------------------------------------------
// perpsim_ctl - command-line status client for a running perpsim.
//
//   perpsim_ctl [-e tcp://127.0.0.1:5556] <command> [args]
//
//   status | ping | price | account | position | orders
//   buy  QTY [PRICE]          market order, or limit at PRICE
//   sell QTY [PRICE]
//   leverage N
//   cancel ID
//   close [PRICE]
//   watch [tcp://127.0.0.1:5557]   print telemetry until Ctrl-C
//
// Every command is one JSON request on the engine's REP socket; the reply is
// printed as-is (pretty-printed).
// -----------------------------------------------------------------------------

#include "perpsim/network/ipc_client.hpp"

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void printUsage() {
  std::cerr << "usage: perpsim_ctl [-e ENDPOINT] <command> [args]\n"
               "  status | ping | price | account | position | orders\n"
               "  buy QTY [PRICE] | sell QTY [PRICE]\n"
               "  leverage N | cancel ID | close [PRICE]\n"
               "  watch [PUB_ENDPOINT]\n";
}

// Quantities and prices go over the wire as strings so that no digits are
// lost to a double round-trip.
nlohmann::json buildRequest(const std::vector<std::string>& args) {
  const std::string& cmd = args.at(0);
  nlohmann::json request;

  if (cmd == "status" || cmd == "ping") {
    request["command"] = cmd;
  } else if (cmd == "price" || cmd == "account" || cmd == "position" ||
             cmd == "orders") {
    request["command"] = "get_" + cmd;
  } else if (cmd == "buy" || cmd == "sell") {
    if (args.size() < 2) {
      throw std::invalid_argument(cmd + " needs a quantity");
    }
    request["command"] = "submit_order";
    request["side"] = cmd;
    request["quantity"] = args[1];
    if (args.size() > 2) {
      request["price"] = args[2];
    }
  } else if (cmd == "leverage") {
    if (args.size() < 2) {
      throw std::invalid_argument("leverage needs a value");
    }
    request["command"] = "set_leverage";
    request["leverage"] = std::stoi(args[1]);
  } else if (cmd == "cancel") {
    if (args.size() < 2) {
      throw std::invalid_argument("cancel needs an order id");
    }
    request["command"] = "cancel_order";
    request["id"] = std::stoull(args[1]);
  } else if (cmd == "close") {
    request["command"] = "close_position";
    if (args.size() > 1) {
      request["price"] = args[1];
    }
  } else {
    throw std::invalid_argument("unknown command '" + cmd + "'");
  }
  return request;
}

int watch(const std::string& endpoint) {
  zmq::context_t context{1};
  zmq::socket_t socket{context, zmq::socket_type::sub};
  socket.set(zmq::sockopt::subscribe, "");
  socket.connect(endpoint);
  std::cout << "[perpsim_ctl] watching " << endpoint << "\n";

  for (;;) {
    zmq::message_t msg;
    if (!socket.recv(msg, zmq::recv_flags::none).has_value()) {
      continue;
    }
    std::cout << msg.to_string() << "\n";
  }
}

}  // namespace

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  std::string endpoint = "tcp://127.0.0.1:5556";

  if (args.size() >= 2 && (args[0] == "-e" || args[0] == "--endpoint")) {
    endpoint = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }
  if (args.empty()) {
    printUsage();
    return 2;
  }

  if (args[0] == "watch") {
    return watch(args.size() > 1 ? args[1] : "tcp://127.0.0.1:5557");
  }

  nlohmann::json request;
  try {
    request = buildRequest(args);
  } catch (const std::exception& e) {
    std::cerr << "[perpsim_ctl] " << e.what() << "\n";
    printUsage();
    return 2;
  }

  perpsim::IpcClient client(endpoint);
  const auto reply = client.request(request.dump());
  if (!reply) {
    std::cerr << "[perpsim_ctl] no reply from " << endpoint
              << " (is perpsim running?)\n";
    return 1;
  }

  try {
    const auto json = nlohmann::json::parse(*reply);
    std::cout << json.dump(2) << "\n";
    return json.value("status", "") == "ok" ? 0 : 1;
  } catch (const nlohmann::json::parse_error&) {
    std::cout << *reply << "\n";
    return 0;
  }
}
