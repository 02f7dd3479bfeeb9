#include "perpsim/network/ipc_client.hpp"

namespace perpsim {

IpcClient::IpcClient(std::string endpoint, int timeout_ms)
    : endpoint_(std::move(endpoint)), timeout_ms_(timeout_ms) {
  resetSocket();
}

void IpcClient::resetSocket() {
  socket_ = zmq::socket_t(context_, zmq::socket_type::req);
  socket_.set(zmq::sockopt::rcvtimeo, timeout_ms_);
  socket_.set(zmq::sockopt::sndtimeo, timeout_ms_);
  socket_.set(zmq::sockopt::linger, 0);
  socket_.connect(endpoint_);
}

std::optional<std::string> IpcClient::request(const std::string& command) {
  zmq::message_t msg(command.data(), command.size());
  if (!socket_.send(msg, zmq::send_flags::none).has_value()) {
    resetSocket();
    return std::nullopt;
  }

  zmq::message_t reply;
  if (!socket_.recv(reply, zmq::recv_flags::none).has_value()) {
    resetSocket();
    return std::nullopt;
  }
  return reply.to_string();
}

}  // namespace perpsim
