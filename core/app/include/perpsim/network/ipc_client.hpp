#pragma once

#include <zmq.hpp>

#include <optional>
#include <string>

namespace perpsim {

// -----------------------------------------------------------------------------
// IpcClient - request side of the IpcServer command socket
// -----------------------------------------------------------------------------
//
// @brief  ZeroMQ REQ socket that sends one command and waits for the reply.
//
// @details
// A REQ socket that timed out is stuck in "awaiting reply" state; the next
// send() would fail with EFSM. request() therefore recreates the socket
// after a timeout, so the client stays usable.
//
// Thread model: not thread-safe; one client per thread.
// -----------------------------------------------------------------------------
class IpcClient {
 public:
  explicit IpcClient(std::string endpoint = "tcp://127.0.0.1:5556",
                     int timeout_ms = 2000);

  IpcClient(const IpcClient&) = delete;
  IpcClient& operator=(const IpcClient&) = delete;

  // -------------------------------------------------------------------------
  // request(command)
  // -------------------------------------------------------------------------
  // @return The reply text, or std::nullopt if no reply arrived within
  //         timeout_ms (engine not running).
  //
  // @throws zmq::error_t on socket failures other than a timeout.
  // -------------------------------------------------------------------------
  std::optional<std::string> request(const std::string& command);

  const std::string& endpoint() const { return endpoint_; }

 private:
  void resetSocket();

  std::string endpoint_;
  int timeout_ms_;
  zmq::context_t context_{1};
  zmq::socket_t socket_;
};

}  // namespace perpsim
