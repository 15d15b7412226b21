#include <trantor/utils/Logger.h>
#include <chrono>
#include <string>
#include "client/tcp_register_transport.hpp"
#include "common/errors.hpp"

namespace asyncmb {

void TcpRegisterTransport::Connect(std::chrono::milliseconds timeout) {
  if (!socket_.Connect(target_.host, target_.port, timeout)) {
    throw TransportError(target_.host + ":" + std::to_string(target_.port) + ": " + socket_.LastError());
  }
  LOG_DEBUG << "[TcpRegisterTransport] Connected to " << target_.host << ":" << target_.port;
}

}  // namespace asyncmb
