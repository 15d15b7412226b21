#pragma once

#include <chrono>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>
#include "../common/client_options.hpp"
#include "../tcp/tcp_master.hpp"
#include "../transport/tcp_socket_transport.hpp"
#include "register_transport.hpp"

namespace asyncmb {

/**
 * @brief RegisterTransport speaking Modbus TCP over a POSIX socket
 */
class TcpRegisterTransport : public RegisterTransport {
 public:
  /**
   * @param target Device host and port
   * @param unit_id Unit ID placed in every request
   * @param response_timeout How long each request waits for its response
   */
  TcpRegisterTransport(Target target, uint8_t unit_id, std::chrono::milliseconds response_timeout)
      : target_(std::move(target)),
        master_(socket_, unit_id, response_timeout) {}

  void Connect(std::chrono::milliseconds timeout) override;
  void Close() override { socket_.Close(); }

  [[nodiscard]] std::vector<uint16_t> ReadHoldingRegisters(uint16_t address, uint16_t count) override {
    return master_.ReadHoldingRegisters(address, count);
  }

  void WriteRegisters(uint16_t address, std::span<const uint16_t> values) override {
    master_.WriteMultipleRegisters(address, values);
  }

 private:
  Target target_;
  TcpSocketTransport socket_;
  TcpMaster master_;
};

}  // namespace asyncmb
