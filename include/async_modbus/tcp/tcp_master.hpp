#pragma once

#include <chrono>
#include <cstdint>
#include <span>
#include <vector>
#include "../common/client_options.hpp"
#include "../transport/byte_reader.hpp"
#include "../transport/byte_writer.hpp"
#include "tcp_frame.hpp"
#include "tcp_request.hpp"
#include "tcp_response.hpp"

namespace asyncmb {

/**
 * @brief Modbus TCP Master/Client implementation
 *
 * Sends one request and blocks until its response arrives. It uses the
 * transport abstraction layer to read/write bytes without knowing the
 * underlying communication mechanism, and performs no locking: callers that
 * share a master must serialize access themselves.
 *
 * Failures are thrown as TransportError subclasses (see common/errors.hpp):
 * NotConnectedError, ConnectionLostError, TransportTimeoutError, ProtocolError
 * and ModbusExceptionError.
 */
class TcpMaster {
 public:
  /**
   * @brief Construct a Modbus TCP Master
   * @param transport Transport layer for byte I/O
   * @param unit_id Unit ID placed in every request
   * @param response_timeout How long to wait for each response
   */
  explicit TcpMaster(ByteTransport &transport, uint8_t unit_id = 1,
                     std::chrono::milliseconds response_timeout = kDefaultTimeout)
      : transport_(transport),
        unit_id_(unit_id),
        response_timeout_(response_timeout) {}

  /**
   * @brief Read holding registers (FC 3)
   * @param start_address Starting register address
   * @param count Number of registers to read (1..125)
   * @return Register values in address order
   */
  [[nodiscard]] std::vector<uint16_t> ReadHoldingRegisters(uint16_t start_address, uint16_t count);

  /**
   * @brief Write multiple holding registers (FC 16)
   * @param start_address Starting register address
   * @param values Register values to write (1..123)
   */
  void WriteMultipleRegisters(uint16_t start_address, std::span<const uint16_t> values);

  /**
   * @brief Send a request and wait for the response with the same transaction ID
   *
   * Frames carrying another transaction ID (late answers to an earlier request
   * that timed out) are discarded.
   */
  [[nodiscard]] TcpResponse SendRequest(const TcpRequest &request);

  /**
   * @brief Get the next transaction ID (auto-increments)
   */
  [[nodiscard]] uint16_t GetNextTransactionId() { return next_transaction_id_++; }

  [[nodiscard]] uint8_t GetUnitId() const noexcept { return unit_id_; }

 private:
  /**
   * @brief Read one complete MBAP frame
   * @param deadline Point in time after which TransportTimeoutError is thrown
   */
  [[nodiscard]] std::vector<uint8_t> ReadFrame(std::chrono::steady_clock::time_point deadline);

  /**
   * @brief Check function code and exception status of a response
   */
  static void CheckResponse(const TcpResponse &response, FunctionCode expected);

  ByteTransport &transport_;
  uint8_t unit_id_;
  std::chrono::milliseconds response_timeout_;
  uint16_t next_transaction_id_{1};
};

}  // namespace asyncmb
