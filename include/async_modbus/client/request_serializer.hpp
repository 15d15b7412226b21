#pragma once

#include <cstdint>
#include <mutex>
#include <span>
#include <vector>
#include "../common/function_code.hpp"
#include "connection_manager.hpp"
#include "error_translator.hpp"

namespace asyncmb {

/**
 * @brief One protocol exchange: read count registers, or write values
 */
struct Request {
  FunctionCode function_code{FunctionCode::kInvalid};
  uint16_t address{0};
  uint16_t count{0};
  std::vector<uint16_t> values{};

  [[nodiscard]] static Request Read(uint16_t address, uint16_t count) {
    return {FunctionCode::kReadHR, address, count, {}};
  }

  [[nodiscard]] static Request Write(uint16_t address, std::span<const uint16_t> values) {
    return {FunctionCode::kWriteMultRegs, address, static_cast<uint16_t>(values.size()),
            std::vector<uint16_t>(values.begin(), values.end())};
  }
};

/**
 * @brief The only path from callers to the transport
 *
 * Modbus devices ignore a request that arrives while another is outstanding,
 * so every exchange runs under the lock: at most one is in flight at any
 * instant. Requests wait for the connect attempt before taking the lock.
 */
class RequestSerializer {
 public:
  RequestSerializer(ConnectionManager &connection, const ErrorTranslator &translator, std::mutex &lock)
      : connection_(connection),
        translator_(translator),
        lock_(lock) {}

  /**
   * @brief Wait for the connection, then send request alone on the link
   * @return Register values for a read, empty for a write
   * @throws ConnectionError if the connect attempt failed
   * @throws RequestTimeoutError on timeout, lost link or missing link
   */
  [[nodiscard]] std::vector<uint16_t> Execute(const Request &request);

  /**
   * @brief Wait for the connect attempt only
   * @throws ConnectionError if it failed
   */
  void AwaitConnection() const { connection_.WaitConnected(); }

 private:
  ConnectionManager &connection_;
  const ErrorTranslator &translator_;
  std::mutex &lock_;
};

}  // namespace asyncmb
