#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <vector>
#include "../common/client_options.hpp"
#include "connection_manager.hpp"
#include "error_translator.hpp"
#include "register_chunker.hpp"
#include "register_transport.hpp"
#include "request_serializer.hpp"

namespace asyncmb {

/**
 * @brief Modbus TCP client for one device
 *
 * Construction starts the connect attempt in the background and returns at
 * once; the first request waits for it. Calls from any number of threads are
 * serialized so only one request is on the wire at a time. Reads longer than
 * the per-message limit are split into several requests.
 *
 * Errors:
 * - ConnectionError: the connect attempt failed. Every later request gets it
 *   again; there is no reconnect.
 * - RequestTimeoutError: a request timed out, the link dropped, or the link
 *   is not up.
 * - Anything else from the transport (ProtocolError, ModbusExceptionError)
 *   is passed through.
 *
 * The destructor closes the connection, so a Client scoped to a block is
 * closed exactly once however the block is left. Use one Client per device:
 * two clients talking to the same device are not serialized against each
 * other.
 *
 * Example:
 * @code
 * asyncmb::Client client("192.168.0.10");
 * auto values = client.ReadRegisters(0, 300);
 * client.WriteRegisters(10, std::vector<uint16_t>{1, 2, 3});
 * @endcode
 */
class Client {
 public:
  /**
   * @brief Connect to address ("host" or "host:port", port 502 by default)
   * @throws std::invalid_argument if address cannot be parsed
   */
  explicit Client(std::string address, std::chrono::milliseconds timeout = kDefaultTimeout);

  explicit Client(ClientOptions options);

  /**
   * @brief Connect through a caller-supplied transport
   */
  Client(ClientOptions options, std::unique_ptr<RegisterTransport> transport);

  ~Client();

  Client(const Client &) = delete;
  Client &operator=(const Client &) = delete;

  /**
   * @brief Read count holding registers starting at address
   */
  [[nodiscard]] std::vector<uint16_t> ReadRegisters(uint16_t address, uint16_t count);

  /**
   * @brief Write values to holding registers starting at address, in one request
   */
  void WriteRegisters(uint16_t address, std::span<const uint16_t> values);

  /**
   * @brief Close the connection; further calls are no-ops
   */
  void Close();

  [[nodiscard]] const std::string &Address() const noexcept { return options_.address; }
  [[nodiscard]] std::chrono::milliseconds Timeout() const noexcept { return options_.timeout; }
  [[nodiscard]] ConnectionState State() const noexcept { return connection_.State(); }

 private:
  ClientOptions options_;
  ErrorTranslator translator_;
  std::mutex lock_;
  ConnectionManager connection_;
  RequestSerializer serializer_;
  RegisterChunker chunker_;
};

}  // namespace asyncmb
