#pragma once

#include <chrono>
#include <cstdint>
#include <span>
#include <vector>

namespace asyncmb {

/**
 * @brief The transport a Client coordinates: connect, close and the two
 * register requests
 *
 * Implementations report failures by throwing the TransportError subclasses
 * from common/errors.hpp. TransportTimeoutError, NotConnectedError and
 * ConnectionLostError are turned into RequestTimeoutError by the client; any
 * other exception reaches the caller unchanged.
 *
 * Implementations need not be thread-safe. The client never calls them
 * concurrently.
 */
class RegisterTransport {
 public:
  virtual ~RegisterTransport() = default;

  /**
   * @brief Establish the link, giving up once timeout has elapsed
   * @throws std::exception subclass on failure
   */
  virtual void Connect(std::chrono::milliseconds timeout) = 0;

  /**
   * @brief Release the link; must tolerate a link that never came up
   */
  virtual void Close() = 0;

  /**
   * @brief Read count (at most 125) holding registers starting at address
   */
  [[nodiscard]] virtual std::vector<uint16_t> ReadHoldingRegisters(uint16_t address, uint16_t count) = 0;

  /**
   * @brief Write values to consecutive holding registers starting at address
   */
  virtual void WriteRegisters(uint16_t address, std::span<const uint16_t> values) = 0;
};

}  // namespace asyncmb
