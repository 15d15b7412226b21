#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include "exception_code.hpp"

namespace asyncmb {

/**
 * @brief Base of the two errors a Client reports to its callers
 */
class ModbusError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief The connection to the device could not be established
 *
 * Raised by a failed connect attempt, and again to every caller that waits on
 * it afterwards. Carries the target address.
 */
class ConnectionError : public ModbusError {
 public:
  explicit ConnectionError(std::string address)
      : ModbusError("Could not connect to '" + address + "'."),
        address_(std::move(address)) {}

  [[nodiscard]] const std::string &Address() const noexcept { return address_; }

 private:
  std::string address_;
};

/**
 * @brief A request did not complete: it timed out, the link dropped, or the
 * link was never up
 */
class RequestTimeoutError : public ModbusError {
 public:
  using ModbusError::ModbusError;
};

/**
 * @brief Base of the failures raised by a RegisterTransport
 */
class TransportError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/** No response arrived within the transport's timeout. */
class TransportTimeoutError : public TransportError {
 public:
  using TransportError::TransportError;
};

/** The transport has no open link (never connected, or closed). */
class NotConnectedError : public TransportError {
 public:
  using TransportError::TransportError;
};

/** The link failed mid-exchange (socket error, peer hung up). */
class ConnectionLostError : public TransportError {
 public:
  using TransportError::TransportError;
};

/** Malformed or mismatched response, or a request the codec cannot encode. */
class ProtocolError : public TransportError {
 public:
  using TransportError::TransportError;
};

/**
 * @brief The device answered with a Modbus exception response
 */
class ModbusExceptionError : public ProtocolError {
 public:
  explicit ModbusExceptionError(ExceptionCode code)
      : ProtocolError("Modbus exception: " + std::string(ToString(code))),
        code_(code) {}

  [[nodiscard]] ExceptionCode Code() const noexcept { return code_; }

 private:
  ExceptionCode code_;
};

}  // namespace asyncmb
