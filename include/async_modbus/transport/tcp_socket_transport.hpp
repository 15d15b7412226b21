/**
 * @file tcp_socket_transport.hpp
 * @brief POSIX TCP socket transport for the Modbus TCP master
 *
 * Provides ByteTransport over a client socket. The connect is non-blocking
 * and bounded by a deadline so a dead device cannot stall the caller past the
 * configured timeout. Works on Linux and other POSIX-like systems.
 *
 * Usage:
 *   TcpSocketTransport transport;
 *   if (!transport.Connect("192.168.0.10", 502, std::chrono::seconds(1))) {
 *     // transport.LastError() says why
 *   }
 *   TcpMaster master(transport);
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include "byte_reader.hpp"
#include "byte_writer.hpp"

namespace asyncmb {

/**
 * @brief ByteTransport over a connected TCP socket
 *
 * Owns the file descriptor; closes it in the destructor.
 */
class TcpSocketTransport : public ByteTransport {
 public:
  TcpSocketTransport() = default;

  /**
   * @brief Wrap an already-connected socket fd (e.g. from accept(2))
   * @param fd Connected socket file descriptor (ownership taken)
   */
  explicit TcpSocketTransport(int fd)
      : fd_(fd) {}

  ~TcpSocketTransport() override { Close(); }

  TcpSocketTransport(const TcpSocketTransport &) = delete;
  TcpSocketTransport &operator=(const TcpSocketTransport &) = delete;

  TcpSocketTransport(TcpSocketTransport &&other) noexcept
      : fd_(other.fd_),
        last_error_(std::move(other.last_error_)) {
    other.fd_ = -1;
  }

  TcpSocketTransport &operator=(TcpSocketTransport &&other) noexcept {
    if (this != &other) {
      Close();
      fd_ = other.fd_;
      last_error_ = std::move(other.last_error_);
      other.fd_ = -1;
    }
    return *this;
  }

  /**
   * @brief Resolve host and connect, giving up once timeout has elapsed
   * @param host Hostname or dotted IPv4/IPv6 address
   * @param port TCP port (502 for Modbus TCP)
   * @param timeout Upper bound for resolution plus connect
   * @return true when connected; on failure LastError() describes the cause
   */
  [[nodiscard]] bool Connect(const std::string &host, uint16_t port, std::chrono::milliseconds timeout);

  /**
   * @brief Description of the last failed Connect() or I/O call
   */
  [[nodiscard]] const std::string &LastError() const noexcept { return last_error_; }

  // ByteReader interface
  [[nodiscard]] int Read(std::span<uint8_t> buffer) override;
  [[nodiscard]] bool HasData() const override;
  [[nodiscard]] size_t AvailableBytes() const override;

  // ByteWriter interface
  [[nodiscard]] int Write(std::span<const uint8_t> data) override;
  [[nodiscard]] bool Flush() override;

  // ByteTransport interface
  [[nodiscard]] bool IsOpen() const override { return fd_ >= 0; }
  void Close() override;

 private:
  int fd_{-1};
  std::string last_error_;
};

}  // namespace asyncmb
