#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include "byte_reader.hpp"

namespace asyncmb {

/**
 * @brief Abstract interface for writing bytes to a transport layer
 */
class ByteWriter {
 public:
  virtual ~ByteWriter() = default;

  /**
   * @brief Write bytes to the transport layer
   * @param data Bytes to write
   * @return Number of bytes actually written (-1 on error)
   */
  [[nodiscard]] virtual int Write(std::span<const uint8_t> data) = 0;

  /**
   * @brief Flush any buffered data
   * @return true on success, false on error
   */
  [[nodiscard]] virtual bool Flush() = 0;
};

/**
 * @brief Combined interface for bidirectional byte I/O over a link that can be
 * open or closed
 */
class ByteTransport : public ByteReader, public ByteWriter {
 public:
  ~ByteTransport() override = default;

  /**
   * @brief Whether the underlying link is usable
   */
  [[nodiscard]] virtual bool IsOpen() const = 0;

  /**
   * @brief Release the underlying link; calling it again is a no-op
   */
  virtual void Close() = 0;
};

}  // namespace asyncmb
