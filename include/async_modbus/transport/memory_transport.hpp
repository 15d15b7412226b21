#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>
#include "byte_reader.hpp"
#include "byte_writer.hpp"

namespace asyncmb {

/**
 * @brief Memory-based transport for testing the master without a socket
 *
 * Reads come from a buffer filled with SetReadData()/AppendReadData(); writes
 * are captured and can be inspected with GetWrittenData().
 */
class MemoryTransport : public ByteTransport {
 public:
  MemoryTransport() = default;

  // ByteReader interface
  [[nodiscard]] int Read(std::span<uint8_t> buffer) override {
    if (!open_) {
      return -1;
    }
    if (read_pos_ >= read_buffer_.size()) {
      return 0;  // No data available
    }

    size_t bytes_to_read = std::min(buffer.size(), read_buffer_.size() - read_pos_);
    std::copy_n(read_buffer_.begin() + static_cast<std::ptrdiff_t>(read_pos_), bytes_to_read, buffer.begin());
    read_pos_ += bytes_to_read;
    return static_cast<int>(bytes_to_read);
  }

  [[nodiscard]] bool HasData() const override { return open_ && read_pos_ < read_buffer_.size(); }

  [[nodiscard]] size_t AvailableBytes() const override { return read_buffer_.size() - read_pos_; }

  // ByteWriter interface
  [[nodiscard]] int Write(std::span<const uint8_t> data) override {
    if (!open_) {
      return -1;
    }
    write_buffer_.insert(write_buffer_.end(), data.begin(), data.end());
    return static_cast<int>(data.size());
  }

  [[nodiscard]] bool Flush() override { return open_; }

  // ByteTransport interface
  [[nodiscard]] bool IsOpen() const override { return open_; }

  void Close() override { open_ = false; }

  // MemoryTransport-specific methods
  /**
   * @brief Replace the data that will be read by Read()
   */
  void SetReadData(std::span<const uint8_t> data) {
    read_buffer_.assign(data.begin(), data.end());
    read_pos_ = 0;
  }

  /**
   * @brief Queue more data behind what has not been read yet
   */
  void AppendReadData(std::span<const uint8_t> data) { read_buffer_.insert(read_buffer_.end(), data.begin(), data.end()); }

  [[nodiscard]] std::span<const uint8_t> GetWrittenData() const { return {write_buffer_.data(), write_buffer_.size()}; }

  void ClearWriteBuffer() { write_buffer_.clear(); }

  /**
   * @brief Reopen after Close(), for tests that reuse one transport
   */
  void Reopen() { open_ = true; }

 private:
  std::vector<uint8_t> read_buffer_;
  size_t read_pos_{0};
  std::vector<uint8_t> write_buffer_;
  bool open_{true};
};

}  // namespace asyncmb
