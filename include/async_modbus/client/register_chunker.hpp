#pragma once

#include <cstdint>
#include <span>
#include <vector>
#include "../common/address_span.hpp"
#include "request_serializer.hpp"

namespace asyncmb {

/**
 * @brief Registers per read request
 *
 * A response carries at most 250 data bytes (125 registers); one register of
 * headroom is kept.
 */
static constexpr uint16_t kMaxRegistersPerChunk = 124;

/**
 * @brief Split a register span into chunks of at most kMaxRegistersPerChunk
 *
 * Chunks are contiguous and in address order; only the last one may be
 * shorter. A zero count yields no chunks.
 *
 * @throws std::out_of_range if the span runs past register 0xFFFF
 */
[[nodiscard]] std::vector<AddressSpan> SplitIntoChunks(AddressSpan span);

/**
 * @brief Reads of any length on top of the single-request serializer
 *
 * Writes are sent as one request and are never split; keeping a write within
 * the per-message limit (123 registers) is up to the caller.
 */
class RegisterChunker {
 public:
  explicit RegisterChunker(RequestSerializer &serializer)
      : serializer_(serializer) {}

  /**
   * @brief Read count registers, one chunk request at a time
   * @return Exactly count values, in address order
   */
  [[nodiscard]] std::vector<uint16_t> Read(uint16_t address, uint16_t count);

  void Write(uint16_t address, std::span<const uint16_t> values);

 private:
  RequestSerializer &serializer_;
};

}  // namespace asyncmb
