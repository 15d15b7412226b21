#pragma once

#include <cstdint>

namespace asyncmb {

static constexpr uint8_t kMaxByte = 0xFF;
static constexpr uint8_t kBitsPerByte = 8;

static inline constexpr uint8_t GetLowByte(uint16_t value) {
  return value & kMaxByte;
}

static inline constexpr uint8_t GetHighByte(uint16_t value) {
  return (value >> kBitsPerByte) & kMaxByte;
}

/**
 * @brief Decode a big-endian 16-bit value (Modbus sends the high byte first)
 */
static inline constexpr uint16_t DecodeU16(uint8_t high_byte, uint8_t low_byte) {
  return static_cast<uint16_t>(static_cast<uint16_t>(high_byte) << kBitsPerByte | static_cast<uint16_t>(low_byte));
}

/**
 * @brief Encode a 16-bit value big-endian into out[0..1]
 */
static inline constexpr void EncodeU16(uint16_t value, uint8_t *out) {
  out[0] = GetHighByte(value);
  out[1] = GetLowByte(value);
}

}  // namespace asyncmb
