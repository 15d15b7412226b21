#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>
#include "tcp_request.hpp"
#include "tcp_response.hpp"

namespace asyncmb {

/**
 * @brief TCP frame encoder/decoder
 *
 * Converts between byte frames and Modbus TCP request/response objects.
 * Every frame starts with the MBAP (Modbus Application Protocol) header:
 * - Transaction ID (2 bytes)
 * - Protocol ID (2 bytes, always 0x0000)
 * - Length (2 bytes) - number of bytes following (Unit ID + PDU)
 * - Unit ID (1 byte)
 * - PDU (Protocol Data Unit) - function code + data
 */
class TcpFrame {
 public:
  static constexpr size_t kMbapHeaderSize = 7;  // Transaction ID(2) + Protocol ID(2) + Length(2) + Unit ID(1)
  static constexpr size_t kMaxPduSize = 253;
  static constexpr size_t kMaxFrameSize = kMbapHeaderSize + kMaxPduSize;

  /**
   * @brief Encode a request into a TCP frame with MBAP header
   */
  [[nodiscard]] static std::vector<uint8_t> EncodeRequest(const TcpRequest &request);

  /**
   * @brief Encode a response into a TCP frame with MBAP header
   *
   * Exception responses are encoded with the function code MSB set.
   */
  [[nodiscard]] static std::vector<uint8_t> EncodeResponse(const TcpResponse &response);

  /**
   * @brief Decode a TCP frame into a request
   * @param frame Complete TCP frame including MBAP header
   * @return Parsed request if frame is valid, empty optional otherwise
   */
  [[nodiscard]] static std::optional<TcpRequest> DecodeRequest(std::span<const uint8_t> frame);

  /**
   * @brief Decode a TCP frame into a response
   * @param frame Complete TCP frame including MBAP header
   * @return Parsed response if frame is valid, empty optional otherwise
   */
  [[nodiscard]] static std::optional<TcpResponse> DecodeResponse(std::span<const uint8_t> frame);

  /**
   * @brief Total frame size announced by the MBAP length field
   * @return 6 + length, or empty if fewer than 6 bytes are available
   */
  [[nodiscard]] static std::optional<size_t> GetFrameSize(std::span<const uint8_t> frame);

  /**
   * @brief Check if a frame has all the bytes its MBAP header announces
   */
  [[nodiscard]] static bool IsFrameComplete(std::span<const uint8_t> frame);

 private:
  static constexpr size_t kMinPduSize = 1;                                // function_code (1)
  static constexpr size_t kMinFrameSize = kMbapHeaderSize + kMinPduSize;  // MBAP + function_code
  static constexpr uint16_t kProtocolId = 0x0000;                         // Modbus protocol ID

  [[nodiscard]] static uint16_t ExtractTransactionId(std::span<const uint8_t> frame);
  [[nodiscard]] static uint16_t ExtractProtocolId(std::span<const uint8_t> frame);
  [[nodiscard]] static uint16_t ExtractLength(std::span<const uint8_t> frame);
  [[nodiscard]] static uint8_t ExtractUnitId(std::span<const uint8_t> frame);

  /**
   * @brief Append the MBAP header with a placeholder length
   * @return Offset of the length field, patched by WriteLength()
   */
  static size_t WriteHeader(std::vector<uint8_t> &frame, uint16_t transaction_id, uint8_t unit_id);
  static void WriteLength(std::vector<uint8_t> &frame, size_t length_offset);
};

}  // namespace asyncmb
