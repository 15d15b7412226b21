#include <cstdint>
#include <optional>
#include <span>
#include <vector>
#include "common/byte_helpers.hpp"
#include "common/exception_code.hpp"
#include "common/function_code.hpp"
#include "tcp/tcp_frame.hpp"
#include "tcp/tcp_request.hpp"
#include "tcp/tcp_response.hpp"

namespace asyncmb {

uint16_t TcpFrame::ExtractTransactionId(std::span<const uint8_t> frame) {
  if (frame.size() < 2) {
    return 0;
  }
  return DecodeU16(frame[0], frame[1]);
}

uint16_t TcpFrame::ExtractProtocolId(std::span<const uint8_t> frame) {
  if (frame.size() < 4) {
    return 0;
  }
  return DecodeU16(frame[2], frame[3]);
}

uint16_t TcpFrame::ExtractLength(std::span<const uint8_t> frame) {
  if (frame.size() < 6) {
    return 0;
  }
  // Length is at offset 4-5 (big-endian)
  return DecodeU16(frame[4], frame[5]);
}

uint8_t TcpFrame::ExtractUnitId(std::span<const uint8_t> frame) {
  if (frame.size() < kMbapHeaderSize) {
    return 0;
  }
  return frame[6];
}

size_t TcpFrame::WriteHeader(std::vector<uint8_t> &frame, uint16_t transaction_id, uint8_t unit_id) {
  frame.push_back(GetHighByte(transaction_id));
  frame.push_back(GetLowByte(transaction_id));
  frame.push_back(GetHighByte(kProtocolId));
  frame.push_back(GetLowByte(kProtocolId));
  size_t length_offset = frame.size();
  frame.resize(frame.size() + 2);  // Reserve space for length
  frame.push_back(unit_id);
  return length_offset;
}

void TcpFrame::WriteLength(std::vector<uint8_t> &frame, size_t length_offset) {
  // Length counts everything after the length field: Unit ID + PDU
  auto length = static_cast<uint16_t>(frame.size() - length_offset - 2);
  EncodeU16(length, &frame[length_offset]);
}

std::vector<uint8_t> TcpFrame::EncodeRequest(const TcpRequest &request) {
  std::vector<uint8_t> frame;
  frame.reserve(kMbapHeaderSize + 1 + request.GetData().size());

  size_t length_offset = WriteHeader(frame, request.GetTransactionId(), request.GetUnitId());
  frame.push_back(static_cast<uint8_t>(request.GetFunctionCode()));
  const auto &data = request.GetData();
  frame.insert(frame.end(), data.begin(), data.end());
  WriteLength(frame, length_offset);

  return frame;
}

std::vector<uint8_t> TcpFrame::EncodeResponse(const TcpResponse &response) {
  std::vector<uint8_t> frame;

  size_t length_offset = WriteHeader(frame, response.GetTransactionId(), response.GetUnitId());
  if (response.IsException()) {
    frame.push_back(static_cast<uint8_t>(response.GetFunctionCode()) | kExceptionFunctionCodeMask);
    frame.push_back(static_cast<uint8_t>(response.GetExceptionCode()));
  } else {
    frame.push_back(static_cast<uint8_t>(response.GetFunctionCode()));
    const auto &data = response.GetData();
    frame.insert(frame.end(), data.begin(), data.end());
  }
  WriteLength(frame, length_offset);

  return frame;
}

std::optional<size_t> TcpFrame::GetFrameSize(std::span<const uint8_t> frame) {
  if (frame.size() < 6) {
    return {};
  }
  // MBAP header = Transaction ID(2) + Protocol ID(2) + Length(2) + Unit ID(1) = 7 bytes
  // Length field value = Unit ID(1) + PDU size
  // Total frame size = 7 + (length - 1) = 6 + length
  return static_cast<size_t>(6) + ExtractLength(frame);
}

bool TcpFrame::IsFrameComplete(std::span<const uint8_t> frame) {
  if (frame.size() < kMbapHeaderSize) {
    return false;
  }
  auto size = GetFrameSize(frame);
  return size.has_value() && frame.size() >= *size;
}

std::optional<TcpRequest> TcpFrame::DecodeRequest(std::span<const uint8_t> frame) {
  if (frame.size() < kMinFrameSize || ExtractProtocolId(frame) != kProtocolId) {
    return {};
  }

  uint16_t length = ExtractLength(frame);
  if (length < 2 || frame.size() < static_cast<size_t>(6 + length)) {
    return {};
  }

  TcpRequest request({ExtractTransactionId(frame), ExtractUnitId(frame),
                      static_cast<FunctionCode>(frame[kMbapHeaderSize])});
  // PDU data follows the function code; Unit ID and function code take 2 of the length bytes
  request.SetRawData(frame.subspan(kMbapHeaderSize + 1, length - 2));
  return request;
}

std::optional<TcpResponse> TcpFrame::DecodeResponse(std::span<const uint8_t> frame) {
  if (frame.size() < kMinFrameSize || ExtractProtocolId(frame) != kProtocolId) {
    return {};
  }

  uint16_t length = ExtractLength(frame);
  if (length < 2 || frame.size() < static_cast<size_t>(6 + length)) {
    return {};
  }

  uint8_t function_code_byte = frame[kMbapHeaderSize];
  bool is_exception = (function_code_byte & kExceptionFunctionCodeMask) != 0;
  auto function_code = static_cast<FunctionCode>(function_code_byte & kFunctionCodeMask);

  TcpResponse response(ExtractTransactionId(frame), ExtractUnitId(frame), function_code);
  if (is_exception) {
    // Unit ID(1) + Function Code(1) + Exception Code(1)
    if (length < 3) {
      return {};
    }
    response.SetExceptionCode(static_cast<ExceptionCode>(frame[kMbapHeaderSize + 1]));
  } else {
    auto data = frame.subspan(kMbapHeaderSize + 1, length - 2);
    response.SetData(std::vector<uint8_t>(data.begin(), data.end()));
  }

  return response;
}

}  // namespace asyncmb
