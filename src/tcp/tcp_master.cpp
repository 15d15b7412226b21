#include <trantor/utils/Logger.h>
#include <chrono>
#include <cstdint>
#include <span>
#include <string>
#include <thread>
#include <vector>
#include "common/byte_helpers.hpp"
#include "common/errors.hpp"
#include "common/exception_code.hpp"
#include "common/function_code.hpp"
#include "tcp/tcp_frame.hpp"
#include "tcp/tcp_master.hpp"
#include "tcp/tcp_request.hpp"
#include "tcp/tcp_response.hpp"

namespace asyncmb {

static constexpr std::chrono::milliseconds kPollInterval{2};

std::vector<uint16_t> TcpMaster::ReadHoldingRegisters(uint16_t start_address, uint16_t count) {
  TcpRequest request({GetNextTransactionId(), unit_id_, FunctionCode::kReadHR});
  if (!request.SetAddressSpan({start_address, count})) {
    throw ProtocolError("Cannot read " + std::to_string(count) + " registers in one request");
  }

  auto response = SendRequest(request);
  CheckResponse(response, FunctionCode::kReadHR);

  // First byte is byte_count, should be count * 2
  const auto &data = response.GetData();
  if (data.empty() || data[0] != static_cast<uint8_t>(count * 2) ||
      data.size() < static_cast<size_t>(1 + count * 2)) {
    throw ProtocolError("Malformed read holding registers response");
  }

  std::vector<uint16_t> registers;
  registers.reserve(count);
  for (uint16_t i = 0; i < count; ++i) {
    size_t offset = 1 + i * 2;
    registers.push_back(DecodeU16(data[offset], data[offset + 1]));
  }
  return registers;
}

void TcpMaster::WriteMultipleRegisters(uint16_t start_address, std::span<const uint16_t> values) {
  TcpRequest request({GetNextTransactionId(), unit_id_, FunctionCode::kWriteMultRegs});
  if (!request.SetWriteMultipleRegistersData(start_address, values)) {
    throw ProtocolError("Cannot write " + std::to_string(values.size()) + " registers in one request");
  }

  auto response = SendRequest(request);
  CheckResponse(response, FunctionCode::kWriteMultRegs);

  // Echo of address(2) + quantity(2)
  const auto &data = response.GetData();
  if (data.size() < 4 || DecodeU16(data[0], data[1]) != start_address ||
      DecodeU16(data[2], data[3]) != values.size()) {
    throw ProtocolError("Malformed write multiple registers response");
  }
}

TcpResponse TcpMaster::SendRequest(const TcpRequest &request) {
  if (!transport_.IsOpen()) {
    throw NotConnectedError("Transport is not connected");
  }

  std::vector<uint8_t> frame = TcpFrame::EncodeRequest(request);
  LOG_TRACE << "[TcpMaster] TX tid=" << request.GetTransactionId() << " fc="
            << static_cast<int>(request.GetFunctionCode()) << " " << frame.size() << "B";

  int bytes_written = transport_.Write(std::span<const uint8_t>(frame.data(), frame.size()));
  if (bytes_written != static_cast<int>(frame.size()) || !transport_.Flush()) {
    throw ConnectionLostError("Failed to send request");
  }

  const auto deadline = std::chrono::steady_clock::now() + response_timeout_;
  while (true) {
    auto reply = ReadFrame(deadline);
    auto response = TcpFrame::DecodeResponse(reply);
    if (!response.has_value()) {
      throw ProtocolError("Undecodable response frame");
    }
    if (response->GetTransactionId() == request.GetTransactionId()) {
      return *response;
    }
    LOG_DEBUG << "[TcpMaster] Discarding response tid=" << response->GetTransactionId() << ", waiting for tid="
              << request.GetTransactionId();
  }
}

void TcpMaster::CheckResponse(const TcpResponse &response, FunctionCode expected) {
  if (response.GetFunctionCode() != expected) {
    throw ProtocolError("Response function code " + std::to_string(static_cast<int>(response.GetFunctionCode())) +
                        " does not match request");
  }
  if (response.IsException()) {
    throw ModbusExceptionError(response.GetExceptionCode());
  }
}

std::vector<uint8_t> TcpMaster::ReadFrame(std::chrono::steady_clock::time_point deadline) {
  std::vector<uint8_t> frame;
  frame.reserve(TcpFrame::kMaxFrameSize);

  // Read MBAP header first, then whatever its length field announces
  size_t wanted = TcpFrame::kMbapHeaderSize;
  while (frame.size() < wanted) {
    if (std::chrono::steady_clock::now() >= deadline) {
      throw TransportTimeoutError("Timed out waiting for response");
    }

    if (!transport_.HasData()) {
      if (!transport_.IsOpen()) {
        throw ConnectionLostError("Connection closed while waiting for response");
      }
      std::this_thread::sleep_for(kPollInterval);
      continue;
    }

    size_t current_size = frame.size();
    frame.resize(wanted);
    int bytes_read = transport_.Read(std::span<uint8_t>(frame.data() + current_size, wanted - current_size));
    if (bytes_read < 0) {
      throw ConnectionLostError("Connection lost while reading response");
    }
    frame.resize(current_size + static_cast<size_t>(bytes_read));

    if (frame.size() == TcpFrame::kMbapHeaderSize && wanted == TcpFrame::kMbapHeaderSize) {
      auto total = TcpFrame::GetFrameSize(frame);
      if (!total.has_value() || *total <= TcpFrame::kMbapHeaderSize || *total > TcpFrame::kMaxFrameSize) {
        throw ProtocolError("Invalid MBAP length in response");
      }
      wanted = *total;
    }
  }

  return frame;
}

}  // namespace asyncmb
