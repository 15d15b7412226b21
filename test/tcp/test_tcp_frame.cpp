#include <gtest/gtest.h>
#include <cstdint>
#include <vector>
#include "async_modbus/common/address_span.hpp"
#include "async_modbus/common/exception_code.hpp"
#include "async_modbus/common/function_code.hpp"
#include "async_modbus/tcp/tcp_frame.hpp"
#include "async_modbus/tcp/tcp_request.hpp"
#include "async_modbus/tcp/tcp_response.hpp"

using asyncmb::AddressSpan;
using asyncmb::ExceptionCode;
using asyncmb::FunctionCode;
using asyncmb::TcpFrame;
using asyncmb::TcpRequest;
using asyncmb::TcpResponse;

TEST(TCPFrame, EncodeReadRequestBytes) {
  TcpRequest request{{0x0102, 0x11, FunctionCode::kReadHR}};
  ASSERT_TRUE(request.SetAddressSpan({0x006B, 3}));

  auto frame = TcpFrame::EncodeRequest(request);
  std::vector<uint8_t> expected{
      0x01, 0x02,  // Transaction ID
      0x00, 0x00,  // Protocol ID
      0x00, 0x06,  // Length: unit ID + 5 PDU bytes
      0x11,        // Unit ID
      0x03,        // Function code
      0x00, 0x6B,  // Start address
      0x00, 0x03   // Register count
  };
  EXPECT_EQ(frame, expected);
}

TEST(TCPFrame, EncodeDecodeRequest) {
  static constexpr uint16_t kTransactionId{1234};
  static constexpr uint8_t kUnitId{5};
  static constexpr AddressSpan kAddressSpan{100, 10};

  TcpRequest request{{kTransactionId, kUnitId, FunctionCode::kReadHR}};
  ASSERT_TRUE(request.SetAddressSpan(kAddressSpan));

  auto decoded = TcpFrame::DecodeRequest(TcpFrame::EncodeRequest(request));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->GetTransactionId(), kTransactionId);
  EXPECT_EQ(decoded->GetUnitId(), kUnitId);
  EXPECT_EQ(decoded->GetFunctionCode(), FunctionCode::kReadHR);
  EXPECT_EQ(decoded->GetAddressSpan(), kAddressSpan);
}

TEST(TCPFrame, EncodeDecodeWriteRequest) {
  std::vector<uint16_t> values{0x000A, 0x0102};
  TcpRequest request{{7, 1, FunctionCode::kWriteMultRegs}};
  ASSERT_TRUE(request.SetWriteMultipleRegistersData(0x0001, values));

  auto frame = TcpFrame::EncodeRequest(request);
  std::vector<uint8_t> expected{0x00, 0x07, 0x00, 0x00, 0x00, 0x0B, 0x01, 0x10, 0x00,
                                0x01, 0x00, 0x02, 0x04, 0x00, 0x0A, 0x01, 0x02};
  EXPECT_EQ(frame, expected);

  auto decoded = TcpFrame::DecodeRequest(frame);
  ASSERT_TRUE(decoded.has_value());
  auto decoded_values = decoded->GetWriteValues();
  ASSERT_TRUE(decoded_values.has_value());
  EXPECT_EQ(*decoded_values, values);
}

TEST(TCPFrame, EncodeDecodeResponse) {
  TcpResponse response{5678, 3, FunctionCode::kReadHR};
  response.EmplaceBack(0x02);  // Byte count
  response.EmplaceBack(0x12);  // High byte of first register
  response.EmplaceBack(0x34);  // Low byte of first register

  auto decoded = TcpFrame::DecodeResponse(TcpFrame::EncodeResponse(response));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->GetTransactionId(), 5678);
  EXPECT_EQ(decoded->GetUnitId(), 3);
  EXPECT_EQ(decoded->GetFunctionCode(), FunctionCode::kReadHR);
  EXPECT_FALSE(decoded->IsException());
  EXPECT_EQ(decoded->GetData(), (std::vector<uint8_t>{0x02, 0x12, 0x34}));
}

TEST(TCPFrame, ExceptionResponse) {
  TcpResponse response{9, 1, FunctionCode::kReadHR};
  response.SetExceptionCode(ExceptionCode::kIllegalDataAddress);

  auto frame = TcpFrame::EncodeResponse(response);
  ASSERT_EQ(frame.size(), 9);
  EXPECT_EQ(frame[7], 0x83);
  EXPECT_EQ(frame[8], 0x02);

  auto decoded = TcpFrame::DecodeResponse(frame);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_TRUE(decoded->IsException());
  EXPECT_EQ(decoded->GetFunctionCode(), FunctionCode::kReadHR);
  EXPECT_EQ(decoded->GetExceptionCode(), ExceptionCode::kIllegalDataAddress);
}

TEST(TCPFrame, AcknowledgeExceptionIsStillAnException) {
  // FC 3 exception response with code 0x05 (acknowledge)
  std::vector<uint8_t> frame{0x00, 0x04, 0x00, 0x00, 0x00, 0x03, 0x01, 0x83, 0x05};
  auto decoded = TcpFrame::DecodeResponse(frame);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_TRUE(decoded->IsException());
  EXPECT_EQ(decoded->GetExceptionCode(), ExceptionCode::kAcknowledge);
  EXPECT_EQ(TcpFrame::EncodeResponse(*decoded), frame);

  // Code 0x00 is not a valid exception code but the MSB still marks an exception
  frame[8] = 0x00;
  decoded = TcpFrame::DecodeResponse(frame);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_TRUE(decoded->IsException());
}

TEST(TCPFrame, FrameSizeAndCompleteness) {
  std::vector<uint8_t> frame{0x00, 0x01, 0x00, 0x00, 0x00, 0x05, 0x01, 0x03, 0x02, 0x00};
  EXPECT_FALSE(TcpFrame::GetFrameSize(std::vector<uint8_t>{0x00, 0x01, 0x00}).has_value());
  ASSERT_TRUE(TcpFrame::GetFrameSize(frame).has_value());
  EXPECT_EQ(*TcpFrame::GetFrameSize(frame), 11);
  EXPECT_FALSE(TcpFrame::IsFrameComplete(frame));

  frame.push_back(0x2A);
  EXPECT_TRUE(TcpFrame::IsFrameComplete(frame));
}

TEST(TCPFrame, RejectsInvalidFrames) {
  // Too short
  EXPECT_FALSE(TcpFrame::DecodeResponse(std::vector<uint8_t>{0x00, 0x01, 0x00, 0x00}).has_value());
  // Wrong protocol ID
  EXPECT_FALSE(
      TcpFrame::DecodeResponse(std::vector<uint8_t>{0x00, 0x01, 0x00, 0x01, 0x00, 0x02, 0x01, 0x03}).has_value());
  // Length announces more bytes than present
  EXPECT_FALSE(
      TcpFrame::DecodeResponse(std::vector<uint8_t>{0x00, 0x01, 0x00, 0x00, 0x00, 0x09, 0x01, 0x03}).has_value());
  // Exception response without exception code
  EXPECT_FALSE(
      TcpFrame::DecodeResponse(std::vector<uint8_t>{0x00, 0x01, 0x00, 0x00, 0x00, 0x02, 0x01, 0x83}).has_value());
  EXPECT_FALSE(
      TcpFrame::DecodeRequest(std::vector<uint8_t>{0x00, 0x01, 0x00, 0x00, 0x00, 0x01, 0x01, 0x03}).has_value());
}

TEST(TCPRequest, AddressSpanLimits) {
  TcpRequest request{{1, 1, FunctionCode::kReadHR}};
  EXPECT_FALSE(request.SetAddressSpan({0, 0}));
  EXPECT_TRUE(request.SetAddressSpan({0, asyncmb::kMaxReadRegisters}));
  EXPECT_FALSE(request.SetAddressSpan({0, asyncmb::kMaxReadRegisters + 1}));

  TcpRequest write{{1, 1, FunctionCode::kWriteMultRegs}};
  EXPECT_FALSE(write.SetAddressSpan({0, 1}));
  std::vector<uint16_t> too_many(asyncmb::kMaxWriteRegisters + 1, 0);
  EXPECT_FALSE(write.SetWriteMultipleRegistersData(0, too_many));
  EXPECT_FALSE(write.SetWriteMultipleRegistersData(0, {}));
  EXPECT_FALSE(request.SetWriteMultipleRegistersData(0, std::vector<uint16_t>{1}));
}
