#include <cstdint>
#include <optional>
#include <span>
#include <vector>
#include "common/address_span.hpp"
#include "common/byte_helpers.hpp"
#include "common/function_code.hpp"
#include "tcp/tcp_request.hpp"

namespace asyncmb {

static constexpr uint8_t kAddressSpanStartAddressIndex{0};
static constexpr uint8_t kAddressSpanRegCountIndex{2};
static constexpr uint8_t kAddressSpanMinDataSize{4};
static constexpr uint8_t kWriteByteCountIndex{4};
static constexpr uint8_t kWriteValuesIndex{5};  // address(2) + count(2) + byte_count(1)

std::optional<AddressSpan> TcpRequest::GetAddressSpan() const {
  if (data_.size() < kAddressSpanMinDataSize || (header_.function_code != FunctionCode::kReadHR &&
                                                 header_.function_code != FunctionCode::kWriteMultRegs)) {
    return {};
  }

  AddressSpan address_span;
  address_span.start_address =
      DecodeU16(data_[kAddressSpanStartAddressIndex], data_[kAddressSpanStartAddressIndex + 1]);
  address_span.reg_count = DecodeU16(data_[kAddressSpanRegCountIndex], data_[kAddressSpanRegCountIndex + 1]);
  return address_span;
}

std::optional<std::vector<uint16_t>> TcpRequest::GetWriteValues() const {
  auto span = GetAddressSpan();
  if (header_.function_code != FunctionCode::kWriteMultRegs || !span.has_value() ||
      data_.size() < kWriteValuesIndex) {
    return {};
  }
  const size_t byte_count = data_[kWriteByteCountIndex];
  if (byte_count != static_cast<size_t>(span->reg_count) * 2 || data_.size() < kWriteValuesIndex + byte_count) {
    return {};
  }

  std::vector<uint16_t> values;
  values.reserve(span->reg_count);
  for (size_t i = 0; i < span->reg_count; ++i) {
    size_t offset = kWriteValuesIndex + i * 2;
    values.push_back(DecodeU16(data_[offset], data_[offset + 1]));
  }
  return values;
}

bool TcpRequest::SetAddressSpan(AddressSpan address_span) {
  if (header_.function_code != FunctionCode::kReadHR) {
    return false;
  }
  if (address_span.reg_count == 0 || address_span.reg_count > kMaxReadRegisters) {
    return false;
  }

  data_.clear();
  data_.resize(kAddressSpanMinDataSize);
  EncodeU16(address_span.start_address, &data_[kAddressSpanStartAddressIndex]);
  EncodeU16(address_span.reg_count, &data_[kAddressSpanRegCountIndex]);

  return true;
}

bool TcpRequest::SetWriteMultipleRegistersData(uint16_t start_address, std::span<const uint16_t> values) {
  if (header_.function_code != FunctionCode::kWriteMultRegs) {
    return false;
  }
  if (values.empty() || values.size() > kMaxWriteRegisters) {
    return false;
  }

  const auto count = static_cast<uint16_t>(values.size());
  data_.clear();
  data_.resize(kWriteValuesIndex + count * 2);
  EncodeU16(start_address, &data_[kAddressSpanStartAddressIndex]);
  EncodeU16(count, &data_[kAddressSpanRegCountIndex]);
  data_[kWriteByteCountIndex] = static_cast<uint8_t>(count * 2);
  for (size_t i = 0; i < values.size(); ++i) {
    EncodeU16(values[i], &data_[kWriteValuesIndex + i * 2]);
  }

  return true;
}

}  // namespace asyncmb
