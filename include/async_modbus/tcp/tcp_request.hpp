#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <vector>
#include "../common/address_span.hpp"
#include "../common/function_code.hpp"

namespace asyncmb {

/**
 * @brief Register count limits of the Modbus PDU (253 bytes)
 */
static constexpr uint16_t kMaxReadRegisters = 125;
static constexpr uint16_t kMaxWriteRegisters = 123;

class TcpRequest {
 public:
  struct Header {
    uint16_t transaction_id;
    uint8_t unit_id;
    FunctionCode function_code;
  };

  explicit TcpRequest(Header header)
      : header_(header) {}

  [[nodiscard]] uint16_t GetTransactionId() const { return header_.transaction_id; }
  [[nodiscard]] uint8_t GetUnitId() const { return header_.unit_id; }
  [[nodiscard]] FunctionCode GetFunctionCode() const { return header_.function_code; }
  [[nodiscard]] const std::vector<uint8_t> &GetData() const { return data_; }
  [[nodiscard]] std::optional<AddressSpan> GetAddressSpan() const;

  /**
   * @brief Values carried by a Write Multiple Registers request
   * @return The register values, or empty if the data is not a valid FC 16 body
   */
  [[nodiscard]] std::optional<std::vector<uint16_t>> GetWriteValues() const;

  bool SetAddressSpan(AddressSpan address_span);
  bool SetWriteMultipleRegistersData(uint16_t start_address, std::span<const uint16_t> values);
  void SetRawData(std::span<const uint8_t> data) { data_.assign(data.begin(), data.end()); }

 private:
  Header header_;
  std::vector<uint8_t> data_{};
};

}  // namespace asyncmb
