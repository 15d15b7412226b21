#pragma once

#include <cstdint>
#include <vector>
#include "../common/exception_code.hpp"
#include "../common/function_code.hpp"

namespace asyncmb {

class TcpResponse {
 public:
  TcpResponse(uint16_t transaction_id, uint8_t unit_id, FunctionCode function_code)
      : transaction_id_(transaction_id),
        unit_id_(unit_id),
        function_code_(function_code) {}

  [[nodiscard]] uint16_t GetTransactionId() const noexcept { return transaction_id_; }
  [[nodiscard]] uint8_t GetUnitId() const noexcept { return unit_id_; }

  [[nodiscard]] FunctionCode GetFunctionCode() const noexcept { return function_code_; }
  [[nodiscard]] ExceptionCode GetExceptionCode() const noexcept { return exception_code_; }
  [[nodiscard]] const std::vector<uint8_t> &GetData() const noexcept { return data_; }

  /**
   * @brief Whether this is an exception response (function code MSB set on the wire)
   *
   * Any code counts, including kAcknowledge.
   */
  [[nodiscard]] bool IsException() const noexcept { return is_exception_; }

  /**
   * @brief Turn this into an exception response carrying exception_code
   */
  void SetExceptionCode(ExceptionCode exception_code) noexcept {
    exception_code_ = exception_code;
    is_exception_ = true;
  }

  void SetData(const std::vector<uint8_t> &data) { data_ = data; }
  void EmplaceBack(uint8_t data) { data_.emplace_back(data); }

 private:
  uint16_t transaction_id_{};
  uint8_t unit_id_{};
  FunctionCode function_code_{};
  ExceptionCode exception_code_{ExceptionCode::kInvalidExceptionCode};
  bool is_exception_{false};
  std::vector<uint8_t> data_{};
};

}  // namespace asyncmb
