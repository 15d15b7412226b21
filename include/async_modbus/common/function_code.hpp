#pragma once

#include <cstdint>

namespace asyncmb {

enum class FunctionCode : uint8_t {
  kInvalid = 0,
  kReadHR = 3,
  kWriteMultRegs = 16
};

// An exception response echoes the function code with the MSB set
static constexpr uint8_t kExceptionFunctionCodeMask = 0x80;
static constexpr uint8_t kFunctionCodeMask = 0x7F;

}  // namespace asyncmb
