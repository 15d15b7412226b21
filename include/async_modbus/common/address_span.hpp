#pragma once

#include <cstdint>

namespace asyncmb {

struct AddressSpan {
  uint16_t start_address{0};
  uint16_t reg_count{0};

  friend bool operator==(const AddressSpan &, const AddressSpan &) = default;
};

}  // namespace asyncmb
