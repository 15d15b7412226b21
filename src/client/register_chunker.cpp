#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>
#include "client/register_chunker.hpp"
#include "common/errors.hpp"

namespace asyncmb {

static constexpr uint32_t kRegisterSpaceSize = 0x10000;

std::vector<AddressSpan> SplitIntoChunks(AddressSpan span) {
  if (static_cast<uint32_t>(span.start_address) + span.reg_count > kRegisterSpaceSize) {
    throw std::out_of_range("Register span " + std::to_string(span.start_address) + "+" +
                            std::to_string(span.reg_count) + " exceeds the register address space");
  }

  std::vector<AddressSpan> chunks;
  chunks.reserve((span.reg_count + kMaxRegistersPerChunk - 1) / kMaxRegistersPerChunk);
  uint32_t address = span.start_address;
  uint32_t remaining = span.reg_count;
  while (remaining > 0) {
    auto count = static_cast<uint16_t>(remaining > kMaxRegistersPerChunk ? kMaxRegistersPerChunk : remaining);
    chunks.push_back({static_cast<uint16_t>(address), count});
    address += count;
    remaining -= count;
  }
  return chunks;
}

std::vector<uint16_t> RegisterChunker::Read(uint16_t address, uint16_t count) {
  auto chunks = SplitIntoChunks({address, count});
  if (chunks.empty()) {
    serializer_.AwaitConnection();
    return {};
  }

  std::vector<uint16_t> registers;
  registers.reserve(count);
  for (const auto &chunk : chunks) {
    auto values = serializer_.Execute(Request::Read(chunk.start_address, chunk.reg_count));
    if (values.size() != chunk.reg_count) {
      throw ProtocolError("Expected " + std::to_string(chunk.reg_count) + " registers at " +
                          std::to_string(chunk.start_address) + ", got " + std::to_string(values.size()));
    }
    registers.insert(registers.end(), values.begin(), values.end());
  }
  return registers;
}

void RegisterChunker::Write(uint16_t address, std::span<const uint16_t> values) {
  (void)serializer_.Execute(Request::Write(address, values));
}

}  // namespace asyncmb
