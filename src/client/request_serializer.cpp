#include <trantor/utils/Logger.h>
#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include "client/request_serializer.hpp"
#include "common/errors.hpp"

namespace asyncmb {

std::vector<uint16_t> RequestSerializer::Execute(const Request &request) {
  connection_.WaitConnected();

  std::lock_guard<std::mutex> guard(lock_);
  return translator_.Run([&]() -> std::vector<uint16_t> {
    RegisterTransport *transport = connection_.Transport();
    if (transport == nullptr) {
      throw NotConnectedError("No transport handle");
    }

    switch (request.function_code) {
      case FunctionCode::kReadHR:
        LOG_TRACE << "[Client " << translator_.Address() << "] read " << request.address << "+" << request.count;
        return transport->ReadHoldingRegisters(request.address, request.count);
      case FunctionCode::kWriteMultRegs:
        LOG_TRACE << "[Client " << translator_.Address() << "] write " << request.address << "+"
                  << request.values.size();
        transport->WriteRegisters(request.address, request.values);
        return {};
      case FunctionCode::kInvalid:
        break;
    }
    throw std::invalid_argument("Unsupported function code " +
                                std::to_string(static_cast<int>(request.function_code)));
  });
}

}  // namespace asyncmb
