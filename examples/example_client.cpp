/**
 * @file example_client.cpp
 * @brief Example Modbus TCP client
 *
 * Reads a block of holding registers from a device, writes the first few of
 * them back, and prints what happened. The read may be longer than one
 * Modbus message; the client splits it.
 *
 * Usage: example_client <host[:port]> [start_address] [count]
 */

#include <trantor/utils/Logger.h>
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <iostream>
#include <string>
#include <vector>
#include "async_modbus/client/client.hpp"
#include "async_modbus/common/client_options.hpp"
#include "async_modbus/common/errors.hpp"

namespace {

void PrintUsage(const char *program) {
  std::cerr << "Usage: " << program << " <host[:port]> [start_address] [count]\n"
            << "  start_address and count are register numbers, 0..65535\n";
}

}  // namespace

int main(int argc, char *argv[]) {
  if (argc < 2) {
    PrintUsage(argv[0]);
    return EXIT_FAILURE;
  }

  uint16_t start = 0;
  uint16_t count = 10;
  try {
    start = argc > 2 ? asyncmb::ParseRegisterNumber(argv[2]) : start;
    count = argc > 3 ? asyncmb::ParseRegisterNumber(argv[3]) : count;
  } catch (const std::invalid_argument &e) {
    std::cerr << e.what() << "\n";
    PrintUsage(argv[0]);
    return EXIT_FAILURE;
  }

  trantor::Logger::setLogLevel(trantor::Logger::kDebug);

  const std::string address = argv[1];

  try {
    asyncmb::Client client(address, std::chrono::seconds(1));

    std::cout << "Reading " << count << " holding registers from " << address << " at " << start << "...\n";
    auto registers = client.ReadRegisters(start, count);
    for (size_t i = 0; i < registers.size(); ++i) {
      std::cout << "  Register[" << (start + i) << "] = " << registers[i] << "\n";
    }

    std::vector<uint16_t> echo(registers.begin(), registers.begin() + std::min<size_t>(registers.size(), 4));
    if (!echo.empty()) {
      client.WriteRegisters(start, echo);
      std::cout << "Wrote " << echo.size() << " registers back\n";
    }
  } catch (const asyncmb::ConnectionError &e) {
    std::cerr << e.what() << "\n";
    return EXIT_FAILURE;
  } catch (const asyncmb::RequestTimeoutError &e) {
    std::cerr << e.what() << "\n";
    return EXIT_FAILURE;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
