#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace asyncmb {

static constexpr uint16_t kDefaultModbusTcpPort = 502;
static constexpr std::chrono::milliseconds kDefaultTimeout{1000};

/**
 * @brief Host and port of a Modbus TCP device
 */
struct Target {
  std::string host;
  uint16_t port{kDefaultModbusTcpPort};
};

/**
 * @brief Connection options for a Client
 */
struct ClientOptions {
  /** Device address, "host" or "host:port" */
  std::string address;
  /** Bounds the connect attempt; also used by the TCP transport as the per-response timeout. */
  std::chrono::milliseconds timeout{kDefaultTimeout};
  /** Unit identifier placed in the MBAP header */
  uint8_t unit_id{1};
};

/**
 * @brief Split "host[:port]" into host and port
 *
 * IPv6 literals take a port only in brackets ("[fe80::1]:1502"); an address
 * with several ':' and no brackets is a bare IPv6 host on the default port.
 *
 * @throws std::invalid_argument if the host is empty or the port is not in 1..65535
 */
[[nodiscard]] Target ParseTarget(std::string_view address);

/**
 * @brief Parse a register address or count given as decimal text
 * @throws std::invalid_argument unless text is a whole number in 0..65535
 */
[[nodiscard]] uint16_t ParseRegisterNumber(std::string_view text);

}  // namespace asyncmb
