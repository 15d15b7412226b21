#include <algorithm>
#include <charconv>
#include <stdexcept>
#include <string>
#include <string_view>
#include "common/client_options.hpp"

namespace asyncmb {

namespace {

uint16_t ParsePort(std::string_view port_text, std::string_view address) {
  unsigned int port = 0;
  auto [end, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
  if (ec != std::errc{} || end != port_text.data() + port_text.size() || port == 0 || port > 0xFFFF) {
    throw std::invalid_argument("Invalid port in address '" + std::string(address) + "'");
  }
  return static_cast<uint16_t>(port);
}

}  // namespace

uint16_t ParseRegisterNumber(std::string_view text) {
  unsigned int value = 0;
  auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (text.empty() || ec != std::errc{} || end != text.data() + text.size() || value > 0xFFFF) {
    throw std::invalid_argument("Not a register number (0..65535): '" + std::string(text) + "'");
  }
  return static_cast<uint16_t>(value);
}

Target ParseTarget(std::string_view address) {
  Target target;
  std::string_view host = address;

  if (!address.empty() && address.front() == '[') {
    // "[v6]" or "[v6]:port"
    size_t close = address.find(']');
    if (close == std::string_view::npos) {
      throw std::invalid_argument("Unterminated '[' in address '" + std::string(address) + "'");
    }
    host = address.substr(1, close - 1);
    std::string_view rest = address.substr(close + 1);
    if (!rest.empty()) {
      if (rest.front() != ':') {
        throw std::invalid_argument("Unexpected text after ']' in address '" + std::string(address) + "'");
      }
      target.port = ParsePort(rest.substr(1), address);
    }
  } else if (std::count(address.begin(), address.end(), ':') == 1) {
    // More than one ':' without brackets is a bare IPv6 literal, all host
    size_t colon = address.find(':');
    host = address.substr(0, colon);
    target.port = ParsePort(address.substr(colon + 1), address);
  }

  if (host.empty()) {
    throw std::invalid_argument("Missing host in address '" + std::string(address) + "'");
  }
  target.host = std::string(host);
  return target;
}

}  // namespace asyncmb
