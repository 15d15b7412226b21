#include <chrono>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <utility>
#include <vector>
#include "client/client.hpp"
#include "client/tcp_register_transport.hpp"

namespace asyncmb {

namespace {

std::unique_ptr<RegisterTransport> MakeTcpTransport(const ClientOptions &options) {
  return std::make_unique<TcpRegisterTransport>(ParseTarget(options.address), options.unit_id, options.timeout);
}

}  // namespace

Client::Client(std::string address, std::chrono::milliseconds timeout)
    : Client(ClientOptions{std::move(address), timeout}) {}

Client::Client(ClientOptions options)
    : Client(options, MakeTcpTransport(options)) {}

Client::Client(ClientOptions options, std::unique_ptr<RegisterTransport> transport)
    : options_(std::move(options)),
      translator_(options_.address),
      connection_(translator_, options_.timeout, std::move(transport), lock_),
      serializer_(connection_, translator_, lock_),
      chunker_(serializer_) {}

Client::~Client() {
  Close();
}

std::vector<uint16_t> Client::ReadRegisters(uint16_t address, uint16_t count) {
  return chunker_.Read(address, count);
}

void Client::WriteRegisters(uint16_t address, std::span<const uint16_t> values) {
  chunker_.Write(address, values);
}

void Client::Close() {
  connection_.Close();
}

}  // namespace asyncmb
