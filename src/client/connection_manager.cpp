#include <trantor/utils/Logger.h>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include "client/connection_manager.hpp"
#include "common/errors.hpp"

namespace asyncmb {

std::string_view ToString(ConnectionState state) {
  switch (state) {
    case ConnectionState::kUnconnected:
      return "unconnected";
    case ConnectionState::kConnecting:
      return "connecting";
    case ConnectionState::kConnected:
      return "connected";
    case ConnectionState::kFailed:
      return "failed";
    case ConnectionState::kClosed:
      return "closed";
  }
  return "unknown";
}

ConnectionManager::ConnectionManager(const ErrorTranslator &translator, std::chrono::milliseconds timeout,
                                     std::unique_ptr<RegisterTransport> transport, std::mutex &lock)
    : translator_(translator),
      timeout_(timeout),
      deadline_(std::chrono::steady_clock::now() + timeout),
      transport_(std::move(transport)),
      lock_(lock) {
  state_ = ConnectionState::kConnecting;
  // Last: the task uses every member above
  connect_task_ = std::async(std::launch::async, [this] { Connect(); }).share();
}

ConnectionManager::~ConnectionManager() {
  Close();
  connect_task_.wait();
  ReleaseTransport();
}

void ConnectionManager::Connect() {
  std::lock_guard<std::mutex> guard(lock_);
  LOG_DEBUG << "[Client " << translator_.Address() << "] Connecting, timeout " << timeout_.count() << "ms";

  try {
    translator_.RunConnect([this] {
      if (!transport_) {
        throw NotConnectedError("No transport");
      }
      transport_->Connect(timeout_);
      auto expected = ConnectionState::kConnecting;
      if (std::chrono::steady_clock::now() > deadline_ ||
          !state_.compare_exchange_strong(expected, ConnectionState::kConnected)) {
        // Too late; waiters have already been told the attempt failed
        transport_->Close();
        closed_ = true;
        throw TransportTimeoutError("Connect exceeded " + std::to_string(timeout_.count()) + "ms");
      }
    });
  } catch (const ConnectionError &) {
    auto expected = ConnectionState::kConnecting;
    state_.compare_exchange_strong(expected, ConnectionState::kFailed);
    throw;
  }

  LOG_INFO << "[Client " << translator_.Address() << "] Connected";
}

void ConnectionManager::WaitConnected() {
  if (connect_task_.wait_until(deadline_) == std::future_status::timeout && Abandon(ConnectionState::kFailed)) {
    translator_.RunConnect([this] {
      throw TransportTimeoutError("Connect did not finish within " + std::to_string(timeout_.count()) + "ms");
    });
  }
  connect_task_.get();
}

bool ConnectionManager::Abandon(ConnectionState next) {
  ConnectionState current = state_.load();
  while (current != ConnectionState::kConnected) {
    if (current == next || current == ConnectionState::kClosed) {
      return true;
    }
    if (state_.compare_exchange_weak(current, next)) {
      LOG_WARN << "[Client " << translator_.Address() << "] Connect attempt still running after "
               << timeout_.count() << "ms, abandoned";
      return true;
    }
  }
  return false;
}

void ConnectionManager::Close() {
  if (connect_task_.wait_until(deadline_) == std::future_status::timeout && Abandon(ConnectionState::kClosed)) {
    return;
  }
  connect_task_.wait();

  if (ReleaseTransport()) {
    LOG_DEBUG << "[Client " << translator_.Address() << "] Closed";
  }
  state_ = ConnectionState::kClosed;
}

bool ConnectionManager::ReleaseTransport() {
  std::lock_guard<std::mutex> guard(lock_);
  if (closed_) {
    return false;
  }
  closed_ = true;
  if (transport_) {
    transport_->Close();
  }
  return true;
}

RegisterTransport *ConnectionManager::Transport() noexcept {
  if (state_.load() != ConnectionState::kConnected) {
    return nullptr;
  }
  return transport_.get();
}

}  // namespace asyncmb
