#pragma once

#include <trantor/utils/Logger.h>
#include <exception>
#include <string>
#include <utility>
#include "../common/errors.hpp"

namespace asyncmb {

/**
 * @brief Maps transport failures onto the client's two error kinds
 *
 * | Transport failure        | Reported as         |
 * |--------------------------|---------------------|
 * | connect attempt failed   | ConnectionError     |
 * | TransportTimeoutError    | RequestTimeoutError |
 * | NotConnectedError        | RequestTimeoutError |
 * | ConnectionLostError      | RequestTimeoutError |
 * | anything else            | unchanged           |
 *
 * The original failure stays reachable through std::rethrow_if_nested.
 */
class ErrorTranslator {
 public:
  explicit ErrorTranslator(std::string address)
      : address_(std::move(address)) {}

  /**
   * @brief Run fn, translating the failures it throws
   */
  template <typename Fn>
  decltype(auto) Run(Fn &&fn) const {
    try {
      return std::forward<Fn>(fn)();
    } catch (const TransportTimeoutError &e) {
      LOG_WARN << "[Client " << address_ << "] Request timed out: " << e.what();
      std::throw_with_nested(NotConnected());
    } catch (const NotConnectedError &e) {
      LOG_WARN << "[Client " << address_ << "] Request without link: " << e.what();
      std::throw_with_nested(NotConnected());
    } catch (const ConnectionLostError &e) {
      LOG_WARN << "[Client " << address_ << "] Connection failure: " << e.what();
      std::throw_with_nested(NotConnected());
    }
  }

  /**
   * @brief Run a connect attempt; any failure becomes ConnectionError
   */
  template <typename Fn>
  void RunConnect(Fn &&fn) const {
    try {
      std::forward<Fn>(fn)();
    } catch (const std::exception &e) {
      LOG_ERROR << "[Client " << address_ << "] Connect failed: " << e.what();
      std::throw_with_nested(ConnectionFailure());
    }
  }

  [[nodiscard]] ConnectionError ConnectionFailure() const { return ConnectionError(address_); }

  [[nodiscard]] RequestTimeoutError NotConnected() const {
    return RequestTimeoutError("Not connected to '" + address_ + "'.");
  }

  [[nodiscard]] const std::string &Address() const noexcept { return address_; }

 private:
  std::string address_;
};

}  // namespace asyncmb
