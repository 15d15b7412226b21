#pragma once

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <string_view>
#include "error_translator.hpp"
#include "register_transport.hpp"

namespace asyncmb {

enum class ConnectionState {
  kUnconnected,
  kConnecting,
  kConnected,
  kFailed,
  kClosed
};

[[nodiscard]] std::string_view ToString(ConnectionState state);

/**
 * @brief Owns the transport and its one connect attempt
 *
 * The attempt starts on a background task as soon as the manager is built, so
 * construction never blocks. It holds the request lock while connecting. The
 * deadline is construction time plus the timeout: nobody waits for the
 * attempt past it, and an attempt still running then is abandoned and counts
 * as failed. It resolves exactly once; a failure is kept and rethrown to every
 * later WaitConnected() call without reconnecting.
 */
class ConnectionManager {
 public:
  /**
   * @param translator Error translator carrying the target address
   * @param timeout Deadline for the connect attempt
   * @param transport Transport to connect (ownership taken)
   * @param lock Request lock, held for the duration of the attempt
   */
  ConnectionManager(const ErrorTranslator &translator, std::chrono::milliseconds timeout,
                    std::unique_ptr<RegisterTransport> transport, std::mutex &lock);

  /**
   * Closes the transport. Unlike Close(), waits for an abandoned attempt to
   * return, since the attempt runs on this object.
   */
  ~ConnectionManager();

  ConnectionManager(const ConnectionManager &) = delete;
  ConnectionManager &operator=(const ConnectionManager &) = delete;

  /**
   * @brief Block until the connect attempt has resolved, at most until the deadline
   * @throws ConnectionError if it failed or did not finish in time, on every call
   */
  void WaitConnected();

  /**
   * @brief Close the transport; safe to call any number of times, in any state
   *
   * Waits for a pending attempt no longer than the deadline. An attempt still
   * running then is abandoned and closes the transport itself when it returns.
   */
  void Close();

  /**
   * @brief Transport handle, or nullptr unless connected
   *
   * Only meaningful while holding the request lock.
   */
  [[nodiscard]] RegisterTransport *Transport() noexcept;

  [[nodiscard]] ConnectionState State() const noexcept { return state_.load(); }

 private:
  void Connect();

  /**
   * @brief Give up on an attempt still running past the deadline
   * @param next State to report from now on (kFailed or kClosed)
   * @return false if the attempt has already succeeded
   */
  bool Abandon(ConnectionState next);

  /** Close the transport unless that already happened. Takes the lock. */
  bool ReleaseTransport();

  const ErrorTranslator &translator_;
  std::chrono::milliseconds timeout_;
  std::chrono::steady_clock::time_point deadline_;
  std::unique_ptr<RegisterTransport> transport_;
  std::mutex &lock_;
  std::atomic<ConnectionState> state_{ConnectionState::kUnconnected};
  bool closed_{false};  // guarded by lock_
  std::shared_future<void> connect_task_;
};

}  // namespace asyncmb
