#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <span>
#include <string>
#include "transport/tcp_socket_transport.hpp"

namespace asyncmb {

namespace {

using Clock = std::chrono::steady_clock;

bool SetNonBlocking(int fd, bool enabled) {
  int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0) {
    return false;
  }
  flags = enabled ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
  return ::fcntl(fd, F_SETFL, flags) == 0;
}

int RemainingMs(Clock::time_point deadline) {
  auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
  return remaining > 0 ? static_cast<int>(remaining) : 0;
}

std::string ErrnoText(int err) {
  return std::strerror(err);
}

}  // namespace

bool TcpSocketTransport::Connect(const std::string &host, uint16_t port, std::chrono::milliseconds timeout) {
  Close();
  const auto deadline = Clock::now() + timeout;

  struct addrinfo hints {};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  struct addrinfo *results = nullptr;
  const std::string service = std::to_string(port);
  int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &results);
  if (rc != 0) {
    last_error_ = std::string("resolve failed: ") + ::gai_strerror(rc);
    return false;
  }

  last_error_ = "no usable address";
  for (struct addrinfo *ai = results; ai != nullptr; ai = ai->ai_next) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) {
      last_error_ = "socket: " + ErrnoText(errno);
      continue;
    }
    if (!SetNonBlocking(fd, true)) {
      last_error_ = "fcntl: " + ErrnoText(errno);
      ::close(fd);
      continue;
    }

    int err = 0;
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) != 0) {
      if (errno != EINPROGRESS) {
        err = errno;
      } else {
        struct pollfd pfd {};
        pfd.fd = fd;
        pfd.events = POLLOUT;
        int ready = ::poll(&pfd, 1, RemainingMs(deadline));
        if (ready == 0) {
          err = ETIMEDOUT;
        } else if (ready < 0) {
          err = errno;
        } else {
          socklen_t len = sizeof(err);
          if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) != 0) {
            err = errno;
          }
        }
      }
    }

    if (err != 0 || !SetNonBlocking(fd, false)) {
      last_error_ = "connect: " + ErrnoText(err != 0 ? err : errno);
      ::close(fd);
      if (RemainingMs(deadline) == 0) {
        break;
      }
      continue;
    }

    int nodelay = 1;
    (void)::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));
    fd_ = fd;
    last_error_.clear();
    break;
  }

  ::freeaddrinfo(results);
  return fd_ >= 0;
}

int TcpSocketTransport::Read(std::span<uint8_t> buffer) {
  if (fd_ < 0) {
    return -1;
  }
  ssize_t n = ::recv(fd_, buffer.data(), buffer.size(), MSG_DONTWAIT);
  if (n < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
      return 0;
    }
    last_error_ = "recv: " + ErrnoText(errno);
    Close();
    return -1;
  }
  if (n == 0) {
    last_error_ = "connection closed by peer";
    Close();
    return -1;
  }
  return static_cast<int>(n);
}

bool TcpSocketTransport::HasData() const {
  if (fd_ < 0) {
    return false;
  }
  struct pollfd pfd {};
  pfd.fd = fd_;
  pfd.events = POLLIN;
  // POLLHUP/POLLERR count as data so the following Read() reports the failure
  return ::poll(&pfd, 1, 0) > 0;
}

size_t TcpSocketTransport::AvailableBytes() const {
  if (fd_ < 0) {
    return 0;
  }
  int n = 0;
  if (::ioctl(fd_, FIONREAD, &n) == 0 && n > 0) {
    return static_cast<size_t>(n);
  }
  return 0;
}

int TcpSocketTransport::Write(std::span<const uint8_t> data) {
  if (fd_ < 0) {
    return -1;
  }
  size_t sent = 0;
  while (sent < data.size()) {
    ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      last_error_ = "send: " + ErrnoText(errno);
      Close();
      return -1;
    }
    sent += static_cast<size_t>(n);
  }
  return static_cast<int>(sent);
}

bool TcpSocketTransport::Flush() {
  return fd_ >= 0;  // TCP stream has no application-level flush
}

void TcpSocketTransport::Close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

}  // namespace asyncmb
