/* @file SocketChannel.cpp
 * @brief TCP line channel - non-blocking connect with deadline, poll based line reads, RAII
 *
 * © 2025 The ivbench authors — MIT-licensed.
 */

// STL headers
#include <cstring> // for strerror
#include <iostream>
#include <utility>

// Linux headers
#include <errno.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

// ivbench headers
#include "io/SocketChannel.hpp"

using namespace ivbench::io;

namespace {

  int millisLeft(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
  }

  /// connect() on a non-blocking fd, bounded by the deadline
  bool connectWithDeadline(int fd, const sockaddr* addr, socklen_t len,
                           std::chrono::steady_clock::time_point deadline) {
    if (::connect(fd, addr, len) == 0)
      return true;
    if (errno != EINPROGRESS)
      return false;

    pollfd pfd{ fd, POLLOUT, 0 };
    while (true) {
      int rc = ::poll(&pfd, 1, millisLeft(deadline));
      if (rc == -1 && errno == EINTR)
        continue;
      if (rc <= 0) {
        errno = rc == 0 ? ETIMEDOUT : errno;
        return false;
      }
      break;
    }

    int soErr = 0;
    socklen_t soLen = sizeof(soErr);
    if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &soErr, &soLen) != 0)
      return false;
    if (soErr != 0) {
      errno = soErr;
      return false;
    }
    return true;
  }

} // namespace

SocketChannel::~SocketChannel() { close(); }

SocketChannel::SocketChannel(SocketChannel&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), rx_buffer_(std::move(other.rx_buffer_)) {}

SocketChannel& SocketChannel::operator=(SocketChannel&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = std::exchange(other.fd_, -1);
    rx_buffer_ = std::move(other.rx_buffer_);
  }
  return *this;
}

bool SocketChannel::open(const std::string& host, std::uint16_t port,
                         std::chrono::milliseconds timeout) {
  close();
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* res = nullptr;
  const std::string service = std::to_string(port);
  if (int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &res); rc != 0) {
    std::cerr << "getaddrinfo(" << host << "): " << gai_strerror(rc) << "\n";
    return false;
  }

  for (addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC,
                      ai->ai_protocol);
    if (fd < 0)
      continue;
    if (connectWithDeadline(fd, ai->ai_addr, ai->ai_addrlen, deadline)) {
      fd_ = fd;
      break;
    }
    std::cerr << "connect(" << host << ":" << port << "): " << strerror(errno) << "\n";
    ::close(fd);
  }
  ::freeaddrinfo(res);

  if (fd_ < 0)
    return false;

  // commands are short and latency matters more than throughput
  int one = 1;
  setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
  rx_buffer_.clear();
  return true;
}

void SocketChannel::adopt(int fd) {
  close();
  fd_ = fd;
  int flags = fcntl(fd_, F_GETFL, 0);
  if (flags >= 0)
    fcntl(fd_, F_SETFL, flags | O_NONBLOCK);
  rx_buffer_.clear();
}

bool SocketChannel::writeLine(const std::string& line) {
  if (fd_ < 0)
    return false;

  std::string out = line;
  if (!out.ends_with('\n'))
    out += '\n';

  std::size_t total = 0;
  while (total < out.size()) {
    ssize_t sent = ::send(fd_, out.data() + total, out.size() - total, MSG_NOSIGNAL);
    if (sent > 0) {
      total += sent;
    } else if (sent == -1 && errno == EINTR) {
      continue;
    } else if (sent == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      pollfd pfd{ fd_, POLLOUT, 0 };
      if (::poll(&pfd, 1, 1000) <= 0) {
        std::cerr << "Error: socket send stalled\n";
        return false;
      }
    } else {
      std::cerr << "Error: " << errno << " from send: " << strerror(errno) << "\n";
      return false;
    }
  }
  return true;
}

std::optional<std::string> SocketChannel::readLine(std::chrono::milliseconds timeout) {
  if (fd_ < 0)
    return std::nullopt;

  auto takeLine = [this]() -> std::optional<std::string> {
    auto pos = rx_buffer_.find('\n');
    if (pos == std::string::npos)
      return std::nullopt;
    std::string line = rx_buffer_.substr(0, pos);
    rx_buffer_.erase(0, pos + 1);
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    return line;
  };

  if (auto line = takeLine())
    return line;

  char temp[4096];
  pollfd pfd{ fd_, POLLIN, 0 };
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  while (std::chrono::steady_clock::now() < deadline) {
    int rc = ::poll(&pfd, 1, millisLeft(deadline));
    if (rc == -1) {
      if (errno == EINTR)
        continue;
      std::cerr << "poll: " << strerror(errno) << '\n';
      return std::nullopt;
    }
    if (rc == 0)
      break;

    ssize_t n = ::recv(fd_, temp, sizeof(temp), 0);
    if (n > 0) {
      rx_buffer_.append(temp, n);
    } else if (n == 0) { // peer closed
      close();
      return std::nullopt;
    } else if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
      continue;
    } else {
      std::cerr << "recv: " << strerror(errno) << '\n';
      return std::nullopt;
    }

    if (auto line = takeLine())
      return line;
  }
  return std::nullopt;
}

void SocketChannel::discardInput() {
  rx_buffer_.clear();
  if (fd_ < 0)
    return;

  char temp[4096];
  while (true) {
    ssize_t n = ::recv(fd_, temp, sizeof(temp), MSG_DONTWAIT);
    if (n > 0)
      continue;
    if (n == -1 && errno == EINTR)
      continue;
    if (n == 0) // peer closed while we were not looking
      close();
    return;
  }
}

void SocketChannel::close() {
  if (fd_ >= 0)
    ::close(fd_);
  fd_ = -1;
}
