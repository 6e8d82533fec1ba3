/* @file KeyInput.cpp
 * @brief raw-mode terminal key reader
 *
 * © 2025 The ivbench authors — MIT-licensed.
 */

#include <cstring>
#include <iostream>
#include <utility>

#include <errno.h>
#include <fcntl.h>
#include <poll.h>

#include "io/KeyInput.hpp"

using namespace ivbench::io;

KeyInput::~KeyInput() { close(); }

KeyInput::KeyInput(KeyInput&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), rawMode_(std::exchange(other.rawMode_, false)),
      saved_(other.saved_) {}

KeyInput& KeyInput::operator=(KeyInput&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = std::exchange(other.fd_, -1);
    rawMode_ = std::exchange(other.rawMode_, false);
    saved_ = other.saved_;
  }
  return *this;
}

bool KeyInput::open(int fd) {
  close();
  if (fcntl(fd, F_GETFL) == -1) {
    std::cerr << "KeyInput: fd " << fd << ": " << strerror(errno) << "\n";
    return false;
  }
  fd_ = fd;

  if (!isatty(fd_))
    return true; // piped input: nothing to configure

  if (tcgetattr(fd_, &saved_) != 0) {
    std::cerr << "Error " << errno << " from tcgetattr: " << strerror(errno) << "\n";
    return true; // still readable, just line-buffered
  }

  termios raw = saved_;
  raw.c_lflag &= ~(ICANON | ECHO | ISIG);
  raw.c_cc[VMIN] = 0;
  raw.c_cc[VTIME] = 0;
  if (tcsetattr(fd_, TCSANOW, &raw) != 0) {
    std::cerr << "Error " << errno << " from tcsetattr: " << strerror(errno) << "\n";
    return true;
  }
  rawMode_ = true;
  return true;
}

std::optional<char> KeyInput::readKey(std::chrono::milliseconds timeout) {
  if (fd_ < 0)
    return std::nullopt;

  pollfd pfd{ fd_, POLLIN, 0 };
  int rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
  if (rc <= 0)
    return std::nullopt; // timeout or EINTR, caller polls again

  char c = 0;
  ssize_t n = ::read(fd_, &c, 1);
  if (n == 1)
    return c;
  if (n == 0 || (pfd.revents & POLLHUP)) {
    // EOF on stdin: no more operator input this run
    close();
  }
  return std::nullopt;
}

void KeyInput::close() {
  if (rawMode_ && fd_ >= 0)
    tcsetattr(fd_, TCSANOW, &saved_);
  rawMode_ = false;
  fd_ = -1;
}
