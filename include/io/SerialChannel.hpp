#pragma once
/** @file  SerialChannel.hpp
 *  @brief Non-blocking UART line I/O wrapper (termios + poll under the hood).
 *
 *  © 2025 The ivbench authors — MIT-licensed.
 */

#include <chrono>
#include <optional>
#include <string>
#include <utility>

// Linux header
#include <termios.h> // for speed_t types e.g., B115200

namespace ivbench {
  namespace io {

    /**
 * @class SerialChannel
 * @brief RAII wrapper around a single /dev/tty* file descriptor.
 *
 *  * Frames I/O as ASCII lines. Outgoing lines get the configured terminator,
 *    incoming lines are split on '\n' and a trailing '\r' is dropped.
 *  * *Non-copyable*, but move-constructible.
 */

    class SerialChannel {

    public:
      //---ctr / dtr--------------------------------------------
      explicit SerialChannel(std::string terminator = "\r\n") : terminator_(std::move(terminator)) {}
      virtual ~SerialChannel(); // close the /dev/tty fd at destruction

      //---public API-------------------------------------------
      virtual bool open(const std::string& dev, speed_t baud);
      virtual bool writeLine(const std::string& line); // returns false on EIO
      virtual std::optional<std::string> readLine(std::chrono::milliseconds timeout);
      virtual bool isOpen() const { return fd_ >= 0; }
      virtual void close();

      /// Discard anything already received (stale replies from a previous query).
      virtual void discardInput();

      //---non-copyable-----------------------------------------
      SerialChannel(const SerialChannel&) = delete;
      SerialChannel& operator=(const SerialChannel&) = delete;

      //---mv and mv assign-------------------------------------
      SerialChannel(SerialChannel&& other) noexcept;
      SerialChannel& operator=(SerialChannel&& other) noexcept;

    private:
      int fd_{ -1 };            ///< POSIX fd (-1==closed)
      std::string terminator_;  ///< appended by writeLine
      std::string rx_buffer_{}; ///< buffer to store readLine content
    };
  } // namespace io
} // namespace ivbench
