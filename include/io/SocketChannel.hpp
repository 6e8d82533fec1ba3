#pragma once
/** @file  SocketChannel.hpp
 *  @brief TCP line I/O wrapper for LAN instruments (SCPI raw socket, port 5025).
 *
 *  © 2025 The ivbench authors — MIT-licensed.
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace ivbench {
  namespace io {

    /**
 * @class SocketChannel
 * @brief RAII wrapper around one connected TCP socket.
 *
 *  * Lines are '\n' terminated on the wire; a trailing '\r' is dropped on read.
 *  * Same contract as SerialChannel: bool on write, std::nullopt on timeout/EOF.
 *  * Non-copyable, move-enabled.
 */
    class SocketChannel {
    public:
      SocketChannel() = default;
      virtual ~SocketChannel();

      //---public API-------------------------------------------
      /** Resolve + connect; gives up after \p timeout. */
      virtual bool open(const std::string& host, std::uint16_t port,
                        std::chrono::milliseconds timeout);
      virtual bool writeLine(const std::string& line);
      virtual std::optional<std::string> readLine(std::chrono::milliseconds timeout);
      virtual bool isOpen() const { return fd_ >= 0; }
      void close();

      /// Drop anything already received or still queued in the socket (late replies).
      void discardInput();

      /// Adopt an already connected socket (used by listeners and tests).
      void adopt(int fd);

      //---non-copyable, move-enabled---------------------------
      SocketChannel(const SocketChannel&) = delete;
      SocketChannel& operator=(const SocketChannel&) = delete;
      SocketChannel(SocketChannel&& other) noexcept;
      SocketChannel& operator=(SocketChannel&& other) noexcept;

    private:
      int fd_{ -1 };
      std::string rx_buffer_{};
    };

  } // namespace io
} // namespace ivbench
