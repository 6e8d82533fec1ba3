#pragma once
/** @file  KeyInput.hpp
 *  @brief Non-blocking single-key reader on the controlling terminal.
 *
 *  © 2025 The ivbench authors — MIT-licensed.
 */

#include <chrono>
#include <optional>

// Linux header
#include <termios.h>
#include <unistd.h>

namespace ivbench {
  namespace io {

    /**
 * @class KeyInput
 * @brief Puts a tty into raw, no-echo mode and hands out key presses one by one.
 *
 *  * Non-blocking: `readKey()` waits at most the given timeout.
 *  * ISIG is off while open, so Ctrl-C arrives as byte 0x03 instead of a signal.
 *  * The original terminal mode is restored by `close()` / the destructor.
 *  * A non-tty fd (pipe, file) is read as-is without touching termios.
 *  * No copy, move-enabled (sole owner of the saved terminal state).
 */
    class KeyInput {
    public:
      static constexpr char kInterrupt = 0x03; ///< Ctrl-C in raw mode

      KeyInput() = default;
      virtual ~KeyInput(); ///< restores the terminal

      /** @returns false if \p fd is not readable. Does not take ownership of the fd. */
      virtual bool open(int fd = STDIN_FILENO);

      /** One key, or std::nullopt on timeout / EOF. */
      virtual std::optional<char> readKey(std::chrono::milliseconds timeout);

      virtual bool isOpen() const { return fd_ >= 0; }

      void close();

      // ─── non-copyable, move-enabled ───────────────────────────────────────────
      KeyInput(const KeyInput&) = delete;
      KeyInput& operator=(const KeyInput&) = delete;
      KeyInput(KeyInput&& other) noexcept;
      KeyInput& operator=(KeyInput&& other) noexcept;

    private:
      int fd_{ -1 };          ///< borrowed fd (-1 = closed)
      bool rawMode_{ false }; ///< true while saved_ must be restored
      termios saved_{};
    };

  } // namespace io
} // namespace ivbench
