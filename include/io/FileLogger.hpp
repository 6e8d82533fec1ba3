#pragma once
/** @file  FileLogger.hpp
 *  @brief Buffered line writer for CSV result files and event logs.
 *
 *  © 2025 The ivbench authors — MIT-licensed.
 */

#include <cstdio>
#include <string>
#include <vector>

namespace ivbench {
  namespace io {

    /**
 * @class FileLogger
 * @brief RAII wrapper that opens a file, buffers writes, and flushes on demand.
 *
 *  * Writes go out with `std::fwrite` in 4 kB chunks.
 *  * `flush()` also fflush()es so a crash after it loses nothing.
 */
    class FileLogger {
    public:
      FileLogger() = default;
      ~FileLogger(); ///< flush + fclose

      //---public API------------------------------------------------------
      /** @returns false if path cannot be opened writable. Truncates unless \p append. */
      bool open(const std::string& path, bool append = false);

      /** Queues one line (caller includes trailing '\n'). */
      void write(const std::string& line);

      /** Force-flush buffer to disk; returns true on success. */
      bool flush();

      void close();

      bool isOpen() const { return fp_ != nullptr; }
      const std::string& path() const { return path_; }

      //---non-copyable, move-enabled---------------------------------------
      FileLogger(const FileLogger&) = delete;
      FileLogger& operator=(const FileLogger&) = delete;
      FileLogger(FileLogger&& other) noexcept;
      FileLogger& operator=(FileLogger&& other) noexcept;

    private:
      static constexpr std::size_t kChunk = 4096;

      FILE* fp_{ nullptr };
      std::string path_;
      std::vector<char> buffer_;
    };

  } // namespace io
} // namespace ivbench
