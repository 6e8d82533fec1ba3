#pragma once
/** @file  Logger.hpp
 *  @brief Asynchronous event logger (runs its own worker thread).
 *
 *  © 2025 The ivbench authors — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

#include "core/RingBuffer.hpp"
#include "io/FileLogger.hpp"

namespace ivbench {
  namespace core {

    enum class Severity : std::uint8_t { Debug, Info, Warning, Error };

    const char* toString(Severity s);

    struct LogEvent {
      Severity severity{ Severity::Info };
      std::string source;  ///< component tag, e.g. "SweepEngine"
      std::string message;
      std::chrono::system_clock::time_point time{ std::chrono::system_clock::now() };
    };

    /**
 * @class Logger
 * @brief Console + CSV event log. `log()` never blocks on I/O while a run is active.
 *
 *  * `startNewRun()` opens the event CSV and launches the worker.
 *  * `finishRun()` drains the queue, flushes, and joins the worker.
 *  * Outside a run, events are written synchronously.
 *  * A full queue drops its oldest event; the count is reported at finishRun().
 */
    class Logger {

    public:
      explicit Logger(std::ostream& console = std::cerr, Severity consoleLevel = Severity::Info,
                      std::size_t queueCapacity = 1024);
      ~Logger(); ///< finishRun() if still running

      // --- public API ---
      /// @param eventLogPath CSV path, or empty for console only. @returns false if it cannot be opened.
      bool startNewRun(const std::string& eventLogPath);
      void log(LogEvent event); ///< enqueue event (non-blocking)
      void finishRun();         ///< flush + join worker thread

      void log(Severity severity, const std::string& source, const std::string& message) {
        log(LogEvent{ severity, source, message, std::chrono::system_clock::now() });
      }
      void debug(const std::string& source, const std::string& msg) { log(Severity::Debug, source, msg); }
      void info(const std::string& source, const std::string& msg) { log(Severity::Info, source, msg); }
      void warning(const std::string& source, const std::string& msg) { log(Severity::Warning, source, msg); }
      void error(const std::string& source, const std::string& msg) { log(Severity::Error, source, msg); }

      void setConsoleLevel(Severity level) { consoleLevel_.store(level); }
      std::size_t dropped() const;

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

    private:
      void workerLoop();
      void write(const LogEvent& event);

      std::ostream& console_;
      std::atomic<Severity> consoleLevel_;
      io::FileLogger csvFile_;
      RingBuffer<LogEvent> buffer_;
      std::size_t dropped_{ 0 };

      mutable std::mutex mtx_; ///< guards buffer_, dropped_, running_ transitions
      std::mutex writeMtx_;    ///< serialises console/file output
      std::condition_variable cv_;
      std::thread worker_;
      std::atomic<bool> running_{ false };
    };

  } // namespace core
} // namespace ivbench
